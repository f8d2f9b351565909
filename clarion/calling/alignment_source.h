#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clarion::calling {

/**
 * \brief Read-only access to the aligned reads and the reference sequence, used to recover
 *          indel bases which the evidence window cannot resolve.
 *          Implementations never throw on lookups: failures yield empty results.
 */
class AlignmentSource {
public:
    virtual ~AlignmentSource() = default;

    /**
     * \brief Pileup strings of every read covering the columns in the zero-based,
     *          half-open range [start, end). Each string is the read base followed by an
     *          optional indel marker: "+<len><inserted bases>" or "-<len><N...>".
     */
    virtual std::vector<std::string> pileup_signatures(const std::string& contig,
                                                       int64_t start,
                                                       int64_t end) const = 0;

    /// Reference bases in [start, end), or an empty string if unavailable.
    virtual std::string fetch_reference(const std::string& contig,
                                        int64_t start,
                                        int64_t end) const = 0;
};

/// Source without any alignments or reference, for runs where neither is provided.
class EmptyAlignmentSource : public AlignmentSource {
public:
    std::vector<std::string> pileup_signatures(const std::string& contig,
                                               int64_t start,
                                               int64_t end) const override;

    std::string fetch_reference(const std::string& contig,
                                int64_t start,
                                int64_t end) const override;
};

enum class IndelType {
    INSERTION,
    DELETION,
};

struct IndelSignature {
    IndelType type = IndelType::INSERTION;
    int32_t length = 0;
    std::string bases;  // Upper-case bases following the length digits.
};

/**
 * \brief Parses the indel marker of a pileup string, e.g. "A+3CGT" or "c-2NN".
 *          Returns nullopt if the string carries no indel, the run length is missing or
 *          does not fit into an int32_t, or no bases follow the run length.
 */
std::optional<IndelSignature> parse_indel_signature(std::string_view signature);

}  // namespace clarion::calling
