#pragma once

#include "base_change.h"
#include "constants.h"

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace clarion::calling {

/// Categories of read evidence recorded for each position and nucleotide channel.
enum class EvidenceCategory : int32_t {
    REFERENCE = 0,
    INSERT = 1,
    DELETE = 2,
    SNP = 3,
};

constexpr int32_t NUM_EVIDENCE_CATEGORIES = 4;

/**
 * \brief Read support around a candidate site.
 *          Dimensions: [WINDOW_LEN x NUM_NUCLEOTIDE_CHANNELS x NUM_EVIDENCE_CATEGORIES], row-major.
 *          Position FLANK is the candidate site.
 */
class EvidenceTensor {
public:
    static constexpr int64_t NUM_VALUES =
            static_cast<int64_t>(WINDOW_LEN) * NUM_NUCLEOTIDE_CHANNELS * NUM_EVIDENCE_CATEGORIES;

    /// Zero-initialised tensor.
    EvidenceTensor();

    /// Copies NUM_VALUES floats in [position][channel][category] order.
    explicit EvidenceTensor(const float* data);

    float at(int32_t pos, int32_t channel, EvidenceCategory category) const {
        return m_data[index(pos, channel, category)];
    }

    float& at(int32_t pos, int32_t channel, EvidenceCategory category) {
        return m_data[index(pos, channel, category)];
    }

    /// Sum over all nucleotide channels of one category at a position.
    float category_sum(int32_t pos, EvidenceCategory category) const;

    /// Per-base (ACGT) support with the forward and reverse strand channels added together.
    std::array<float, NUM_BASES> strand_merged(int32_t pos, EvidenceCategory category) const;

    const std::vector<float>& data() const { return m_data; }

private:
    static int64_t index(int32_t pos, int32_t channel, EvidenceCategory category) {
        return (static_cast<int64_t>(pos) * NUM_NUCLEOTIDE_CHANNELS + channel) *
                       NUM_EVIDENCE_CATEGORIES +
               static_cast<int32_t>(category);
    }

    std::vector<float> m_data;
};

/// Identity of a candidate site, parsed from a "chromosome:position:referenceWindow" descriptor.
struct SiteLocus {
    std::string contig;
    int64_t position = -1;  // Zero-based.
    std::string reference_window;
};

/**
 * \brief Parses a site descriptor. The position in the descriptor is one-based.
 *          The contig name may itself contain ':' characters.
 *          Throws if the descriptor is malformed or the window is not WINDOW_LEN wide.
 */
SiteLocus parse_site_descriptor(std::string_view descriptor);

struct Site {
    SiteLocus locus;
    EvidenceTensor evidence;

    char reference_base() const { return locus.reference_window[FLANK]; }
};

/**
 * \brief Classifier output for one site. Values are used exactly as given, never renormalised.
 */
struct ProbabilityBundle {
    std::array<float, NUM_BASE_CHANGES> base_change{};
    std::array<float, NUM_GENOTYPES> genotype{};
    std::array<float, NUM_INDEL_LEN_CLASSES> indel_length_1{};
    std::array<float, NUM_INDEL_LEN_CLASSES> indel_length_2{};

    float operator[](BaseChange bc) const { return base_change[to_index(bc)]; }
    float operator[](Genotype gt) const { return genotype[to_index(gt)]; }
};

using IndelLengthProbs = std::array<float, NUM_INDEL_LEN_CLASSES>;

/// Probability of a signed indel length: positive for insertions, negative for deletions.
inline float length_prob(const IndelLengthProbs& probs, const int32_t signed_len) {
    return probs[signed_len + INDEL_LEN_ZERO_OFFSET];
}

std::ostream& operator<<(std::ostream& os, const SiteLocus& locus);

}  // namespace clarion::calling
