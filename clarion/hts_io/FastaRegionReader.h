#pragma once

#include "utils/types.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace clarion::hts_io {

// Class to wrap reading random regions from an indexed FASTA
// file via the htslib APIs.
class FastaRegionReader {
public:
    FastaRegionReader(const std::filesystem::path& fasta_path);
    ~FastaRegionReader() = default;

    /**
     * \brief Fetches the upper-case reference bases in the zero-based, half-open
     *          range [start, end) of the given sequence.
     *          Throws if the sequence is unknown or the range cannot be fetched.
     */
    std::string fetch_region(const std::string& seq_name, int64_t start, int64_t end) const;

    bool has_seq(const std::string& seq_name) const;

private:
    FaidxPtr m_faidx{nullptr};
};

}  // namespace clarion::hts_io
