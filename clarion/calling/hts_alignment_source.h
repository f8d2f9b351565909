#pragma once

#include "alignment_source.h"
#include "hts_io/BamFile.h"
#include "hts_io/FastaRegionReader.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clarion::calling {

/**
 * \brief Alignment source backed by an indexed BAM file and an indexed FASTA reference.
 *          Either of the two can be omitted by passing an empty path; the corresponding
 *          lookups then return empty results.
 *          Lookups are serialised because htslib file handles are not thread safe.
 */
class HtsAlignmentSource : public AlignmentSource {
public:
    HtsAlignmentSource(const std::filesystem::path& bam_fn,
                       const std::filesystem::path& ref_fn,
                       int32_t max_depth);

    std::vector<std::string> pileup_signatures(const std::string& contig,
                                               int64_t start,
                                               int64_t end) const override;

    std::string fetch_reference(const std::string& contig,
                                int64_t start,
                                int64_t end) const override;

private:
    std::vector<std::string> pileup_signatures_impl(const std::string& contig,
                                                    int64_t start,
                                                    int64_t end) const;

    std::unique_ptr<hts_io::BamFile> m_bam;
    std::unique_ptr<hts_io::FastaRegionReader> m_fasta;
    int32_t m_max_depth = 0;
    mutable std::mutex m_mtx;
};

}  // namespace clarion::calling
