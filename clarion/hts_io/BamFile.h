#pragma once

#include "utils/types.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace clarion::hts_io {

/// Indexed BAM file opened for random access.
class BamFile {
public:
    BamFile(const std::filesystem::path& in_fn);

    // Getters.
    htsFile* fp() const { return m_fp.get(); }
    hts_idx_t* idx() const { return m_idx.get(); }
    sam_hdr_t* hdr() const { return m_hdr.get(); }

    /**
     * \brief Returns the numeric ID of a reference sequence in the BAM header,
     *          or a negative value if it is not present.
     */
    int32_t seq_id(const std::string& seq_name) const;

private:
    HtsFilePtr m_fp;
    HtsIdxPtr m_idx;
    SamHdrPtr m_hdr;
};

}  // namespace clarion::hts_io
