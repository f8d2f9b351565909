#include "BamFile.h"

#include <htslib/sam.h>

#include <stdexcept>
#include <string>

namespace clarion::hts_io {

BamFile::BamFile(const std::filesystem::path& in_fn)
        : m_fp{hts_open(in_fn.string().c_str(), "rb"), HtsFileDestructor()},
          m_idx{nullptr, HtsIdxDestructor()},
          m_hdr{nullptr, SamHdrDestructor()} {
    if (!m_fp) {
        throw std::runtime_error{"Could not open BAM file: '" + in_fn.string() + "'!"};
    }

    m_idx.reset(sam_index_load(m_fp.get(), in_fn.string().c_str()));
    if (!m_idx) {
        throw std::runtime_error{"Could not open index for BAM file: '" + in_fn.string() + "'!"};
    }

    m_hdr.reset(sam_hdr_read(m_fp.get()));
    if (!m_hdr) {
        throw std::runtime_error{"Could not load header from BAM file: '" + in_fn.string() + "'!"};
    }
}

int32_t BamFile::seq_id(const std::string& seq_name) const {
    return sam_hdr_name2tid(m_hdr.get(), seq_name.c_str());
}

}  // namespace clarion::hts_io
