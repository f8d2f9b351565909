#include "FastaRegionReader.h"

#include "utils/string_utils.h"

#include <htslib/faidx.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>

namespace {
struct CharDestructor {
    void operator()(char* ptr) { hts_free(ptr); };
};
using CharPtr = std::unique_ptr<char, CharDestructor>;
}  // namespace

namespace clarion::hts_io {

FastaRegionReader::FastaRegionReader(const std::filesystem::path& fasta_path) {
    faidx_t* faidx_ptr = fai_load_format(fasta_path.string().c_str(), FAI_FASTA);

    if (!faidx_ptr) {
        throw std::runtime_error{"Could not create/load index for FASTA file: '" +
                                 fasta_path.string() + "'!"};
    }

    m_faidx.reset(faidx_ptr);
}

std::string FastaRegionReader::fetch_region(const std::string& seq_name,
                                            const int64_t start,
                                            const int64_t end) const {
    if ((start < 0) || (end <= start)) {
        throw std::runtime_error{"Invalid region for sequence '" + seq_name +
                                 "': start = " + std::to_string(start) +
                                 ", end = " + std::to_string(end)};
    }
    if (!has_seq(seq_name)) {
        throw std::runtime_error{"Sequence '" + seq_name + "' not found in the FASTA index."};
    }

    // The htslib end coordinate is inclusive.
    hts_pos_t len = 0;
    CharPtr seq(faidx_fetch_seq64(m_faidx.get(), seq_name.c_str(), start, end - 1, &len));
    if (!seq || (len < 0)) {
        throw std::runtime_error{"Could not fetch region " + seq_name + ":" +
                                 std::to_string(start) + "-" + std::to_string(end)};
    }

    return utils::to_uppercase(std::string(seq.get(), seq.get() + len));
}

bool FastaRegionReader::has_seq(const std::string& seq_name) const {
    return faidx_has_seq(m_faidx.get(), seq_name.c_str()) != 0;
}

}  // namespace clarion::hts_io
