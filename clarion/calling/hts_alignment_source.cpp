#include "hts_alignment_source.h"

#include "constants.h"

#include <htslib/sam.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace clarion::calling {

namespace {

struct PileupReadData {
    htsFile* fp = nullptr;
    sam_hdr_t* hdr = nullptr;
    hts_itr_t* iter = nullptr;
};

/// Feeds the pileup engine, skipping the alignments excluded by PILEUP_FLAG_FILTER.
int32_t pileup_read_bam(void* data, bam1_t* b) {
    PileupReadData* aux = reinterpret_cast<PileupReadData*>(data);

    int32_t ret = 0;
    while (true) {
        ret = aux->iter ? sam_itr_next(aux->fp, aux->iter, b) : sam_read1(aux->fp, aux->hdr, b);
        if (ret < 0) {
            break;
        }
        if (b->core.flag & PILEUP_FLAG_FILTER) {
            continue;
        }
        break;
    }
    return ret;
}

struct MplpDestructor {
    void operator()(bam_mplp_t mplp) { bam_mplp_destroy(mplp); }
};
using MplpPtr = std::unique_ptr<std::remove_pointer_t<bam_mplp_t>, MplpDestructor>;

/// Builds the pileup string of one read: the base (lower case on the reverse strand)
/// followed by the indel marker starting right after this column, if any.
std::string make_signature(const bam_pileup1_t* p) {
    const bool is_rev = bam_is_rev(p->b);
    const auto strand_case = [is_rev](const char c) {
        return is_rev ? static_cast<char>(std::tolower(static_cast<unsigned char>(c))) : c;
    };

    std::string ret;
    if (p->is_del || p->is_refskip) {
        ret += '*';
    } else {
        const uint8_t* seq = bam_get_seq(p->b);
        ret += strand_case(seq_nt16_str[bam_seqi(seq, p->qpos)]);
    }

    if (p->indel > 0) {
        const uint8_t* seq = bam_get_seq(p->b);
        ret += '+';
        ret += std::to_string(p->indel);
        for (int32_t i = 1; i <= p->indel; ++i) {
            ret += strand_case(seq_nt16_str[bam_seqi(seq, p->qpos + i)]);
        }
    } else if (p->indel < 0) {
        ret += '-';
        ret += std::to_string(-p->indel);
        ret += std::string(-p->indel, strand_case('N'));
    }

    return ret;
}

}  // namespace

HtsAlignmentSource::HtsAlignmentSource(const std::filesystem::path& bam_fn,
                                       const std::filesystem::path& ref_fn,
                                       const int32_t max_depth)
        : m_max_depth{max_depth} {
    if (!std::empty(bam_fn)) {
        m_bam = std::make_unique<hts_io::BamFile>(bam_fn);
    }
    if (!std::empty(ref_fn)) {
        m_fasta = std::make_unique<hts_io::FastaRegionReader>(ref_fn);
    }
}

std::vector<std::string> HtsAlignmentSource::pileup_signatures(const std::string& contig,
                                                               const int64_t start,
                                                               const int64_t end) const {
    if (!m_bam || (start < 0) || (end <= start)) {
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mtx);

    try {
        return pileup_signatures_impl(contig, start, end);
    } catch (const std::exception& e) {
        spdlog::warn("Could not compute the pileup of region {}:{}-{}. Exception: {}", contig,
                     start, end, e.what());
    }
    return {};
}

std::vector<std::string> HtsAlignmentSource::pileup_signatures_impl(const std::string& contig,
                                                                    const int64_t start,
                                                                    const int64_t end) const {
    const int32_t seq_id = m_bam->seq_id(contig);
    if (seq_id < 0) {
        throw std::runtime_error("Sequence '" + contig + "' not found in the BAM header.");
    }

    // Only used in messages. Contig names may contain ':' so the query goes by ID.
    const std::string region = contig + ':' + std::to_string(start + 1) + '-' + std::to_string(end);

    PileupReadData data;
    data.fp = m_bam->fp();
    data.hdr = m_bam->hdr();
    HtsItrPtr iter(sam_itr_queryi(m_bam->idx(), seq_id, start, end));
    if (!iter) {
        throw std::runtime_error("Could not create an iterator for region: " + region);
    }
    data.iter = iter.get();

    PileupReadData* raw_data_ptr = &data;
    MplpPtr mplp(bam_mplp_init(1, pileup_read_bam, reinterpret_cast<void**>(&raw_data_ptr)));
    if (!mplp) {
        throw std::runtime_error("Could not initialise the pileup for region: " + region);
    }
    bam_mplp_set_maxcnt(mplp.get(), m_max_depth);

    std::vector<std::string> ret;

    std::array<const bam_pileup1_t*, 1> plp{};
    int32_t tid = 0;
    hts_pos_t pos = 0;
    int32_t n_plp = 0;
    int32_t status = 0;

    while ((status = bam_mplp64_auto(mplp.get(), &tid, &pos, &n_plp, std::data(plp))) > 0) {
        if (tid != seq_id) {
            continue;
        }
        if (pos < start) {
            continue;
        }
        if (pos >= end) {
            break;
        }
        for (int32_t i = 0; i < n_plp; ++i) {
            ret.emplace_back(make_signature(plp[0] + i));
        }
    }

    if (status < 0) {
        throw std::runtime_error("Failed to iterate the pileup of region: " + region);
    }

    return ret;
}

std::string HtsAlignmentSource::fetch_reference(const std::string& contig,
                                                const int64_t start,
                                                const int64_t end) const {
    if (!m_fasta || (start < 0) || (end <= start)) {
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mtx);

    try {
        return m_fasta->fetch_region(contig, start, end);
    } catch (const std::exception& e) {
        spdlog::warn("Could not fetch the reference region {}:{}-{}. Exception: {}", contig, start,
                     end, e.what());
    }
    return {};
}

}  // namespace clarion::calling
