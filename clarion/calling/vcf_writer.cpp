#include "vcf_writer.h"

#include "utils/string_utils.h"

#include <spdlog/spdlog.h>

#include <ostream>
#include <stdexcept>

namespace clarion::calling {

namespace {

template <typename T>
std::string format_probabilities(const T& values) {
    std::string ret{"["};
    for (size_t i = 0; i < std::size(values); ++i) {
        if (i > 0) {
            ret += ", ";
        }
        ret += fmt::format("'{:0.8f}'", values[i]);
    }
    ret += ']';
    return ret;
}

}  // namespace

VcfWriter::VcfWriter(std::ostream& os,
                     const std::vector<std::pair<std::string, int64_t>>& contigs,
                     const std::string& sample_name)
        : m_os{os} {
    m_os << "##fileformat=VCFv4.1\n";
    m_os << "##FILTER=<ID=PASS,Description=\"All filters passed\">\n";
    m_os << "##FILTER=<ID=LowQual,Description=\"Confidence in this variant being real is below "
            "calling threshold.\">\n";
    m_os << "##ALT=<ID=DEL,Description=\"Deletion\">\n";
    m_os << "##ALT=<ID=INS,Description=\"Insertion of novel sequence\">\n";
    m_os << "##INFO=<ID=SVTYPE,Number=1,Type=String,Description=\"Type of structural "
            "variant\">\n";
    m_os << "##INFO=<ID=LENGUESS,Number=.,Type=Integer,Description=\"Best guess of the indel "
            "length\">\n";
    m_os << "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n";
    m_os << "##FORMAT=<ID=GQ,Number=1,Type=Integer,Description=\"Genotype Quality\">\n";
    m_os << "##FORMAT=<ID=DP,Number=1,Type=Integer,Description=\"Read Depth\">\n";
    m_os << "##FORMAT=<ID=AF,Number=1,Type=Float,Description=\"Estimated allele frequency in "
            "the range (0,1)\">\n";

    for (const auto& [name, length] : contigs) {
        m_os << "##contig=<ID=" << name << ",length=" << length << ">\n";
    }

    m_os << "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\t" << sample_name << '\n';

    if (!m_os) {
        throw std::runtime_error("Failed to write VCF header.");
    }
}

std::string format_vcf_line(const VariantRecord& record) {
    const std::string info = std::empty(record.info) ? "." : utils::join(record.info, ";");
    return fmt::format("{}\t{}\t.\t{}\t{}\t{}\t{}\t{}\tGT:GQ:DP:AF\t{}:{}:{}:{:.4f}",
                       record.contig, record.position + 1, record.ref,
                       utils::join(record.alts, ","), record.quality, record.filter, info,
                       record.genotype, record.quality, record.depth, record.allele_frequency);
}

void VcfWriter::write_record(const VariantRecord& record) {
    m_os << format_vcf_line(record) << '\n';
    if (!m_os) {
        throw std::runtime_error("Failed to write VCF record.");
    }
}

void VcfWriter::write_debug_trace(const SiteLocus& locus,
                                  const ProbabilityBundle& probs,
                                  const std::string_view message) {
    m_os << fmt::format("{}\t{}\t{}\t{}\t{}\t{}\t{}\n", locus.contig, locus.position + 1,
                        format_probabilities(probs.base_change),
                        format_probabilities(probs.genotype),
                        format_probabilities(probs.indel_length_1),
                        format_probabilities(probs.indel_length_2), message);
    if (!m_os) {
        throw std::runtime_error("Failed to write the debug trace.");
    }
}

void VcfWriter::flush() { m_os.flush(); }

}  // namespace clarion::calling
