#pragma once

#include "site.h"
#include "variant_record.h"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clarion::calling {

/**
 * \brief Writes called sites as VCF text to a stream.
 *          The header is written on construction. The stream must outlive the writer.
 */
class VcfWriter {
public:
    /**
     * \param os Output stream.
     * \param contigs Name/length pairs of all reference sequences, written as ##contig lines.
     * \param sample_name Name of the single sample column.
     */
    VcfWriter(std::ostream& os,
              const std::vector<std::pair<std::string, int64_t>>& contigs,
              const std::string& sample_name);

    void write_record(const VariantRecord& record);

    /// Probability trace of a site, written in debug mode instead of a record.
    void write_debug_trace(const SiteLocus& locus,
                           const ProbabilityBundle& probs,
                           std::string_view message);

    void flush();

private:
    std::ostream& m_os;
};

/// Formats a record as a single VCF data line, without the trailing newline.
std::string format_vcf_line(const VariantRecord& record);

}  // namespace clarion::calling
