#pragma once

#include "batch_source.h"
#include "calling/alignment_source.h"
#include "calling/options.h"
#include "calling/vcf_writer.h"
#include "classifier.h"

#include <cstdint>

namespace clarion::pipeline {

struct SiteCallerStats {
    int64_t num_sites = 0;
    int64_t num_records = 0;
    int64_t num_reference_dropped = 0;
    int64_t num_skipped = 0;
};

/**
 * \brief Decodes classified batches into records: scores the hypotheses of every site,
 *          composes the winning call and writes it out (or, in debug mode, a trace line).
 *          Batches are decoded one at a time, in the order they are given.
 */
class SiteCaller {
public:
    SiteCaller(calling::VcfWriter& writer,
               const calling::AlignmentSource& source,
               const calling::CallerOptions& options);

    /**
     * \brief Decodes one batch.
     *          Throws if the batch and the classifier output disagree on the number of sites.
     */
    SiteCallerStats call_batch(const InputBatch& batch, const ClassifierOutput& output);

    const SiteCallerStats& total_stats() const { return m_total; }

private:
    calling::VcfWriter& m_writer;
    const calling::AlignmentSource& m_source;
    calling::CallerOptions m_options;
    SiteCallerStats m_total;
};

}  // namespace clarion::pipeline
