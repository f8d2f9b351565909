#pragma once

#include "alignment_source.h"
#include "hypothesis_scorer.h"
#include "options.h"
#include "site.h"
#include "variant_record.h"

#include <optional>
#include <string>

namespace clarion::calling {

/// Outcome of composing a site: a record, or the reason why the site was skipped.
struct ComposeResult {
    std::optional<VariantRecord> record;
    std::string skip_reason;

    // Indel bases were recovered by forward inference.
    bool inferred = false;
};

/**
 * \brief Turns the winning hypothesis of a site into a record.
 *
 * Alleles are built from the reference window, the base-change probabilities and the indel
 * bases recovered from the evidence or the alignments. Heterozygous calls which resolve to
 * two different alternate alleles become multi-allelic (1/2).
 *
 * The site is skipped if it has no read depth, if a heterozygous indel has a non-positive
 * length or if either allele ends up empty.
 */
ComposeResult compose_record(const Site& site,
                             const ProbabilityBundle& probs,
                             const HypothesisScores& scores,
                             const AlignmentSource& source,
                             const CallerOptions& options);

/// Read support at the site center, from the reference and delete channels.
float read_depth(const EvidenceTensor& evidence);

}  // namespace clarion::calling
