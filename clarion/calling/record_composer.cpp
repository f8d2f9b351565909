#include "record_composer.h"

#include "allele_recovery.h"
#include "constants.h"
#include "quality.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace clarion::calling {

namespace {

/// Intermediate state of the alleles while a site is being composed.
struct Alleles {
    std::string ref;
    std::vector<std::string> alts;
    Genotype genotype = Genotype::UNKNOWN;
    int32_t length_guess = 0;
    bool inferred = false;
    std::string skip_reason;
};

enum class VariantClass {
    REFERENCE,
    SNP,
    INSERTION,
    DELETION,
    INSERTION_DELETION,
};

VariantClass variant_class(const Hypothesis h) {
    switch (h) {
    case Hypothesis::REFERENCE:
        return VariantClass::REFERENCE;
    case Hypothesis::HOMO_SNP:
    case Hypothesis::HETERO_SNP:
        return VariantClass::SNP;
    case Hypothesis::HOMO_INSERTION:
    case Hypothesis::HETERO_ACGT_INSERTION:
    case Hypothesis::HETERO_INSERTION_INSERTION:
        return VariantClass::INSERTION;
    case Hypothesis::HOMO_DELETION:
    case Hypothesis::HETERO_ACGT_DELETION:
    case Hypothesis::HETERO_DELETION_DELETION:
        return VariantClass::DELETION;
    case Hypothesis::HETERO_INSERTION_DELETION:
        return VariantClass::INSERTION_DELETION;
    }
    return VariantClass::REFERENCE;
}

Genotype initial_genotype(const Hypothesis h) {
    switch (h) {
    case Hypothesis::REFERENCE:
        return Genotype::HOMO_REFERENCE;
    case Hypothesis::HOMO_SNP:
    case Hypothesis::HOMO_INSERTION:
    case Hypothesis::HOMO_DELETION:
        return Genotype::HOMO_VARIANT;
    case Hypothesis::HETERO_INSERTION_DELETION:
        return Genotype::HETERO_VARIANT_MULTI;
    default:
        return Genotype::HETERO_VARIANT;
    }
}

/// Label of the most probable class in the group. The first one wins ties.
template <size_t N>
std::string_view argmax_label(const ProbabilityBundle& probs,
                              const std::array<BaseChange, N>& classes) {
    BaseChange best = classes[0];
    for (const BaseChange bc : classes) {
        if (probs[bc] > probs[best]) {
            best = bc;
        }
    }
    return base_change_label(best);
}

void compose_snp(const ProbabilityBundle& probs, const Hypothesis winner, Alleles& alleles) {
    const char ref_base = alleles.ref[0];

    if (winner == Hypothesis::HOMO_SNP) {
        const std::string_view label = argmax_label(probs, HOMO_SNP_CLASSES);
        alleles.alts = {std::string(1, (label[0] != ref_base) ? label[0] : label[1])};
        return;
    }

    const std::string_view label = argmax_label(probs, HETERO_SNP_CLASSES);
    if ((label[0] != ref_base) && (label[1] != ref_base)) {
        alleles.alts = {std::string(1, label[0]), std::string(1, label[1])};
        alleles.genotype = Genotype::HETERO_VARIANT_MULTI;
    } else {
        alleles.alts = {std::string(1, (label[0] != ref_base) ? label[0] : label[1])};
    }
}

void compose_insertion(const Site& site,
                       const ProbabilityBundle& probs,
                       const HypothesisScores& scores,
                       const AlignmentSource& source,
                       const CallerOptions& options,
                       Alleles& alleles) {
    const Hypothesis winner = scores.winner;
    const bool is_hetero = (winner != Hypothesis::HOMO_INSERTION);

    int32_t length = scores.homo_insertion.length_1;
    if (winner == Hypothesis::HETERO_ACGT_INSERTION) {
        length = scores.hetero_acgt_insertion.length_2;
    } else if (winner == Hypothesis::HETERO_INSERTION_INSERTION) {
        length = scores.hetero_insertion_insertion.length_2;
    }

    if (is_hetero && (length <= 0)) {
        alleles.skip_reason =
                "is hetero insertion and # of insertion bases predicted is less than 0";
        return;
    }

    const RecoveredIndel ins =
            recover_insertion(site, length, source, options.use_alignment_for_all_indels);

    const std::string ref_base(1, site.reference_base());
    alleles.ref.clear();
    if (ins.length > 0) {
        alleles.ref = ref_base;
        alleles.alts = {ref_base + ins.bases};
    }
    if (ins.inferred) {
        alleles.inferred = true;
        alleles.length_guess = ins.length;
    }

    if (ins.length <= 0) {
        return;
    }

    if (winner == Hypothesis::HETERO_ACGT_INSERTION) {
        const char base = argmax_label(probs, HETERO_INSERTION_CLASSES)[0];
        if (base != site.reference_base()) {
            alleles.alts = {std::string(1, base), ref_base + ins.bases};
            alleles.genotype = Genotype::HETERO_VARIANT_MULTI;
        }

    } else if (winner == Hypothesis::HETERO_INSERTION_INSERTION) {
        const int32_t length_1 = scores.hetero_insertion_insertion.length_1;
        std::string other = most_frequent_insertion(source, site.locus, length_1,
                                                    adaptive_max_length(length_1), ins.bases);
        if (std::empty(other)) {
            other = ins.bases.substr(0, std::max(0, length_1));
        }
        std::string alt_1 = ref_base + other;
        if (alt_1 != alleles.alts[0]) {
            alleles.alts = {std::move(alt_1), ref_base + ins.bases};
            alleles.genotype = Genotype::HETERO_VARIANT_MULTI;
        }
    }
}

void compose_deletion(const Site& site,
                      const ProbabilityBundle& probs,
                      const HypothesisScores& scores,
                      const AlignmentSource& source,
                      const CallerOptions& options,
                      Alleles& alleles) {
    const Hypothesis winner = scores.winner;
    const bool is_hetero = (winner != Hypothesis::HOMO_DELETION);

    int32_t length = scores.homo_deletion.length_1;
    if (winner == Hypothesis::HETERO_ACGT_DELETION) {
        length = scores.hetero_acgt_deletion.length_2;
    } else if (winner == Hypothesis::HETERO_DELETION_DELETION) {
        length = scores.hetero_deletion_deletion.length_2;
    }

    if (is_hetero && (length <= 0)) {
        alleles.skip_reason =
                "is hetero deletion and # of deletion bases predicted is less than 0";
        return;
    }

    const RecoveredIndel del =
            recover_deletion(site, length, source, options.use_alignment_for_all_indels);

    alleles.ref.clear();
    if (del.length > 0) {
        alleles.ref = site.reference_base() + del.bases;
        alleles.alts = {alleles.ref.substr(0, 1)};
    }
    if (del.inferred) {
        alleles.inferred = true;
        alleles.length_guess = del.length;
    }

    if (del.length <= 0) {
        return;
    }

    const std::string& ref = alleles.ref;

    if (winner == Hypothesis::HETERO_ACGT_DELETION) {
        const char base = argmax_label(probs, HETERO_DELETION_CLASSES)[0];
        if (base != ref[0]) {
            alleles.alts = {ref.substr(0, 1), base + ref.substr(1)};
            alleles.genotype = Genotype::HETERO_VARIANT_MULTI;
        }

    } else if (winner == Hypothesis::HETERO_DELETION_DELETION) {
        const size_t skip = static_cast<size_t>(
                std::max(0, scores.hetero_deletion_deletion.length_1) + 1);
        std::string alt_2 = ref.substr(0, 1) + ((skip < std::size(ref)) ? ref.substr(skip) : "");
        const std::string& alt_1 = alleles.alts[0];
        if ((alt_1 != alt_2) && (ref != alt_1) && (ref != alt_2)) {
            alleles.alts = {alt_1, std::move(alt_2)};
            alleles.genotype = Genotype::HETERO_VARIANT_MULTI;
        }
    }
}

void compose_insertion_deletion(const Site& site,
                                const HypothesisScores& scores,
                                const AlignmentSource& source,
                                const CallerOptions& options,
                                Alleles& alleles) {
    const LengthResolution& lengths = scores.hetero_insertion_deletion;

    const RecoveredIndel ins = recover_insertion(site, lengths.length_2, source,
                                                 options.use_alignment_for_all_indels);
    const RecoveredIndel del = recover_deletion(site, lengths.length_1, source,
                                                options.use_alignment_for_all_indels);

    alleles.ref.clear();
    if ((ins.length > 0) && (del.length > 0)) {
        alleles.ref = site.reference_base() + del.bases;
        const std::string anchor = alleles.ref.substr(0, 1);
        alleles.alts = {anchor, anchor + ins.bases + alleles.ref.substr(1)};
    }
}

float supporting_reads(const EvidenceTensor& evidence,
                       const VariantClass vc,
                       const Alleles& alleles) {
    const auto strand_sum = [&evidence](const int32_t base_idx, const EvidenceCategory cat) {
        if (base_idx < 0) {
            return 0.0f;
        }
        return evidence.at(FLANK, base_idx, cat) + evidence.at(FLANK, base_idx + NUM_BASES, cat);
    };

    switch (vc) {
    case VariantClass::REFERENCE:
        return strand_sum(base_to_index(alleles.ref[0]), EvidenceCategory::REFERENCE);
    case VariantClass::SNP: {
        float ret = 0.0f;
        for (const std::string& alt : alleles.alts) {
            const int32_t idx = base_to_index(alt[0]);
            ret += strand_sum(idx, EvidenceCategory::SNP) +
                   strand_sum(idx, EvidenceCategory::REFERENCE);
        }
        return ret;
    }
    case VariantClass::INSERTION:
        return evidence.category_sum(FLANK + 1, EvidenceCategory::INSERT) -
               evidence.category_sum(FLANK + 1, EvidenceCategory::SNP);
    case VariantClass::DELETION:
        return evidence.category_sum(FLANK + 1, EvidenceCategory::DELETE);
    case VariantClass::INSERTION_DELETION:
        return evidence.category_sum(FLANK + 1, EvidenceCategory::INSERT) +
               evidence.category_sum(FLANK + 1, EvidenceCategory::DELETE) -
               evidence.category_sum(FLANK + 1, EvidenceCategory::SNP);
    }
    return 0.0f;
}

}  // namespace

float read_depth(const EvidenceTensor& evidence) {
    return evidence.category_sum(FLANK, EvidenceCategory::REFERENCE) +
           evidence.category_sum(FLANK, EvidenceCategory::DELETE);
}

ComposeResult compose_record(const Site& site,
                             const ProbabilityBundle& probs,
                             const HypothesisScores& scores,
                             const AlignmentSource& source,
                             const CallerOptions& options) {
    ComposeResult ret;

    const float depth = read_depth(site.evidence);
    if (depth == 0.0f) {
        ret.skip_reason = "Read Depth is zero";
        return ret;
    }

    const VariantClass vc = variant_class(scores.winner);

    Alleles alleles;
    alleles.genotype = initial_genotype(scores.winner);
    alleles.ref = std::string(1, site.reference_base());

    switch (vc) {
    case VariantClass::REFERENCE:
        alleles.alts = {alleles.ref};
        break;
    case VariantClass::SNP:
        compose_snp(probs, scores.winner, alleles);
        break;
    case VariantClass::INSERTION:
        compose_insertion(site, probs, scores, source, options, alleles);
        break;
    case VariantClass::DELETION:
        compose_deletion(site, probs, scores, source, options, alleles);
        break;
    case VariantClass::INSERTION_DELETION:
        compose_insertion_deletion(site, scores, source, options, alleles);
        break;
    }

    ret.inferred = alleles.inferred;

    if (!std::empty(alleles.skip_reason)) {
        ret.skip_reason = std::move(alleles.skip_reason);
        return ret;
    }

    const bool empty_alt = std::empty(alleles.alts) ||
                           std::any_of(std::cbegin(alleles.alts), std::cend(alleles.alts),
                                       [](const std::string& alt) { return std::empty(alt); });
    if (std::empty(alleles.ref) || empty_alt) {
        ret.skip_reason = "no reference base / alternate base prediction";
        return ret;
    }

    const float support = supporting_reads(site.evidence, vc, alleles);

    VariantRecord record;
    record.contig = site.locus.contig;
    record.position = site.locus.position;
    record.genotype = std::string(genotype_string(alleles.genotype));
    record.depth = static_cast<int64_t>(depth);
    record.allele_frequency = std::clamp(support / depth, 0.0f, 1.0f);

    if ((alleles.length_guess > 0) && (alleles.length_guess < FLANK)) {
        record.info.emplace_back("LENGUESS=" + std::to_string(alleles.length_guess));
    }

    record.quality = quality_score(alleles.ref, alleles.alts, record.genotype, probs);
    record.filter = filter_value(options.pass_min_qual, record.quality);
    record.ref = std::move(alleles.ref);
    record.alts = std::move(alleles.alts);

    spdlog::trace("[compose_record] {}:{} {} -> {} {}", record.contig, record.position + 1,
                  hypothesis_name(scores.winner), record.ref, record.genotype);

    ret.record = std::move(record);

    return ret;
}

}  // namespace clarion::calling
