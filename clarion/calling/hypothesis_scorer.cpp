#include "hypothesis_scorer.h"

#include <algorithm>
#include <optional>
#include <string>

namespace clarion::calling {

namespace {

template <size_t N>
float max_of(const ProbabilityBundle& probs, const std::array<BaseChange, N>& classes) {
    float ret = probs[classes[0]];
    for (const BaseChange bc : classes) {
        ret = std::max(ret, probs[bc]);
    }
    return ret;
}

}  // namespace

std::string_view hypothesis_name(const Hypothesis h) {
    switch (h) {
    case Hypothesis::REFERENCE:
        return "reference";
    case Hypothesis::HOMO_SNP:
        return "homo_snp";
    case Hypothesis::HETERO_SNP:
        return "hetero_snp";
    case Hypothesis::HOMO_INSERTION:
        return "homo_insertion";
    case Hypothesis::HOMO_DELETION:
        return "homo_deletion";
    case Hypothesis::HETERO_ACGT_INSERTION:
        return "hetero_acgt_insertion";
    case Hypothesis::HETERO_INSERTION_INSERTION:
        return "hetero_insertion_insertion";
    case Hypothesis::HETERO_ACGT_DELETION:
        return "hetero_acgt_deletion";
    case Hypothesis::HETERO_DELETION_DELETION:
        return "hetero_deletion_deletion";
    case Hypothesis::HETERO_INSERTION_DELETION:
        return "hetero_insertion_deletion";
    }
    return "unknown";
}

HypothesisScores score_hypotheses(const ProbabilityBundle& probs, const char reference_base) {
    const IndelLengthProbs& l1 = probs.indel_length_1;
    const IndelLengthProbs& l2 = probs.indel_length_2;

    HypothesisScores ret;
    ret.homo_insertion = resolve_lengths(l1, l2, LengthShape::HOMO_INSERTION);
    ret.homo_deletion = resolve_lengths(l1, l2, LengthShape::HOMO_DELETION);
    ret.hetero_acgt_insertion = resolve_lengths(l1, l2, LengthShape::HETERO_ACGT_INSERTION);
    ret.hetero_acgt_deletion = resolve_lengths(l1, l2, LengthShape::HETERO_ACGT_DELETION);
    ret.hetero_insertion_insertion =
            resolve_lengths(l1, l2, LengthShape::HETERO_INSERTION_INSERTION);
    ret.hetero_deletion_deletion = resolve_lengths(l1, l2, LengthShape::HETERO_DELETION_DELETION);
    ret.hetero_insertion_deletion = resolve_lengths(l1, l2, LengthShape::HETERO_INSERTION_DELETION);

    const float zero_length = length_prob(l1, 0) * length_prob(l2, 0);
    const float homo_ref = probs[Genotype::HOMO_REFERENCE];
    const float homo_var = probs[Genotype::HOMO_VARIANT];
    const float hetero_var = probs[Genotype::HETERO_VARIANT];

    const std::optional<BaseChange> ref_change =
            (base_to_index(reference_base) >= 0)
                    ? base_change_from_label(std::string(2, reference_base))
                    : std::nullopt;

    auto& p = ret.probabilities;
    p[to_index(Hypothesis::REFERENCE)] =
            ref_change ? (probs[*ref_change] * zero_length * homo_ref) : 0.0f;
    p[to_index(Hypothesis::HOMO_SNP)] = max_of(probs, HOMO_SNP_CLASSES) * zero_length * homo_var;
    p[to_index(Hypothesis::HETERO_SNP)] =
            max_of(probs, HETERO_SNP_CLASSES) * zero_length * hetero_var;
    p[to_index(Hypothesis::HOMO_INSERTION)] =
            probs[BaseChange::InsIns] * ret.homo_insertion.probability * homo_var;
    p[to_index(Hypothesis::HOMO_DELETION)] =
            probs[BaseChange::DelDel] * ret.homo_deletion.probability * homo_var;
    p[to_index(Hypothesis::HETERO_ACGT_INSERTION)] = max_of(probs, HETERO_INSERTION_CLASSES) *
                                                     ret.hetero_acgt_insertion.probability *
                                                     hetero_var;
    p[to_index(Hypothesis::HETERO_INSERTION_INSERTION)] =
            probs[BaseChange::InsIns] * ret.hetero_insertion_insertion.probability * hetero_var;
    p[to_index(Hypothesis::HETERO_ACGT_DELETION)] = max_of(probs, HETERO_DELETION_CLASSES) *
                                                    ret.hetero_acgt_deletion.probability *
                                                    hetero_var;
    p[to_index(Hypothesis::HETERO_DELETION_DELETION)] =
            probs[BaseChange::DelDel] * ret.hetero_deletion_deletion.probability * hetero_var;
    p[to_index(Hypothesis::HETERO_INSERTION_DELETION)] =
            probs[BaseChange::InsDel] * ret.hetero_insertion_deletion.probability * hetero_var;

    int32_t best = 0;
    for (int32_t i = 1; i < NUM_HYPOTHESES; ++i) {
        if (p[i] > p[best]) {
            best = i;
        }
    }
    ret.winner = static_cast<Hypothesis>(best);

    return ret;
}

bool should_emit(const Hypothesis winner, const CallerOptions& options) {
    if (winner != Hypothesis::REFERENCE) {
        return true;
    }
    return options.show_reference || options.debug;
}

}  // namespace clarion::calling
