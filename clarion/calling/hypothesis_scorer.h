#pragma once

#include "length_resolver.h"
#include "options.h"
#include "site.h"

#include <array>
#include <cstdint>
#include <string_view>

namespace clarion::calling {

/// Joint variant hypotheses of a site. The order is also the tie-break order.
enum class Hypothesis : int32_t {
    REFERENCE = 0,
    HOMO_SNP,
    HETERO_SNP,
    HOMO_INSERTION,
    HOMO_DELETION,
    HETERO_ACGT_INSERTION,
    HETERO_INSERTION_INSERTION,
    HETERO_ACGT_DELETION,
    HETERO_DELETION_DELETION,
    HETERO_INSERTION_DELETION,
};

constexpr int32_t NUM_HYPOTHESES = 10;

constexpr int32_t to_index(const Hypothesis h) { return static_cast<int32_t>(h); }

std::string_view hypothesis_name(Hypothesis h);

struct HypothesisScores {
    std::array<float, NUM_HYPOTHESES> probabilities{};

    LengthResolution homo_insertion;
    LengthResolution homo_deletion;
    LengthResolution hetero_acgt_insertion;
    LengthResolution hetero_acgt_deletion;
    LengthResolution hetero_insertion_insertion;
    LengthResolution hetero_deletion_deletion;
    LengthResolution hetero_insertion_deletion;

    Hypothesis winner = Hypothesis::REFERENCE;

    float operator[](Hypothesis h) const { return probabilities[to_index(h)]; }
};

/**
 * \brief Computes the joint probability of every hypothesis from the classifier output and
 *          selects the most probable one. The reference hypothesis has probability 0 if the
 *          reference base is not one of A, C, G, T.
 */
HypothesisScores score_hypotheses(const ProbabilityBundle& probs, char reference_base);

/// Reference calls are only reported on request or in debug mode.
bool should_emit(Hypothesis winner, const CallerOptions& options);

}  // namespace clarion::calling
