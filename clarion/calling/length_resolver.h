#pragma once

#include "site.h"

#include <cstdint>
#include <iosfwd>

namespace clarion::calling {

/// Allele length hypotheses searched over the two indel length distributions.
enum class LengthShape {
    HOMO_INSERTION,
    HOMO_DELETION,
    HETERO_ACGT_INSERTION,
    HETERO_ACGT_DELETION,
    HETERO_INSERTION_INSERTION,
    HETERO_DELETION_DELETION,
    HETERO_INSERTION_DELETION,
};

/**
 * \brief Best length assignment for a shape.
 *          - Homozygous shapes: length_1 == length_2.
 *          - Hetero ACGT shapes: length_1 is 0 (the base allele), length_2 the indel length.
 *          - Hetero same-type shapes: length_1 <= length_2.
 *          - Hetero insertion+deletion: length_1 is the deletion, length_2 the insertion.
 */
struct LengthResolution {
    int32_t length_1 = 0;
    int32_t length_2 = 0;
    float probability = 0.0f;
};

/**
 * \brief Exhaustive search over lengths 1..MAX_INDEL_LEN for the given shape.
 *          Comparisons are strict, so the earliest combination in iteration order wins ties.
 *          If no combination has a positive probability the default lengths are returned
 *          with a probability of zero (-1/-1 for the insertion+deletion shape).
 */
LengthResolution resolve_lengths(const IndelLengthProbs& length_probs_1,
                                 const IndelLengthProbs& length_probs_2,
                                 LengthShape shape);

bool operator==(const LengthResolution& lhs, const LengthResolution& rhs);

std::ostream& operator<<(std::ostream& os, const LengthResolution& lr);

}  // namespace clarion::calling
