#include "length_resolver.h"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <tuple>
#include <string>

namespace clarion::calling {

namespace {

LengthResolution resolve_homozygous(const IndelLengthProbs& l1,
                                    const IndelLengthProbs& l2,
                                    const int32_t sign) {
    LengthResolution ret;
    for (int32_t i = 1; i <= MAX_INDEL_LEN; ++i) {
        const float p = length_prob(l1, sign * i) * length_prob(l2, sign * i);
        if (p > ret.probability) {
            ret = {i, i, p};
        }
    }
    return ret;
}

LengthResolution resolve_hetero_single(const IndelLengthProbs& l1,
                                       const IndelLengthProbs& l2,
                                       const int32_t sign) {
    LengthResolution ret;
    for (int32_t i = 1; i <= MAX_INDEL_LEN; ++i) {
        // The indel can be predicted on either of the two allele outputs.
        const float p_first = length_prob(l1, 0) * length_prob(l2, sign * i);
        if (p_first > ret.probability) {
            ret = {0, i, p_first};
        }
        const float p_second = length_prob(l1, sign * i) * length_prob(l2, 0);
        if (p_second > ret.probability) {
            ret = {0, i, p_second};
        }
    }
    return ret;
}

LengthResolution resolve_hetero_same_type(const IndelLengthProbs& l1,
                                          const IndelLengthProbs& l2,
                                          const int32_t sign) {
    LengthResolution ret;
    for (int32_t i = 1; i <= MAX_INDEL_LEN; ++i) {
        for (int32_t j = 1; j <= MAX_INDEL_LEN; ++j) {
            if (i == j) {
                continue;
            }
            const float p = length_prob(l1, sign * i) * length_prob(l2, sign * j);
            if (p > ret.probability) {
                ret = {std::min(i, j), std::max(i, j), p};
            }
        }
    }
    return ret;
}

LengthResolution resolve_insertion_deletion(const IndelLengthProbs& l1,
                                            const IndelLengthProbs& l2) {
    LengthResolution ret{-1, -1, 0.0f};
    for (int32_t i = 1; i <= MAX_INDEL_LEN; ++i) {
        for (int32_t j = 1; j <= MAX_INDEL_LEN; ++j) {
            // Insertion of length i on the first allele, deletion of length j on the second.
            const float p_ins_del = length_prob(l1, i) * length_prob(l2, -j);
            if (p_ins_del > ret.probability) {
                ret = {j, i, p_ins_del};
            }
            // Deletion of length i on the first allele, insertion of length j on the second.
            const float p_del_ins = length_prob(l1, -i) * length_prob(l2, j);
            if (p_del_ins > ret.probability) {
                ret = {i, j, p_del_ins};
            }
        }
    }
    return ret;
}

}  // namespace

LengthResolution resolve_lengths(const IndelLengthProbs& length_probs_1,
                                 const IndelLengthProbs& length_probs_2,
                                 const LengthShape shape) {
    switch (shape) {
    case LengthShape::HOMO_INSERTION:
        return resolve_homozygous(length_probs_1, length_probs_2, +1);
    case LengthShape::HOMO_DELETION:
        return resolve_homozygous(length_probs_1, length_probs_2, -1);
    case LengthShape::HETERO_ACGT_INSERTION:
        return resolve_hetero_single(length_probs_1, length_probs_2, +1);
    case LengthShape::HETERO_ACGT_DELETION:
        return resolve_hetero_single(length_probs_1, length_probs_2, -1);
    case LengthShape::HETERO_INSERTION_INSERTION:
        return resolve_hetero_same_type(length_probs_1, length_probs_2, +1);
    case LengthShape::HETERO_DELETION_DELETION:
        return resolve_hetero_same_type(length_probs_1, length_probs_2, -1);
    case LengthShape::HETERO_INSERTION_DELETION:
        return resolve_insertion_deletion(length_probs_1, length_probs_2);
    }
    throw std::runtime_error{"Unknown length shape: " + std::to_string(static_cast<int>(shape))};
}

bool operator==(const LengthResolution& lhs, const LengthResolution& rhs) {
    return std::tie(lhs.length_1, lhs.length_2, lhs.probability) ==
           std::tie(rhs.length_1, rhs.length_2, rhs.probability);
}

std::ostream& operator<<(std::ostream& os, const LengthResolution& lr) {
    os << "length_1 = " << lr.length_1 << ", length_2 = " << lr.length_2
       << ", probability = " << lr.probability;
    return os;
}

}  // namespace clarion::calling
