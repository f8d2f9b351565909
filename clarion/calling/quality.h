#pragma once

#include "site.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clarion::calling {

/**
 * \brief Phred-like quality of a composed call.
 *          The base-change class and the coarse genotype are derived again from the final
 *          alleles and the genotype string (e.g. "0/1"), so a call whose alleles disagree with
 *          the classifier output gets a low score.
 *          Returns 0 if the alleles do not map onto a known base-change class.
 */
int32_t quality_score(std::string_view ref,
                      const std::vector<std::string>& alts,
                      std::string_view genotype_string,
                      const ProbabilityBundle& probs);

/// Quality from the joint probability of the call. p is clamped to [0, 1].
int32_t quality_from_probability(double p);

/// "." without a threshold, otherwise "PASS" or "LowQual".
std::string filter_value(const std::optional<int32_t>& pass_min_qual, int32_t quality);

}  // namespace clarion::calling
