#include "quality.h"

#include "base_change.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace clarion::calling {

namespace {

constexpr double QUALITY_EPSILON = 1e-300;

// Shifts the log-odds so that the squared score grows monotonically with p.
constexpr double QUALITY_OFFSET = 33.0;

}  // namespace

int32_t quality_from_probability(const double p_in) {
    // Malformed classifier outputs can fall outside [0, 1].
    const double p = std::isnan(p_in) ? 0.0 : std::clamp(p_in, 0.0, 1.0);
    const double log_odds = std::log((1.0 - p + QUALITY_EPSILON) / (p + QUALITY_EPSILON));
    const double tmp = (-10.0 * std::log10(std::exp(1.0))) * log_odds + QUALITY_OFFSET;
    return static_cast<int32_t>(std::lround(tmp * tmp));
}

int32_t quality_score(const std::string_view ref,
                      const std::vector<std::string>& alts,
                      const std::string_view genotype_string,
                      const ProbabilityBundle& probs) {
    if (std::empty(alts) || (std::size(genotype_string) < 3)) {
        return 0;
    }

    int32_t allele_1 = genotype_string[0] - '0';
    int32_t allele_2 = genotype_string[2] - '0';
    if (allele_1 > allele_2) {
        std::swap(allele_1, allele_2);
    }

    // Both alleles of the site. A single alternate is paired with the reference if the
    // genotype carries it, otherwise with itself.
    std::string_view first = alts[0];
    std::string_view second = (std::size(alts) > 1) ? std::string_view(alts[1]) : first;
    if (std::size(alts) == 1) {
        first = ((allele_1 == 0) || (allele_2 == 0)) ? ref : std::string_view(alts[0]);
    }

    const std::optional<BaseChange> bc = base_change_from_label(
            mix_partial_labels(partial_label(ref, first), partial_label(ref, second)));
    if (!bc) {
        return 0;
    }

    Genotype gt = Genotype::UNKNOWN;
    if ((allele_1 == 0) && (allele_2 == 0)) {
        gt = Genotype::HOMO_REFERENCE;
    } else if (allele_1 == allele_2) {
        gt = Genotype::HOMO_VARIANT;
    } else {
        gt = Genotype::HETERO_VARIANT;
    }

    const double p = static_cast<double>(probs[*bc]) * static_cast<double>(probs[gt]);

    return quality_from_probability(p);
}

std::string filter_value(const std::optional<int32_t>& pass_min_qual, const int32_t quality) {
    if (!pass_min_qual) {
        return ".";
    }
    return (quality >= *pass_min_qual) ? "PASS" : "LowQual";
}

}  // namespace clarion::calling
