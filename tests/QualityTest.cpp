#include "calling/quality.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#define CUT_TAG "[clarion::calling::quality]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

namespace clarion::calling::tests {

namespace {

double joint(const float bc_prob, const float gt_prob) {
    return static_cast<double>(bc_prob) * static_cast<double>(gt_prob);
}

}  // namespace

DEFINE_TEST("quality_from_probability") {
    CATCH_SECTION("Even odds") { CATCH_CHECK(quality_from_probability(0.5) == 1089); }

    CATCH_SECTION("Monotone over the useful range") {
        int32_t prev = quality_from_probability(0.01);
        for (double p = 0.02; p < 1.0; p += 0.01) {
            const int32_t q = quality_from_probability(p);
            CATCH_CAPTURE(p, q, prev);
            CATCH_CHECK(q >= prev);
            prev = q;
        }
        CATCH_CHECK(quality_from_probability(0.999) > quality_from_probability(0.9));
    }

    CATCH_SECTION("Never negative") {
        const double p = GENERATE(0.0, 1e-12, 1e-4, 0.3, 0.7, 1.0);
        CATCH_CAPTURE(p);
        CATCH_CHECK(quality_from_probability(p) >= 0);
    }

    CATCH_SECTION("Out of range probabilities are clamped") {
        CATCH_CHECK(quality_from_probability(1.5) == quality_from_probability(1.0));
        CATCH_CHECK(quality_from_probability(1.0 + 1e-6) == quality_from_probability(1.0));
        CATCH_CHECK(quality_from_probability(-0.5) == quality_from_probability(0.0));
        CATCH_CHECK(quality_from_probability(std::nan("")) == quality_from_probability(0.0));
        CATCH_CHECK(quality_from_probability(1.5) > quality_from_probability(0.999));
    }
}

DEFINE_TEST("quality_score re-derives the class from the alleles") {
    ProbabilityBundle probs;
    probs.base_change[to_index(BaseChange::AC)] = 0.8f;
    probs.base_change[to_index(BaseChange::CC)] = 0.6f;
    probs.base_change[to_index(BaseChange::CG)] = 0.3f;
    probs.base_change[to_index(BaseChange::AIns)] = 0.7f;
    probs.base_change[to_index(BaseChange::InsIns)] = 0.9f;
    probs.base_change[to_index(BaseChange::ADel)] = 0.4f;
    probs.base_change[to_index(BaseChange::InsDel)] = 0.2f;
    probs.genotype[to_index(Genotype::HOMO_REFERENCE)] = 0.1f;
    probs.genotype[to_index(Genotype::HOMO_VARIANT)] = 0.25f;
    probs.genotype[to_index(Genotype::HETERO_VARIANT)] = 0.65f;

    struct TestCase {
        std::string name;
        std::string ref;
        std::vector<std::string> alts;
        std::string genotype;
        double expected_p = 0.0;
    };

    // clang-format off
    auto [test_case] = GENERATE_REF(table<TestCase>({
        TestCase{"Heterozygous SNP", "A", {"C"}, "0/1", joint(0.8f, 0.65f)},
        TestCase{"Homozygous SNP", "A", {"C"}, "1/1", joint(0.6f, 0.25f)},
        TestCase{"Multi-allelic SNP", "A", {"C", "G"}, "1/2", joint(0.3f, 0.65f)},
        TestCase{"Heterozygous insertion", "A", {"ACG"}, "0/1", joint(0.7f, 0.65f)},
        TestCase{"Homozygous insertion", "A", {"ACG"}, "1/1", joint(0.9f, 0.25f)},
        TestCase{"Heterozygous deletion", "ACG", {"A"}, "0/1", joint(0.4f, 0.65f)},
        TestCase{"Insertion and deletion", "AC", {"A", "ATTC"}, "1/2", joint(0.2f, 0.65f)},
    }));
    // clang-format on

    CATCH_INFO(CUT_TAG << " Test name: " << test_case.name);

    CATCH_CHECK(quality_score(test_case.ref, test_case.alts, test_case.genotype, probs) ==
                quality_from_probability(test_case.expected_p));
}

DEFINE_TEST("quality_score of unmappable calls is zero") {
    ProbabilityBundle probs;
    probs.base_change.fill(0.5f);
    probs.genotype.fill(0.5f);

    CATCH_CHECK(quality_score("A", {"N"}, "0/1", probs) == 0);
    CATCH_CHECK(quality_score("A", {}, "0/1", probs) == 0);
    CATCH_CHECK(quality_score("A", {"C"}, ".", probs) == 0);
}

DEFINE_TEST("filter_value") {
    CATCH_CHECK(filter_value(std::nullopt, 0) == ".");
    CATCH_CHECK(filter_value(std::nullopt, 500) == ".");
    CATCH_CHECK(filter_value(100, 100) == "PASS");
    CATCH_CHECK(filter_value(100, 101) == "PASS");
    CATCH_CHECK(filter_value(100, 99) == "LowQual");
}

}  // namespace clarion::calling::tests
