#include "TestUtils.h"
#include "calling/hypothesis_scorer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <string>

#define CUT_TAG "[clarion::calling::hypothesis_scorer]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

namespace clarion::calling::tests {

DEFINE_TEST("score_hypotheses picks the hypothesis of a confident prediction") {
    struct TestCase {
        std::string name;
        BaseChange base_change;
        Genotype genotype;
        int32_t signed_len_1 = 0;
        int32_t signed_len_2 = 0;
        Hypothesis expected;
    };

    // clang-format off
    auto [test_case] = GENERATE_REF(table<TestCase>({
        TestCase{"Reference", BaseChange::AA, Genotype::HOMO_REFERENCE, 0, 0, Hypothesis::REFERENCE},
        TestCase{"Homozygous SNP", BaseChange::CC, Genotype::HOMO_VARIANT, 0, 0, Hypothesis::HOMO_SNP},
        TestCase{"Heterozygous SNP", BaseChange::AG, Genotype::HETERO_VARIANT, 0, 0, Hypothesis::HETERO_SNP},
        TestCase{"Homozygous insertion", BaseChange::InsIns, Genotype::HOMO_VARIANT, 4, 4, Hypothesis::HOMO_INSERTION},
        TestCase{"Homozygous deletion", BaseChange::DelDel, Genotype::HOMO_VARIANT, -3, -3, Hypothesis::HOMO_DELETION},
        TestCase{"Base and insertion", BaseChange::AIns, Genotype::HETERO_VARIANT, 0, 3, Hypothesis::HETERO_ACGT_INSERTION},
        TestCase{"Two insertions", BaseChange::InsIns, Genotype::HETERO_VARIANT, 2, 5, Hypothesis::HETERO_INSERTION_INSERTION},
        TestCase{"Base and deletion", BaseChange::CDel, Genotype::HETERO_VARIANT, -2, 0, Hypothesis::HETERO_ACGT_DELETION},
        TestCase{"Two deletions", BaseChange::DelDel, Genotype::HETERO_VARIANT, -2, -4, Hypothesis::HETERO_DELETION_DELETION},
        TestCase{"Insertion and deletion", BaseChange::InsDel, Genotype::HETERO_VARIANT, 3, -2, Hypothesis::HETERO_INSERTION_DELETION},
    }));
    // clang-format on

    CATCH_INFO(CUT_TAG << " Test name: " << test_case.name);

    const ProbabilityBundle probs =
            clarion::tests::make_probs(test_case.base_change, test_case.genotype,
                                       test_case.signed_len_1, test_case.signed_len_2);

    const HypothesisScores scores = score_hypotheses(probs, 'A');

    CATCH_CHECK(hypothesis_name(scores.winner) == hypothesis_name(test_case.expected));
    CATCH_CHECK(scores[test_case.expected] == 1.0f);
}

DEFINE_TEST("score_hypotheses resolves the indel lengths") {
    const ProbabilityBundle probs =
            clarion::tests::make_probs(BaseChange::InsIns, Genotype::HETERO_VARIANT, 6, 2);

    const HypothesisScores scores = score_hypotheses(probs, 'C');

    CATCH_CHECK(scores.winner == Hypothesis::HETERO_INSERTION_INSERTION);
    CATCH_CHECK(scores.hetero_insertion_insertion.length_1 == 2);
    CATCH_CHECK(scores.hetero_insertion_insertion.length_2 == 6);
    CATCH_CHECK(scores.homo_insertion.probability == 0.0f);
}

DEFINE_TEST("reference hypothesis is impossible for an ambiguous reference base") {
    const ProbabilityBundle probs =
            clarion::tests::make_probs(BaseChange::AA, Genotype::HOMO_REFERENCE, 0, 0);

    CATCH_CHECK(score_hypotheses(probs, 'A')[Hypothesis::REFERENCE] == 1.0f);

    const char ref_base = GENERATE('N', 'R', '*');
    CATCH_CAPTURE(ref_base);
    const HypothesisScores scores = score_hypotheses(probs, ref_base);
    CATCH_CHECK(scores[Hypothesis::REFERENCE] == 0.0f);
}

DEFINE_TEST("ties go to the earlier hypothesis") {
    ProbabilityBundle probs;
    probs.indel_length_1[INDEL_LEN_ZERO_OFFSET] = 1.0f;
    probs.indel_length_2[INDEL_LEN_ZERO_OFFSET] = 1.0f;

    CATCH_SECTION("Reference before homozygous SNP") {
        probs.base_change[to_index(BaseChange::AA)] = 0.5f;
        probs.base_change[to_index(BaseChange::CC)] = 0.5f;
        probs.genotype[to_index(Genotype::HOMO_REFERENCE)] = 0.5f;
        probs.genotype[to_index(Genotype::HOMO_VARIANT)] = 0.5f;

        const HypothesisScores scores = score_hypotheses(probs, 'A');
        CATCH_CHECK(scores[Hypothesis::REFERENCE] == scores[Hypothesis::HOMO_SNP]);
        CATCH_CHECK(scores.winner == Hypothesis::REFERENCE);
    }

    CATCH_SECTION("Homozygous SNP before heterozygous SNP") {
        probs.base_change[to_index(BaseChange::GG)] = 0.5f;
        probs.base_change[to_index(BaseChange::CT)] = 0.5f;
        probs.genotype[to_index(Genotype::HOMO_VARIANT)] = 0.5f;
        probs.genotype[to_index(Genotype::HETERO_VARIANT)] = 0.5f;

        const HypothesisScores scores = score_hypotheses(probs, 'A');
        CATCH_CHECK(scores[Hypothesis::HOMO_SNP] == scores[Hypothesis::HETERO_SNP]);
        CATCH_CHECK(scores.winner == Hypothesis::HOMO_SNP);
    }

    CATCH_SECTION("All zero") {
        const HypothesisScores scores = score_hypotheses(ProbabilityBundle{}, 'A');
        CATCH_CHECK(scores.winner == Hypothesis::REFERENCE);
    }
}

DEFINE_TEST("should_emit") {
    CallerOptions options;
    CATCH_CHECK(should_emit(Hypothesis::HOMO_SNP, options));
    CATCH_CHECK(should_emit(Hypothesis::HETERO_INSERTION_DELETION, options));
    CATCH_CHECK_FALSE(should_emit(Hypothesis::REFERENCE, options));

    options.show_reference = true;
    CATCH_CHECK(should_emit(Hypothesis::REFERENCE, options));

    options.show_reference = false;
    options.debug = true;
    CATCH_CHECK(should_emit(Hypothesis::REFERENCE, options));
}

}  // namespace clarion::calling::tests
