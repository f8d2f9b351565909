#include "calling/base_change.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <optional>
#include <string>
#include <string_view>

#define CUT_TAG "[clarion::calling::base_change]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

namespace clarion::calling::tests {

DEFINE_TEST("labels map back onto the same class") {
    for (int32_t i = 0; i < NUM_BASE_CHANGES; ++i) {
        const BaseChange bc = static_cast<BaseChange>(i);
        CATCH_CAPTURE(i);
        const std::optional<BaseChange> result = base_change_from_label(base_change_label(bc));
        CATCH_REQUIRE(result.has_value());
        CATCH_CHECK(*result == bc);
    }

    CATCH_CHECK(base_change_label(BaseChange::AA) == "AA");
    CATCH_CHECK(base_change_label(BaseChange::DelDel) == "DelDel");
    CATCH_CHECK(base_change_label(BaseChange::TIns) == "TIns");
    CATCH_CHECK(base_change_label(BaseChange::InsDel) == "InsDel");
}

DEFINE_TEST("unknown labels") {
    CATCH_CHECK_FALSE(base_change_from_label("").has_value());
    CATCH_CHECK_FALSE(base_change_from_label("CA").has_value());
    CATCH_CHECK_FALSE(base_change_from_label("DelIns").has_value());
    CATCH_CHECK_FALSE(base_change_from_label("NN").has_value());
}

DEFINE_TEST("genotype_string") {
    CATCH_CHECK(genotype_string(Genotype::HOMO_REFERENCE) == "0/0");
    CATCH_CHECK(genotype_string(Genotype::HOMO_VARIANT) == "1/1");
    CATCH_CHECK(genotype_string(Genotype::HETERO_VARIANT) == "0/1");
    CATCH_CHECK(genotype_string(Genotype::HETERO_VARIANT_MULTI) == "1/2");
    CATCH_CHECK(genotype_string(Genotype::UNKNOWN) == "./.");
}

DEFINE_TEST("base_to_index") {
    CATCH_CHECK(base_to_index('A') == 0);
    CATCH_CHECK(base_to_index('C') == 1);
    CATCH_CHECK(base_to_index('G') == 2);
    CATCH_CHECK(base_to_index('T') == 3);
    CATCH_CHECK(base_to_index('N') == -1);
    CATCH_CHECK(base_to_index('a') == -1);
    for (int32_t i = 0; i < 4; ++i) {
        CATCH_CHECK(base_to_index(index_to_base(i)) == i);
    }
}

DEFINE_TEST("partial_label") {
    auto [ref, alt, expected] = GENERATE(table<std::string, std::string, std::string>({
            std::make_tuple("A", "C", "C"),
            std::make_tuple("A", "A", "A"),
            std::make_tuple("A", "ACG", "Ins"),
            std::make_tuple("ACG", "A", "Del"),
            std::make_tuple("ACG", "TCG", "T"),
    }));

    CATCH_CAPTURE(ref, alt);
    CATCH_CHECK(partial_label(ref, alt) == expected);
}

DEFINE_TEST("mix_partial_labels") {
    auto [label_1, label_2, expected] = GENERATE(table<std::string, std::string, std::string>({
            std::make_tuple("A", "A", "AA"),
            std::make_tuple("C", "A", "AC"),
            std::make_tuple("A", "C", "AC"),
            std::make_tuple("T", "G", "GT"),
            std::make_tuple("G", "Del", "GDel"),
            std::make_tuple("Del", "G", "GDel"),
            std::make_tuple("Ins", "A", "AIns"),
            std::make_tuple("Ins", "Ins", "InsIns"),
            std::make_tuple("Del", "Del", "DelDel"),
            std::make_tuple("Ins", "Del", "InsDel"),
            std::make_tuple("Del", "Ins", "InsDel"),
    }));

    CATCH_CAPTURE(label_1, label_2);
    const std::string result = mix_partial_labels(label_1, label_2);
    CATCH_CHECK(result == expected);
    CATCH_CHECK(base_change_from_label(result).has_value());
}

}  // namespace clarion::calling::tests
