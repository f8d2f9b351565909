#include "base_change.h"

#include <algorithm>

namespace clarion::calling {

namespace {

// clang-format off
constexpr std::array<std::string_view, NUM_BASE_CHANGES> BASE_CHANGE_LABELS{
    "AA", "AC", "AG", "AT", "CC", "CG", "CT", "GG", "GT", "TT",
    "DelDel", "ADel", "CDel", "GDel", "TDel",
    "InsIns", "AIns", "CIns", "GIns", "TIns",
    "InsDel",
};
// clang-format on

constexpr std::string_view BASES{"ACGT"};

}  // namespace

std::string_view base_change_label(const BaseChange bc) { return BASE_CHANGE_LABELS[to_index(bc)]; }

std::optional<BaseChange> base_change_from_label(const std::string_view label) {
    const auto it = std::find(std::cbegin(BASE_CHANGE_LABELS), std::cend(BASE_CHANGE_LABELS), label);
    if (it == std::cend(BASE_CHANGE_LABELS)) {
        return std::nullopt;
    }
    return static_cast<BaseChange>(std::distance(std::cbegin(BASE_CHANGE_LABELS), it));
}

std::string_view genotype_string(const Genotype gt) {
    switch (gt) {
    case Genotype::HOMO_REFERENCE:
        return "0/0";
    case Genotype::HOMO_VARIANT:
        return "1/1";
    case Genotype::HETERO_VARIANT:
        return "0/1";
    case Genotype::HETERO_VARIANT_MULTI:
        return "1/2";
    case Genotype::UNKNOWN:
        break;
    }
    return "./.";
}

int32_t base_to_index(const char base) {
    switch (base) {
    case 'A':
        return 0;
    case 'C':
        return 1;
    case 'G':
        return 2;
    case 'T':
        return 3;
    default:
        return -1;
    }
}

char index_to_base(const int32_t index) { return BASES[index % 4]; }

std::string partial_label(const std::string_view ref, const std::string_view alt) {
    if (std::size(ref) > std::size(alt)) {
        return "Del";
    }
    if (std::size(ref) < std::size(alt)) {
        return "Ins";
    }
    if (std::empty(alt)) {
        return "";
    }
    return std::string(1, alt.front());
}

std::string mix_partial_labels(const std::string_view label_1, const std::string_view label_2) {
    // AA, AC, AG, AT, CC, CG, CT, GG, GT, TT
    if ((std::size(label_1) == 1) && (std::size(label_2) == 1)) {
        return (label_1 <= label_2) ? (std::string(label_1) + std::string(label_2))
                                    : (std::string(label_2) + std::string(label_1));
    }

    // ADel, CDel, GDel, TDel, AIns, CIns, GIns, TIns
    const bool swap = (std::size(label_1) > 1) && (std::size(label_2) == 1);
    const std::string_view base = swap ? label_2 : label_1;
    const std::string_view indel = swap ? label_1 : label_2;
    if ((std::size(indel) > 1) && (std::size(base) == 1)) {
        return std::string(base) + std::string(indel);
    }

    // InsIns, DelDel
    if (!std::empty(label_1) && (label_1 == label_2)) {
        return std::string(label_1) + std::string(label_2);
    }

    return std::string(base_change_label(BaseChange::InsDel));
}

}  // namespace clarion::calling
