#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clarion::calling {

/**
 * \brief The 21 base-change classes predicted by the classifier. A class describes both
 *          alleles of a diploid site: a pair of bases, a base and an indel, or two indels.
 *          The numeric values are the column indices of the classifier output.
 */
enum class BaseChange : int32_t {
    AA = 0,
    AC,
    AG,
    AT,
    CC,
    CG,
    CT,
    GG,
    GT,
    TT,
    DelDel,
    ADel,
    CDel,
    GDel,
    TDel,
    InsIns,
    AIns,
    CIns,
    GIns,
    TIns,
    InsDel,
};

constexpr int32_t NUM_BASE_CHANGES = 21;

/// Classifier genotype classes (the first three) and the composed multi-allelic genotype.
enum class Genotype : int32_t {
    UNKNOWN = -1,
    HOMO_REFERENCE = 0,
    HOMO_VARIANT = 1,
    HETERO_VARIANT = 2,
    HETERO_VARIANT_MULTI = 3,
};

constexpr int32_t NUM_GENOTYPES = 3;

constexpr std::array<BaseChange, 4> HOMO_SNP_CLASSES{BaseChange::AA, BaseChange::CC,
                                                     BaseChange::GG, BaseChange::TT};
constexpr std::array<BaseChange, 6> HETERO_SNP_CLASSES{BaseChange::AC, BaseChange::AG,
                                                       BaseChange::AT, BaseChange::CG,
                                                       BaseChange::CT, BaseChange::GT};
constexpr std::array<BaseChange, 4> HETERO_INSERTION_CLASSES{BaseChange::AIns, BaseChange::CIns,
                                                             BaseChange::GIns, BaseChange::TIns};
constexpr std::array<BaseChange, 4> HETERO_DELETION_CLASSES{BaseChange::ADel, BaseChange::CDel,
                                                            BaseChange::GDel, BaseChange::TDel};

constexpr int32_t to_index(const BaseChange bc) { return static_cast<int32_t>(bc); }
constexpr int32_t to_index(const Genotype gt) { return static_cast<int32_t>(gt); }

std::string_view base_change_label(BaseChange bc);

std::optional<BaseChange> base_change_from_label(std::string_view label);

/// Genotype string as it appears in the GT field: 0/0, 1/1, 0/1 or 1/2.
std::string_view genotype_string(Genotype gt);

/**
 * \brief Index of a nucleotide in the ACGT order, or -1 for any other character.
 */
int32_t base_to_index(char base);

char index_to_base(int32_t index);

/**
 * \brief Describes one allele relative to the reference: "Del" if it is shorter,
 *          "Ins" if it is longer, otherwise its first base.
 */
std::string partial_label(std::string_view ref, std::string_view alt);

/**
 * \brief Combines the partial labels of the two alleles of a site into a base-change label.
 *          Two bases are sorted ("CA" -> "AC"), a base and an indel put the base first,
 *          two identical indels concatenate ("InsIns", "DelDel") and all else is "InsDel".
 */
std::string mix_partial_labels(std::string_view label_1, std::string_view label_2);

}  // namespace clarion::calling
