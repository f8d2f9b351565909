#include "calling/base_change.h"
#include "calling/constants.h"
#include "pipeline/classifier.h"
#include "pipeline/classifier_torch_script.h"
#include "torch_utils/tensor_utils.h"

#include <ATen/ATen.h>
#include <catch2/catch_test_macros.hpp>

#define CUT_TAG "[clarion::pipeline::classifier]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

namespace clarion::pipeline::tests {

DEFINE_TEST("make_empty_output") {
    const ClassifierOutput output = make_empty_output();
    CATCH_CHECK(utils::has_shape(output.base_change, {0, calling::NUM_BASE_CHANGES}));
    CATCH_CHECK(utils::has_shape(output.genotype, {0, calling::NUM_GENOTYPES}));
    CATCH_CHECK(utils::has_shape(output.indel_length_1, {0, calling::NUM_INDEL_LEN_CLASSES}));
    CATCH_CHECK(utils::has_shape(output.indel_length_2, {0, calling::NUM_INDEL_LEN_CLASSES}));
}

DEFINE_TEST("make_owned_output takes a float snapshot") {
    at::Tensor base_change = at::ones({2, calling::NUM_BASE_CHANGES}, at::kDouble);
    // Non-contiguous view.
    const at::Tensor genotype = at::zeros({calling::NUM_GENOTYPES, 2}).t();
    at::Tensor indel = at::zeros({2, calling::NUM_INDEL_LEN_CLASSES});

    const ClassifierOutput output = make_owned_output(base_change, genotype, indel, indel);

    CATCH_CHECK(output.base_change.scalar_type() == at::kFloat);
    CATCH_CHECK(output.genotype.is_contiguous());
    CATCH_CHECK(utils::has_shape(output.genotype, {2, calling::NUM_GENOTYPES}));

    // Later changes to the inputs are not visible in the output.
    base_change.fill_(5.0);
    CATCH_CHECK(output.base_change[0][0].item<float>() == 1.0f);

    indel.fill_(3.0f);
    CATCH_CHECK(output.indel_length_1.sum().item<float>() == 0.0f);
}

DEFINE_TEST("ClassifierTorchScript with a missing model throws") {
    CATCH_CHECK_THROWS(ClassifierTorchScript("nonexistent_model_for_testing.pt"));
}

}  // namespace clarion::pipeline::tests
