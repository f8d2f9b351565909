#include "classifier.h"

#include "calling/base_change.h"
#include "calling/constants.h"

namespace clarion::pipeline {

namespace {

at::Tensor to_owned(const at::Tensor& tensor) {
    return tensor.detach().to(at::kCPU, at::kFloat).contiguous().clone();
}

}  // namespace

ClassifierOutput make_empty_output() {
    return ClassifierOutput{
            at::empty({0, calling::NUM_BASE_CHANGES}, at::kFloat),
            at::empty({0, calling::NUM_GENOTYPES}, at::kFloat),
            at::empty({0, calling::NUM_INDEL_LEN_CLASSES}, at::kFloat),
            at::empty({0, calling::NUM_INDEL_LEN_CLASSES}, at::kFloat),
    };
}

ClassifierOutput make_owned_output(const at::Tensor& base_change,
                                   const at::Tensor& genotype,
                                   const at::Tensor& indel_length_1,
                                   const at::Tensor& indel_length_2) {
    return ClassifierOutput{
            to_owned(base_change),
            to_owned(genotype),
            to_owned(indel_length_1),
            to_owned(indel_length_2),
    };
}

}  // namespace clarion::pipeline
