#pragma once

#include "classifier.h"

#include <ATen/ATen.h>
#include <torch/script.h>

#include <filesystem>

namespace clarion::pipeline {

/**
 * \brief Classifier backed by a TorchScript module. The module's forward() takes the evidence
 *          batch and returns a tuple of four tensors: base-change, genotype and the two indel
 *          length probabilities.
 */
class ClassifierTorchScript : public Classifier {
public:
    ClassifierTorchScript(const std::filesystem::path& model_path);

    ClassifierOutput predict(const at::Tensor& evidence) override;

private:
    torch::jit::script::Module m_module;
};

}  // namespace clarion::pipeline
