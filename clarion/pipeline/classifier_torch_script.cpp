#include "classifier_torch_script.h"

#include "calling/base_change.h"
#include "calling/constants.h"
#include "torch_utils/tensor_utils.h"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace clarion::pipeline {

namespace {

void check_output_shape(const at::Tensor& tensor,
                        const int64_t batch_size,
                        const int64_t num_classes,
                        const std::string& name) {
    if (!utils::has_shape(tensor, {batch_size, num_classes})) {
        throw std::runtime_error("Classifier output '" + name + "' has shape " +
                                 utils::tensor_shape_as_string(tensor) + ", expected [" +
                                 std::to_string(batch_size) + ", " + std::to_string(num_classes) +
                                 "].");
    }
}

}  // namespace

ClassifierTorchScript::ClassifierTorchScript(const std::filesystem::path& model_path) {
    try {
        spdlog::debug("Loading model from file: {}", model_path.string());
        m_module = torch::jit::load(model_path.string());
        m_module.eval();
    } catch (const c10::Error& e) {
        throw std::runtime_error("Error loading model from " + model_path.string() +
                                 " with error: " + e.what());
    }
}

ClassifierOutput ClassifierTorchScript::predict(const at::Tensor& evidence) {
    const int64_t batch_size = evidence.size(0);
    if (batch_size == 0) {
        return make_empty_output();
    }

    at::InferenceMode inference_mode_guard;

    const torch::IValue output = m_module.forward({evidence});

    if (!output.isTuple()) {
        throw std::runtime_error("Classifier returned an unsupported output type.");
    }

    const auto tuple = output.toTuple();
    const auto& elements = tuple->elements();
    if (std::size(elements) != 4) {
        throw std::runtime_error("Classifier returned " + std::to_string(std::size(elements)) +
                                 " outputs, expected 4.");
    }

    const at::Tensor base_change = elements[0].toTensor();
    const at::Tensor genotype = elements[1].toTensor();
    const at::Tensor indel_length_1 = elements[2].toTensor();
    const at::Tensor indel_length_2 = elements[3].toTensor();

    check_output_shape(base_change, batch_size, calling::NUM_BASE_CHANGES, "base_change");
    check_output_shape(genotype, batch_size, calling::NUM_GENOTYPES, "genotype");
    check_output_shape(indel_length_1, batch_size, calling::NUM_INDEL_LEN_CLASSES,
                       "indel_length_1");
    check_output_shape(indel_length_2, batch_size, calling::NUM_INDEL_LEN_CLASSES,
                       "indel_length_2");

    return make_owned_output(base_change, genotype, indel_length_1, indel_length_2);
}

}  // namespace clarion::pipeline
