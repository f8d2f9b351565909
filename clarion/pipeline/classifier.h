#pragma once

#include <ATen/ATen.h>

#include <cstdint>

namespace clarion::pipeline {

/**
 * \brief Probabilities predicted for one batch. All tensors are owned, contiguous, float32
 *          and on the CPU, so the output stays valid while the classifier runs the next batch.
 */
struct ClassifierOutput {
    at::Tensor base_change;     // [N, NUM_BASE_CHANGES]
    at::Tensor genotype;        // [N, NUM_GENOTYPES]
    at::Tensor indel_length_1;  // [N, NUM_INDEL_LEN_CLASSES]
    at::Tensor indel_length_2;  // [N, NUM_INDEL_LEN_CLASSES]
};

/// Empty output for a batch without sites.
ClassifierOutput make_empty_output();

/// Detaches the tensors and converts them into an owned CPU float32 snapshot.
ClassifierOutput make_owned_output(const at::Tensor& base_change,
                                   const at::Tensor& genotype,
                                   const at::Tensor& indel_length_1,
                                   const at::Tensor& indel_length_2);

class Classifier {
public:
    virtual ~Classifier() = default;

    /**
     * \brief Predicts the probabilities of a batch of evidence tensors.
     * \param evidence Float tensor of shape [N, WINDOW_LEN, NUM_NUCLEOTIDE_CHANNELS, NUM_EVIDENCE_CATEGORIES].
     */
    virtual ClassifierOutput predict(const at::Tensor& evidence) = 0;
};

}  // namespace clarion::pipeline
