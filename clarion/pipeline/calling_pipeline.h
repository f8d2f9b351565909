#pragma once

#include "batch_source.h"
#include "classifier.h"

#include <cstdint>
#include <functional>
#include <string_view>

namespace clarion::pipeline {

/**
 * \brief States of the double-buffered pipeline.
 *          - FILLING: a classified batch waits for decoding and another batch is available
 *                      for classification.
 *          - DRAINING: only the last classified batch remains to be decoded.
 *          - DONE: everything was decoded.
 */
enum class PipelineState {
    FILLING,
    DRAINING,
    DONE,
};

std::string_view pipeline_state_name(PipelineState state);

struct PipelineStats {
    int64_t num_batches = 0;
    int64_t num_sites = 0;
    int64_t num_classifier_calls = 0;
};

/**
 * \brief Overlaps classification of one batch with decoding of the previous one.
 *
 * At most two batches are in flight. In every step the decode of the current batch and the
 * classification of the next batch run on two worker threads, while the calling thread pulls
 * the following batch from the source. Both tasks are joined before the next step, so decodes
 * happen strictly in the order the batches arrive and a batch is never decoded while it is
 * being classified.
 */
class CallingPipeline {
public:
    using DecodeFn = std::function<void(const InputBatch&, const ClassifierOutput&)>;

    CallingPipeline(Classifier& classifier, BatchSource& source, DecodeFn decode);

    /**
     * \brief Runs until the source is exhausted. Exceptions thrown by the source, the
     *          classifier or the decode function are rethrown once both workers are joined.
     */
    PipelineStats run();

private:
    ClassifierOutput classify(const InputBatch& batch);

    Classifier& m_classifier;
    BatchSource& m_source;
    DecodeFn m_decode;
    int64_t m_num_classifier_calls = 0;
};

}  // namespace clarion::pipeline
