#include "calling_pipeline.h"

#include "utils/timer_high_res.h"

#include <cxxpool.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <optional>
#include <utility>

namespace clarion::pipeline {

namespace {

/// A batch together with its predictions.
struct ClassifiedBatch {
    InputBatch batch;
    ClassifierOutput output;
};

}  // namespace

std::string_view pipeline_state_name(const PipelineState state) {
    switch (state) {
    case PipelineState::FILLING:
        return "FILLING";
    case PipelineState::DRAINING:
        return "DRAINING";
    case PipelineState::DONE:
        return "DONE";
    }
    return "UNKNOWN";
}

CallingPipeline::CallingPipeline(Classifier& classifier, BatchSource& source, DecodeFn decode)
        : m_classifier{classifier}, m_source{source}, m_decode{std::move(decode)} {}

ClassifierOutput CallingPipeline::classify(const InputBatch& batch) {
    if (batch.size == 0) {
        return make_empty_output();
    }
    timer::TimerHighRes timer;
    ClassifierOutput ret = m_classifier.predict(batch.evidence);
    ++m_num_classifier_calls;
    spdlog::trace("[CallingPipeline] Classified {} sites in {} ms.", batch.size,
                  timer.GetElapsedMilliseconds());
    return ret;
}

PipelineStats CallingPipeline::run() {
    PipelineStats stats;
    m_num_classifier_calls = 0;

    const auto account = [&stats](const InputBatch& batch) {
        if (batch.size > 0) {
            ++stats.num_batches;
            stats.num_sites += batch.size;
        }
    };

    // First batch is classified up front, nothing can overlap with it yet.
    ClassifiedBatch current;
    current.batch = m_source.next_batch();
    current.output = classify(current.batch);
    account(current.batch);

    std::optional<InputBatch> next;
    if (!current.batch.is_last) {
        next = m_source.next_batch();
    }

    PipelineState state = next ? PipelineState::FILLING : PipelineState::DRAINING;

    cxxpool::thread_pool pool{2};

    while (state != PipelineState::DONE) {
        spdlog::trace("[CallingPipeline] State: {}", pipeline_state_name(state));

        if (state == PipelineState::DRAINING) {
            m_decode(current.batch, current.output);
            state = PipelineState::DONE;
            continue;
        }

        account(*next);

        std::future<void> decode_future = pool.push(
                [this](const ClassifiedBatch& cb) { m_decode(cb.batch, cb.output); },
                std::cref(current));
        std::future<ClassifierOutput> classify_future =
                pool.push([this](const InputBatch& batch) { return classify(batch); },
                          std::cref(*next));

        // Prefetch while both workers are busy.
        std::optional<InputBatch> following;
        std::exception_ptr fetch_error;
        if (!next->is_last) {
            try {
                following = m_source.next_batch();
            } catch (const std::exception&) {
                fetch_error = std::current_exception();
            }
        }

        decode_future.wait();
        classify_future.wait();

        decode_future.get();
        ClassifierOutput next_output = classify_future.get();
        if (fetch_error) {
            std::rethrow_exception(fetch_error);
        }

        current = ClassifiedBatch{std::move(*next), std::move(next_output)};
        next = std::move(following);

        state = next ? PipelineState::FILLING : PipelineState::DRAINING;
    }

    stats.num_classifier_calls = m_num_classifier_calls;

    spdlog::debug("[CallingPipeline] Processed {} batches with {} sites, {} classifier calls.",
                  stats.num_batches, stats.num_sites, stats.num_classifier_calls);

    return stats;
}

}  // namespace clarion::pipeline
