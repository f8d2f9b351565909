#include "site_caller.h"

#include "calling/constants.h"
#include "calling/hypothesis_scorer.h"
#include "calling/record_composer.h"
#include "calling/site.h"
#include "torch_utils/tensor_utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace clarion::pipeline {

namespace {

void check_batch_shapes(const InputBatch& batch, const ClassifierOutput& output) {
    const auto rows = [](const at::Tensor& t) -> int64_t {
        return (t.defined() && (t.dim() > 0)) ? t.size(0) : 0;
    };

    const int64_t n = batch.size;
    const bool consistent = (rows(batch.evidence) == n) &&
                            (static_cast<int64_t>(std::size(batch.descriptors)) == n) &&
                            (rows(output.base_change) == n) && (rows(output.genotype) == n) &&
                            (rows(output.indel_length_1) == n) &&
                            (rows(output.indel_length_2) == n);

    if (!consistent) {
        throw std::runtime_error(
                "Inconsistent shape between input tensor and output predictions " +
                std::to_string(n) + "/" + std::to_string(rows(output.base_change)));
    }

    if ((n > 0) && !utils::has_shape(batch.evidence,
                                     {n, calling::WINDOW_LEN, calling::NUM_NUCLEOTIDE_CHANNELS,
                                      calling::NUM_EVIDENCE_CATEGORIES})) {
        throw std::runtime_error("Evidence tensor has shape " +
                                 utils::tensor_shape_as_string(batch.evidence) + ", expected [" +
                                 std::to_string(n) + ", " + std::to_string(calling::WINDOW_LEN) +
                                 ", " + std::to_string(calling::NUM_NUCLEOTIDE_CHANNELS) + ", " +
                                 std::to_string(calling::NUM_EVIDENCE_CATEGORIES) + "].");
    }

    const bool widths_ok =
            (n == 0) ||
            (utils::has_shape(output.base_change, {n, calling::NUM_BASE_CHANGES}) &&
             utils::has_shape(output.genotype, {n, calling::NUM_GENOTYPES}) &&
             utils::has_shape(output.indel_length_1, {n, calling::NUM_INDEL_LEN_CLASSES}) &&
             utils::has_shape(output.indel_length_2, {n, calling::NUM_INDEL_LEN_CLASSES}));
    if (!widths_ok) {
        throw std::runtime_error("Classifier output has an unexpected number of classes.");
    }
}

template <size_t N>
void copy_row(const at::Tensor& tensor, const int64_t row, std::array<float, N>& out) {
    const float* data = tensor.data_ptr<float>() + row * static_cast<int64_t>(N);
    std::copy(data, data + N, std::begin(out));
}

}  // namespace

SiteCaller::SiteCaller(calling::VcfWriter& writer,
                       const calling::AlignmentSource& source,
                       const calling::CallerOptions& options)
        : m_writer{writer}, m_source{source}, m_options{options} {}

SiteCallerStats SiteCaller::call_batch(const InputBatch& batch, const ClassifierOutput& output) {
    check_batch_shapes(batch, output);

    SiteCallerStats stats;

    if (batch.size == 0) {
        return stats;
    }

    const at::Tensor evidence = batch.evidence.to(at::kCPU, at::kFloat).contiguous();
    const float* evidence_data = evidence.data_ptr<float>();

    const at::Tensor base_change = output.base_change.to(at::kFloat).contiguous();
    const at::Tensor genotype = output.genotype.to(at::kFloat).contiguous();
    const at::Tensor indel_length_1 = output.indel_length_1.to(at::kFloat).contiguous();
    const at::Tensor indel_length_2 = output.indel_length_2.to(at::kFloat).contiguous();

    for (int64_t i = 0; i < batch.size; ++i) {
        ++stats.num_sites;

        calling::ProbabilityBundle probs;
        copy_row(base_change, i, probs.base_change);
        copy_row(genotype, i, probs.genotype);
        copy_row(indel_length_1, i, probs.indel_length_1);
        copy_row(indel_length_2, i, probs.indel_length_2);

        const calling::Site site{
                calling::parse_site_descriptor(batch.descriptors[i]),
                calling::EvidenceTensor(evidence_data + i * calling::EvidenceTensor::NUM_VALUES)};

        const calling::HypothesisScores scores =
                calling::score_hypotheses(probs, site.reference_base());

        if (!calling::should_emit(scores.winner, m_options)) {
            ++stats.num_reference_dropped;
            continue;
        }

        const calling::ComposeResult result =
                calling::compose_record(site, probs, scores, m_source, m_options);

        if (!result.record) {
            ++stats.num_skipped;
            spdlog::debug("[SiteCaller] Skipping site {}:{}. Reason: {}", site.locus.contig,
                          site.locus.position + 1, result.skip_reason);
            if (m_options.debug) {
                m_writer.write_debug_trace(site.locus, probs, result.skip_reason);
            }
            continue;
        }

        ++stats.num_records;

        if (m_options.debug) {
            const bool is_reference = (scores.winner == calling::Hypothesis::REFERENCE);
            m_writer.write_debug_trace(site.locus, probs,
                                       is_reference ? "Reference" : "Normal output");
        } else {
            m_writer.write_record(*result.record);
        }
    }

    m_total.num_sites += stats.num_sites;
    m_total.num_records += stats.num_records;
    m_total.num_reference_dropped += stats.num_reference_dropped;
    m_total.num_skipped += stats.num_skipped;

    return stats;
}

}  // namespace clarion::pipeline
