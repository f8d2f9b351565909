#include "TestUtils.h"
#include "calling/constants.h"
#include "calling/vcf_writer.h"
#include "pipeline/site_caller.h"

#include <ATen/ATen.h>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define CUT_TAG "[clarion::pipeline::site_caller]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

namespace clarion::pipeline::tests {

namespace {

using calling::BaseChange;
using calling::Genotype;
using clarion::tests::make_probs;
using clarion::tests::make_site;
using clarion::tests::make_window;

struct SiteInput {
    calling::Site site;
    calling::ProbabilityBundle probs;
};

template <size_t N>
at::Tensor stack_rows(const std::vector<SiteInput>& sites,
                      std::array<float, N> calling::ProbabilityBundle::*field) {
    at::Tensor ret = at::zeros({static_cast<int64_t>(std::size(sites)), static_cast<int64_t>(N)});
    float* data = ret.data_ptr<float>();
    for (size_t i = 0; i < std::size(sites); ++i) {
        const std::array<float, N>& row = sites[i].probs.*field;
        std::copy(std::cbegin(row), std::cend(row), data + i * N);
    }
    return ret;
}

InputBatch make_batch(const std::vector<SiteInput>& sites) {
    constexpr int64_t NUM_VALUES = calling::EvidenceTensor::NUM_VALUES;

    InputBatch ret;
    ret.size = static_cast<int64_t>(std::size(sites));
    ret.is_last = true;
    ret.evidence = at::zeros({ret.size, calling::WINDOW_LEN, calling::NUM_NUCLEOTIDE_CHANNELS,
                              calling::NUM_EVIDENCE_CATEGORIES});
    float* data = ret.evidence.data_ptr<float>();
    for (int64_t i = 0; i < ret.size; ++i) {
        const calling::Site& site = sites[i].site;
        std::copy(std::cbegin(site.evidence.data()), std::cend(site.evidence.data()),
                  data + i * NUM_VALUES);
        std::ostringstream oss;
        oss << site.locus;
        ret.descriptors.emplace_back(oss.str());
    }
    return ret;
}

ClassifierOutput make_output(const std::vector<SiteInput>& sites) {
    return ClassifierOutput{
            stack_rows(sites, &calling::ProbabilityBundle::base_change),
            stack_rows(sites, &calling::ProbabilityBundle::genotype),
            stack_rows(sites, &calling::ProbabilityBundle::indel_length_1),
            stack_rows(sites, &calling::ProbabilityBundle::indel_length_2),
    };
}

std::vector<std::string> data_lines(const std::string& text) {
    std::vector<std::string> ret;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && (line[0] != '#')) {
            ret.emplace_back(line);
        }
    }
    return ret;
}

std::vector<SiteInput> make_sites() {
    return {
            // Homozygous SNP.
            SiteInput{make_site("chr1", 9, make_window('A'), 20.0f),
                      make_probs(BaseChange::CC, Genotype::HOMO_VARIANT, 0, 0)},
            // Reference.
            SiteInput{make_site("chr1", 19, make_window('G'), 20.0f),
                      make_probs(BaseChange::GG, Genotype::HOMO_REFERENCE, 0, 0)},
            // No coverage.
            SiteInput{make_site("chr1", 29, make_window('T'), 0.0f),
                      make_probs(BaseChange::AA, Genotype::HOMO_VARIANT, 0, 0)},
    };
}

}  // namespace

DEFINE_TEST("call_batch writes records of variant sites") {
    const std::vector<SiteInput> sites = make_sites();

    std::ostringstream oss;
    calling::VcfWriter writer(oss, {{"chr1", 1000}}, "SAMPLE");
    const calling::EmptyAlignmentSource source;
    SiteCaller caller(writer, source, calling::CallerOptions());

    const SiteCallerStats stats = caller.call_batch(make_batch(sites), make_output(sites));

    CATCH_CHECK(stats.num_sites == 3);
    CATCH_CHECK(stats.num_records == 1);
    CATCH_CHECK(stats.num_reference_dropped == 1);
    CATCH_CHECK(stats.num_skipped == 1);

    const std::vector<std::string> lines = data_lines(oss.str());
    CATCH_REQUIRE(std::size(lines) == 1);
    CATCH_CHECK(lines.front().rfind("chr1\t10\t.\tA\tC\t", 0) == 0);
    CATCH_CHECK(lines.front().find("\t1/1:") != std::string::npos);
}

DEFINE_TEST("call_batch with reference calls") {
    const std::vector<SiteInput> sites = make_sites();

    std::ostringstream oss;
    calling::VcfWriter writer(oss, {{"chr1", 1000}}, "SAMPLE");
    const calling::EmptyAlignmentSource source;
    calling::CallerOptions options;
    options.show_reference = true;
    SiteCaller caller(writer, source, options);

    const SiteCallerStats stats = caller.call_batch(make_batch(sites), make_output(sites));

    CATCH_CHECK(stats.num_records == 2);
    CATCH_CHECK(stats.num_reference_dropped == 0);

    const std::vector<std::string> lines = data_lines(oss.str());
    CATCH_REQUIRE(std::size(lines) == 2);
    CATCH_CHECK(lines[1].rfind("chr1\t20\t.\tG\tG\t", 0) == 0);
    CATCH_CHECK(lines[1].find("\t0/0:") != std::string::npos);
}

DEFINE_TEST("call_batch in debug mode writes a trace per site") {
    const std::vector<SiteInput> sites = make_sites();

    std::ostringstream oss;
    calling::VcfWriter writer(oss, {}, "SAMPLE");
    const calling::EmptyAlignmentSource source;
    calling::CallerOptions options;
    options.debug = true;
    SiteCaller caller(writer, source, options);

    caller.call_batch(make_batch(sites), make_output(sites));

    const std::vector<std::string> lines = data_lines(oss.str());
    CATCH_REQUIRE(std::size(lines) == 3);
    CATCH_CHECK(lines[0].substr(std::size(lines[0]) - 13) == "Normal output");
    CATCH_CHECK(lines[1].substr(std::size(lines[1]) - 9) == "Reference");
    CATCH_CHECK(lines[2].substr(std::size(lines[2]) - 18) == "Read Depth is zero");
}

DEFINE_TEST("call_batch accumulates the totals") {
    const std::vector<SiteInput> sites = make_sites();

    std::ostringstream oss;
    calling::VcfWriter writer(oss, {}, "SAMPLE");
    const calling::EmptyAlignmentSource source;
    SiteCaller caller(writer, source, calling::CallerOptions());

    caller.call_batch(make_batch(sites), make_output(sites));
    caller.call_batch(make_batch(sites), make_output(sites));

    CATCH_CHECK(caller.total_stats().num_sites == 6);
    CATCH_CHECK(caller.total_stats().num_records == 2);
    CATCH_CHECK(caller.total_stats().num_reference_dropped == 2);
    CATCH_CHECK(caller.total_stats().num_skipped == 2);
}

DEFINE_TEST("call_batch rejects predictions of a different batch") {
    const std::vector<SiteInput> sites = make_sites();
    const std::vector<SiteInput> fewer(std::cbegin(sites), std::cbegin(sites) + 2);

    std::ostringstream oss;
    calling::VcfWriter writer(oss, {}, "SAMPLE");
    const calling::EmptyAlignmentSource source;
    SiteCaller caller(writer, source, calling::CallerOptions());

    CATCH_CHECK_THROWS(caller.call_batch(make_batch(sites), make_output(fewer)));

    CATCH_SECTION("Wrong number of classes") {
        ClassifierOutput output = make_output(sites);
        output.genotype = at::zeros({3, 5});
        CATCH_CHECK_THROWS(caller.call_batch(make_batch(sites), output));
    }

    CATCH_SECTION("Evidence with fewer nucleotide channels") {
        InputBatch batch = make_batch(sites);
        batch.evidence = at::zeros({3, calling::WINDOW_LEN, 4, calling::NUM_EVIDENCE_CATEGORIES});
        CATCH_CHECK_THROWS_AS(caller.call_batch(batch, make_output(sites)), std::runtime_error);
        CATCH_CHECK(caller.total_stats().num_sites == 0);
    }

    CATCH_SECTION("Evidence flattened per site") {
        InputBatch batch = make_batch(sites);
        batch.evidence = batch.evidence.reshape({3, calling::EvidenceTensor::NUM_VALUES});
        CATCH_CHECK_THROWS_AS(caller.call_batch(batch, make_output(sites)), std::runtime_error);
    }
}

DEFINE_TEST("call_batch with an empty batch") {
    std::ostringstream oss;
    calling::VcfWriter writer(oss, {}, "SAMPLE");
    const calling::EmptyAlignmentSource source;
    SiteCaller caller(writer, source, calling::CallerOptions());

    const SiteCallerStats stats = caller.call_batch(make_batch({}), make_empty_output());
    CATCH_CHECK(stats.num_sites == 0);
}

}  // namespace clarion::pipeline::tests
