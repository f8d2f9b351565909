#include "TestUtils.h"
#include "calling/site.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <sstream>
#include <string>

#define CUT_TAG "[clarion::calling::site]"
#define DEFINE_TEST(name) CATCH_TEST_CASE(CUT_TAG " " name, CUT_TAG)

namespace clarion::calling::tests {

DEFINE_TEST("parse_site_descriptor") {
    const std::string window = clarion::tests::make_window('G', 'C');

    CATCH_SECTION("Positions are converted to zero-based") {
        const SiteLocus locus = parse_site_descriptor("chr20:1000:" + window);
        CATCH_CHECK(locus.contig == "chr20");
        CATCH_CHECK(locus.position == 999);
        CATCH_CHECK(locus.reference_window == window);
    }

    CATCH_SECTION("Contig names may contain colons") {
        const SiteLocus locus = parse_site_descriptor("HLA-A*01:01:01:01:5:" + window);
        CATCH_CHECK(locus.contig == "HLA-A*01:01:01:01");
        CATCH_CHECK(locus.position == 4);
    }

    CATCH_SECTION("The window is upper-cased") {
        const SiteLocus locus =
                parse_site_descriptor("chr1:1:" + clarion::tests::make_window('g', 'c'));
        CATCH_CHECK(locus.reference_window == window);
    }

    CATCH_SECTION("Malformed descriptors throw") {
        CATCH_CHECK_THROWS(parse_site_descriptor(""));
        CATCH_CHECK_THROWS(parse_site_descriptor(window));
        CATCH_CHECK_THROWS(parse_site_descriptor("chr1:" + window));
        CATCH_CHECK_THROWS(parse_site_descriptor("chr1:abc:" + window));
        CATCH_CHECK_THROWS(parse_site_descriptor("chr1:0:" + window));
        CATCH_CHECK_THROWS(parse_site_descriptor("chr1:10:ACGT"));
        CATCH_CHECK_THROWS(parse_site_descriptor("chr1:10:" + window + "A"));
    }
}

DEFINE_TEST("print SiteLocus") {
    const SiteLocus locus{"chr2", 41, clarion::tests::make_window('T')};
    std::ostringstream oss;
    oss << locus;
    CATCH_CHECK(oss.str() == "chr2:42:" + locus.reference_window);
}

DEFINE_TEST("EvidenceTensor layout") {
    EvidenceTensor evidence;
    CATCH_CHECK(static_cast<int64_t>(std::size(evidence.data())) == EvidenceTensor::NUM_VALUES);

    // Forward and reverse strand channel of the same base.
    evidence.at(FLANK, 2, EvidenceCategory::INSERT) = 3.0f;
    evidence.at(FLANK, 2 + NUM_BASES, EvidenceCategory::INSERT) = 4.0f;
    evidence.at(FLANK, 0, EvidenceCategory::INSERT) = 1.0f;
    evidence.at(FLANK, 0, EvidenceCategory::DELETE) = 10.0f;

    CATCH_CHECK(evidence.category_sum(FLANK, EvidenceCategory::INSERT) == 8.0f);
    CATCH_CHECK(evidence.category_sum(FLANK, EvidenceCategory::DELETE) == 10.0f);
    CATCH_CHECK(evidence.category_sum(FLANK + 1, EvidenceCategory::INSERT) == 0.0f);

    const std::array<float, NUM_BASES> merged =
            evidence.strand_merged(FLANK, EvidenceCategory::INSERT);
    CATCH_CHECK(merged == std::array<float, NUM_BASES>{1.0f, 0.0f, 7.0f, 0.0f});

    // Row-major [position][channel][category].
    const int64_t flat = (static_cast<int64_t>(FLANK) * NUM_NUCLEOTIDE_CHANNELS + 2) *
                                 NUM_EVIDENCE_CATEGORIES +
                         static_cast<int32_t>(EvidenceCategory::INSERT);
    CATCH_CHECK(evidence.data()[flat] == 3.0f);

    const EvidenceTensor copy(std::data(evidence.data()));
    CATCH_CHECK(copy.data() == evidence.data());
}

}  // namespace clarion::calling::tests
