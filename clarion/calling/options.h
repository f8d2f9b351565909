#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace clarion::calling {

/// Decoding rules of the site caller.
struct CallerOptions {
    // Records with a quality at or above this are PASS, the rest LowQual. No filtering if unset.
    std::optional<int32_t> pass_min_qual;

    // Emit homozygous reference calls.
    bool show_reference = false;

    // Write a probability trace line per site instead of records.
    bool debug = false;

    // Recover the bases of every indel from the alignments, regardless of its length.
    bool use_alignment_for_all_indels = false;

    std::string sample_name{"SAMPLE"};
};

}  // namespace clarion::calling
