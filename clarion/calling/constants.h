#pragma once

#include <cstdint>

namespace clarion::calling {

// Number of reference positions on each side of the candidate site in the evidence window.
constexpr int32_t FLANK = 16;
constexpr int32_t WINDOW_LEN = 2 * FLANK + 1;

// Nucleotide channels of the evidence tensor: A, C, G, T on the forward strand, then
// a, c, g, t on the reverse strand.
constexpr int32_t NUM_NUCLEOTIDE_CHANNELS = 8;
constexpr int32_t NUM_BASES = 4;

// Largest indel length the classifier predicts. Length vectors cover [-MAX, +MAX].
constexpr int32_t MAX_INDEL_LEN = 16;
constexpr int32_t INDEL_LEN_ZERO_OFFSET = MAX_INDEL_LEN;
constexpr int32_t NUM_INDEL_LEN_CLASSES = 2 * MAX_INDEL_LEN + 1;

// Indels at least this long may extend past the window and need their bases recovered
// from the alignments or inferred.
constexpr int32_t MIN_LEN_NEEDS_INFERENCE = MAX_INDEL_LEN;
constexpr int32_t MAX_LEN_NEEDS_INFERENCE = 50;

// A position stays part of an inferred indel if its indel support is at least this fraction
// of the reference support.
constexpr float INFERRED_INDEL_MIN_FRACTION = 0.125f;

// Pileup settings for the alignment source.
constexpr int32_t PILEUP_MAX_DEPTH = 250;
constexpr uint16_t PILEUP_FLAG_FILTER = 2308;  // Unmapped | secondary | supplementary.

}  // namespace clarion::calling
