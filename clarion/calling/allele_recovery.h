#pragma once

#include "alignment_source.h"
#include "site.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace clarion::calling {

/// Indel bases recovered for a site.
struct RecoveredIndel {
    std::string bases;
    int32_t length = 0;
    // The length was extrapolated from the evidence window instead of being observed.
    bool inferred = false;
};

/// Lengths at the classifier ceiling may be longer in reality, so the search is widened.
int32_t adaptive_max_length(int32_t length);

/**
 * \brief Most frequent inserted sequence in the reads at the site column, restricted to
 *          insertion lengths in [min_len, max_len] and excluding `ignore`.
 *          Ties are resolved in favour of the sequence observed first.
 *          Returns an empty string if nothing qualifies.
 */
std::string most_frequent_insertion(const AlignmentSource& source,
                                    const SiteLocus& locus,
                                    int32_t min_len,
                                    int32_t max_len,
                                    std::string_view ignore);

/**
 * \brief Same as most_frequent_insertion, for deletions. The deleted bases are taken from
 *          the reference, starting right after the site.
 */
std::string most_frequent_deletion(const AlignmentSource& source,
                                   const SiteLocus& locus,
                                   int32_t min_len,
                                   int32_t max_len);

/// Argmax base of the strand merged insert channel at each offset after the site.
std::string insertion_bases_from_evidence(const EvidenceTensor& evidence, int32_t length);

/**
 * \brief Walks the window downstream of the site and collects the argmax inserted base for as
 *          long as the position is within the minimum span or the insertion support is at
 *          least INFERRED_INDEL_MIN_FRACTION of the reference support.
 */
std::string infer_insertion_bases(const EvidenceTensor& evidence);

/// Same walk as infer_insertion_bases, on the delete channel. Returns the walked length.
int32_t infer_deletion_length(const EvidenceTensor& evidence);

RecoveredIndel recover_insertion(const Site& site,
                                 int32_t length,
                                 const AlignmentSource& source,
                                 bool use_alignment_for_all);

RecoveredIndel recover_deletion(const Site& site,
                                int32_t length,
                                const AlignmentSource& source,
                                bool use_alignment_for_all);

}  // namespace clarion::calling
