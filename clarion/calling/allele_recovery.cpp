#include "allele_recovery.h"

#include "constants.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clarion::calling {

namespace {

/// Counts strings and remembers the order in which they were first seen.
class OrderedCounter {
public:
    void add(const std::string& key) {
        const auto it = m_index.find(key);
        if (it == std::end(m_index)) {
            m_index.emplace(key, std::size(m_counts));
            m_counts.emplace_back(key, 1);
        } else {
            ++m_counts[it->second].second;
        }
    }

    std::string most_frequent() const {
        const std::pair<std::string, int64_t>* best = nullptr;
        for (const auto& item : m_counts) {
            if (!best || (item.second > best->second)) {
                best = &item;
            }
        }
        return best ? best->first : std::string{};
    }

private:
    std::unordered_map<std::string, size_t> m_index;
    std::vector<std::pair<std::string, int64_t>> m_counts;
};

int32_t argmax_base(const std::array<float, NUM_BASES>& values) {
    return static_cast<int32_t>(std::distance(
            std::begin(values), std::max_element(std::begin(values), std::end(values))));
}

/// True while the walk downstream of the site should continue at window position `pos`.
bool continue_walk(const EvidenceTensor& evidence,
                   const int32_t pos,
                   const EvidenceCategory category) {
    if (pos < (FLANK + MIN_LEN_NEEDS_INFERENCE)) {
        return true;
    }
    return evidence.category_sum(pos, category) >=
           (INFERRED_INDEL_MIN_FRACTION *
            evidence.category_sum(pos, EvidenceCategory::REFERENCE));
}

std::string deletion_bases_from_window(const SiteLocus& locus, const int32_t length) {
    const int32_t start = FLANK + 1;
    const int32_t available = static_cast<int32_t>(std::size(locus.reference_window)) - start;
    const int32_t len = std::clamp(length, 0, std::max(0, available));
    return locus.reference_window.substr(start, len);
}

}  // namespace

int32_t adaptive_max_length(const int32_t length) {
    return (length >= MIN_LEN_NEEDS_INFERENCE) ? MAX_LEN_NEEDS_INFERENCE : length;
}

std::string most_frequent_insertion(const AlignmentSource& source,
                                    const SiteLocus& locus,
                                    const int32_t min_len,
                                    const int32_t max_len,
                                    const std::string_view ignore) {
    const std::vector<std::string> signatures =
            source.pileup_signatures(locus.contig, locus.position, locus.position + 1);

    OrderedCounter counter;
    for (const std::string& signature : signatures) {
        const std::optional<IndelSignature> indel = parse_indel_signature(signature);
        if (!indel || (indel->type != IndelType::INSERTION)) {
            continue;
        }
        if ((indel->length < min_len) || (indel->length > max_len) || (indel->bases == ignore)) {
            continue;
        }
        counter.add(indel->bases);
    }

    return counter.most_frequent();
}

std::string most_frequent_deletion(const AlignmentSource& source,
                                   const SiteLocus& locus,
                                   const int32_t min_len,
                                   const int32_t max_len) {
    const std::vector<std::string> signatures =
            source.pileup_signatures(locus.contig, locus.position, locus.position + 1);

    // Many reads share the same deletion, fetch each length only once.
    std::unordered_map<int32_t, std::string> fetched;

    OrderedCounter counter;
    for (const std::string& signature : signatures) {
        const std::optional<IndelSignature> indel = parse_indel_signature(signature);
        if (!indel || (indel->type != IndelType::DELETION)) {
            continue;
        }
        if ((indel->length < min_len) || (indel->length > max_len)) {
            continue;
        }
        auto it = fetched.find(indel->length);
        if (it == std::end(fetched)) {
            const int64_t start = locus.position + 1;
            it = fetched
                         .emplace(indel->length,
                                  source.fetch_reference(locus.contig, start, start + indel->length))
                         .first;
        }
        counter.add(it->second);
    }

    return counter.most_frequent();
}

std::string insertion_bases_from_evidence(const EvidenceTensor& evidence, const int32_t length) {
    const int32_t len = std::clamp(length, 0, FLANK);
    std::string ret;
    ret.reserve(len);
    for (int32_t pos = FLANK + 1; pos <= (FLANK + len); ++pos) {
        ret += index_to_base(argmax_base(evidence.strand_merged(pos, EvidenceCategory::INSERT)));
    }
    return ret;
}

std::string infer_insertion_bases(const EvidenceTensor& evidence) {
    std::string ret;
    for (int32_t pos = FLANK + 1; pos <= (2 * FLANK); ++pos) {
        if (!continue_walk(evidence, pos, EvidenceCategory::INSERT)) {
            break;
        }
        ret += index_to_base(argmax_base(evidence.strand_merged(pos, EvidenceCategory::INSERT)));
    }
    return ret;
}

int32_t infer_deletion_length(const EvidenceTensor& evidence) {
    int32_t ret = 0;
    for (int32_t pos = FLANK + 1; pos <= (2 * FLANK); ++pos) {
        if (!continue_walk(evidence, pos, EvidenceCategory::DELETE)) {
            break;
        }
        ++ret;
    }
    return ret;
}

RecoveredIndel recover_insertion(const Site& site,
                                 const int32_t length,
                                 const AlignmentSource& source,
                                 const bool use_alignment_for_all) {
    if (use_alignment_for_all) {
        std::string bases = most_frequent_insertion(source, site.locus, length,
                                                    adaptive_max_length(length), "");
        const int32_t len = static_cast<int32_t>(std::size(bases));
        return RecoveredIndel{std::move(bases), len, false};
    }

    if (length < MIN_LEN_NEEDS_INFERENCE) {
        std::string bases = insertion_bases_from_evidence(site.evidence, length);
        const int32_t len = static_cast<int32_t>(std::size(bases));
        return RecoveredIndel{std::move(bases), len, false};
    }

    std::string bases = most_frequent_insertion(source, site.locus, MIN_LEN_NEEDS_INFERENCE,
                                                MAX_LEN_NEEDS_INFERENCE, "");
    if (!std::empty(bases)) {
        const int32_t len = static_cast<int32_t>(std::size(bases));
        return RecoveredIndel{std::move(bases), len, false};
    }

    bases = infer_insertion_bases(site.evidence);
    const int32_t len = static_cast<int32_t>(std::size(bases));
    spdlog::trace("[recover_insertion] Inferred insertion of length {} at {}:{}.", len,
                  site.locus.contig, site.locus.position + 1);
    return RecoveredIndel{std::move(bases), len, true};
}

RecoveredIndel recover_deletion(const Site& site,
                                const int32_t length,
                                const AlignmentSource& source,
                                const bool use_alignment_for_all) {
    if (use_alignment_for_all) {
        std::string bases =
                most_frequent_deletion(source, site.locus, length, adaptive_max_length(length));
        const int32_t len = static_cast<int32_t>(std::size(bases));
        return RecoveredIndel{std::move(bases), len, false};
    }

    if (length < MIN_LEN_NEEDS_INFERENCE) {
        std::string bases = deletion_bases_from_window(site.locus, length);
        const int32_t len = static_cast<int32_t>(std::size(bases));
        return RecoveredIndel{std::move(bases), len, false};
    }

    std::string bases = most_frequent_deletion(source, site.locus, MIN_LEN_NEEDS_INFERENCE,
                                               MAX_LEN_NEEDS_INFERENCE);
    if (static_cast<int32_t>(std::size(bases)) >= FLANK) {
        const int32_t len = static_cast<int32_t>(std::size(bases));
        return RecoveredIndel{std::move(bases), len, false};
    }

    bases = deletion_bases_from_window(site.locus, infer_deletion_length(site.evidence));
    const int32_t len = static_cast<int32_t>(std::size(bases));
    spdlog::trace("[recover_deletion] Inferred deletion of length {} at {}:{}.", len,
                  site.locus.contig, site.locus.position + 1);
    return RecoveredIndel{std::move(bases), len, true};
}

}  // namespace clarion::calling
