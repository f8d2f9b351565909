#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace clarion::calling {

/// One called site, ready to be written out.
struct VariantRecord {
    std::string contig;
    int64_t position = -1;  // Zero-based.
    std::string ref;
    std::vector<std::string> alts;
    int32_t quality = 0;
    std::string filter{"."};
    std::vector<std::string> info;  // "KEY=VALUE" entries.
    std::string genotype;
    int64_t depth = 0;
    float allele_frequency = 0.0f;
};

bool operator==(const VariantRecord& lhs, const VariantRecord& rhs);

std::ostream& operator<<(std::ostream& os, const VariantRecord& record);

}  // namespace clarion::calling
