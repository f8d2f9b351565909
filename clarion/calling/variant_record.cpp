#include "variant_record.h"

#include "utils/string_utils.h"

#include <ostream>
#include <tuple>

namespace clarion::calling {

bool operator==(const VariantRecord& lhs, const VariantRecord& rhs) {
    return std::tie(lhs.contig, lhs.position, lhs.ref, lhs.alts, lhs.quality, lhs.filter,
                    lhs.info, lhs.genotype, lhs.depth, lhs.allele_frequency) ==
           std::tie(rhs.contig, rhs.position, rhs.ref, rhs.alts, rhs.quality, rhs.filter,
                    rhs.info, rhs.genotype, rhs.depth, rhs.allele_frequency);
}

std::ostream& operator<<(std::ostream& os, const VariantRecord& record) {
    os << "contig = " << record.contig << ", position = " << record.position
       << ", ref = " << record.ref << ", alts = [" << utils::join(record.alts, ", ")
       << "], quality = " << record.quality << ", filter = " << record.filter << ", info = ["
       << utils::join(record.info, ";") << "], genotype = " << record.genotype
       << ", depth = " << record.depth << ", allele_frequency = " << record.allele_frequency;
    return os;
}

}  // namespace clarion::calling
