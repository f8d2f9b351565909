#include "alignment_source.h"

#include "utils/string_utils.h"

#include <cctype>

namespace clarion::calling {

std::vector<std::string> EmptyAlignmentSource::pileup_signatures(const std::string& /*contig*/,
                                                                 const int64_t /*start*/,
                                                                 const int64_t /*end*/) const {
    return {};
}

std::string EmptyAlignmentSource::fetch_reference(const std::string& /*contig*/,
                                                  const int64_t /*start*/,
                                                  const int64_t /*end*/) const {
    return {};
}

std::optional<IndelSignature> parse_indel_signature(const std::string_view signature) {
    // Minimum is one base, the marker, one digit and one base. E.g. "A+1C".
    if (std::size(signature) < 4) {
        return std::nullopt;
    }

    IndelSignature ret;
    if (signature[1] == '+') {
        ret.type = IndelType::INSERTION;
    } else if (signature[1] == '-') {
        ret.type = IndelType::DELETION;
    } else {
        return std::nullopt;
    }

    size_t digits_end = 2;
    while ((digits_end < std::size(signature)) &&
           std::isdigit(static_cast<unsigned char>(signature[digits_end]))) {
        ++digits_end;
    }

    const std::optional<int32_t> length =
            utils::from_chars<int32_t>(signature.substr(2, digits_end - 2));
    if (!length || (digits_end == std::size(signature))) {
        return std::nullopt;
    }

    ret.length = *length;
    ret.bases = utils::to_uppercase(std::string(signature.substr(digits_end)));

    return ret;
}

}  // namespace clarion::calling
