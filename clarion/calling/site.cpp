#include "site.h"

#include "utils/string_utils.h"

#include <algorithm>
#include <optional>
#include <ostream>
#include <stdexcept>

namespace clarion::calling {

EvidenceTensor::EvidenceTensor() : m_data(NUM_VALUES, 0.0f) {}

EvidenceTensor::EvidenceTensor(const float* data) : m_data(data, data + NUM_VALUES) {}

float EvidenceTensor::category_sum(const int32_t pos, const EvidenceCategory category) const {
    float sum = 0.0f;
    for (int32_t channel = 0; channel < NUM_NUCLEOTIDE_CHANNELS; ++channel) {
        sum += at(pos, channel, category);
    }
    return sum;
}

std::array<float, NUM_BASES> EvidenceTensor::strand_merged(const int32_t pos,
                                                           const EvidenceCategory category) const {
    std::array<float, NUM_BASES> ret{};
    for (int32_t base = 0; base < NUM_BASES; ++base) {
        ret[base] = at(pos, base, category) + at(pos, base + NUM_BASES, category);
    }
    return ret;
}

SiteLocus parse_site_descriptor(const std::string_view descriptor) {
    const size_t window_sep = descriptor.rfind(':');
    if ((window_sep == std::string_view::npos) || (window_sep == 0)) {
        throw std::runtime_error{"Malformed site descriptor: '" + std::string(descriptor) + "'."};
    }
    const size_t pos_sep = descriptor.rfind(':', window_sep - 1);
    if ((pos_sep == std::string_view::npos) || (pos_sep == 0)) {
        throw std::runtime_error{"Malformed site descriptor: '" + std::string(descriptor) + "'."};
    }

    const std::string_view contig = descriptor.substr(0, pos_sep);
    const std::string_view pos_str = descriptor.substr(pos_sep + 1, window_sep - pos_sep - 1);
    const std::string_view window = descriptor.substr(window_sep + 1);

    const std::optional<int64_t> pos = utils::from_chars<int64_t>(pos_str);
    if (!pos || (*pos < 1)) {
        throw std::runtime_error{"Invalid position in site descriptor: '" +
                                 std::string(descriptor) + "'."};
    }

    if (static_cast<int32_t>(std::size(window)) != WINDOW_LEN) {
        throw std::runtime_error{"Reference window in site descriptor '" +
                                 std::string(descriptor) + "' has length " +
                                 std::to_string(std::size(window)) + ", expected " +
                                 std::to_string(WINDOW_LEN) + "."};
    }

    return SiteLocus{std::string(contig), *pos - 1, utils::to_uppercase(std::string(window))};
}

std::ostream& operator<<(std::ostream& os, const SiteLocus& locus) {
    os << locus.contig << ':' << (locus.position + 1) << ':' << locus.reference_window;
    return os;
}

}  // namespace clarion::calling
