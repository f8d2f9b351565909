#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace clarion::utils {

template <typename StringLike>
[[nodiscard]] inline std::string join(const std::vector<StringLike>& inputs,
                                      std::string_view separator) {
    std::string result;
    for (const auto& item : inputs) {
        if (!result.empty()) {
            result += separator;
        }
        result += item;
    }
    return result;
}

[[nodiscard]] inline std::string to_uppercase(std::string in) {
    std::transform(in.begin(), in.end(), in.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return in;
}

/// Parses the whole of str as an integer. Trailing characters, overflow and empty input yield nullopt.
template <typename T>
[[nodiscard]] inline std::optional<T> from_chars(std::string_view str) {
    static_assert(std::is_integral_v<T>);

    T value = 0;
    const char* const end = str.data() + str.size();
    const auto res = std::from_chars(str.data(), end, value);
    if ((res.ec != std::errc{}) || (res.ptr != end)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace clarion::utils
