/**
 * @file path.cpp
 * @brief File name helpers
 */

#include "proofrank/common.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace proofrank::common {

namespace {

[[nodiscard]] char to_lower_ascii(char c) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

std::string_view file_extension(std::string_view name) noexcept
{
    const auto separator = name.find_last_of("/\\");
    if (separator != std::string_view::npos) {
        name.remove_prefix(separator + 1);
    }
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return {};
    }
    return name.substr(dot + 1);
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(a, b, [](char lhs, char rhs) {
        return to_lower_ascii(lhs) == to_lower_ascii(rhs);
    });
}

}  // namespace proofrank::common
