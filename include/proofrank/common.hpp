#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error types, file name helpers, file discovery
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace proofrank {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace proofrank

namespace proofrank::common {

// ============================================================================
// File Names
// ============================================================================

/**
 * Extension of a file name without the leading dot
 * - "pkg.ads" -> "ads"
 * - "dir.d/pkg" -> ""
 *
 * @param name File name or path
 * @return Extension, empty if there is none
 */
[[nodiscard]] std::string_view file_extension(std::string_view name) noexcept;

/**
 * ASCII case-insensitive string comparison
 */
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// File Discovery
// ============================================================================

/**
 * Recursively collect regular files below root with the given extension.
 *
 * @param root Directory to walk
 * @param extension Extension including the dot (e.g. ".spark")
 * @return Matching paths in lexicographic order, or error if root is not a directory
 */
[[nodiscard]] Result<std::vector<std::filesystem::path>>
find_files(const std::filesystem::path& root, std::string_view extension);

}  // namespace proofrank::common
