/**
 * @file file_discovery.cpp
 * @brief Recursive report file discovery
 */

#include "proofrank/common.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace proofrank::common {

Result<std::vector<std::filesystem::path>> find_files(const std::filesystem::path& root,
                                                      std::string_view extension)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(
            Error::make("IOError", "Not a directory: " + root.string()));
    }

    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "IOError", "Failed to read directory: " + root.string() + ": " + ec.message()));
    }

    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && entry.path().extension().string() == extension) {
            files.push_back(entry.path());
        }
        it.increment(ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to read directory: " + root.string() + ": " + ec.message()));
        }
    }

    std::ranges::sort(files);
    return files;
}

}  // namespace proofrank::common
