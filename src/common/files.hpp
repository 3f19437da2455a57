#pragma once

#include <exegrader/common/error_types.hpp>
#include <exegrader/logging.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace exegrader {

/// Reads the whole file at `path` verbatim (binary mode)
inline Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in_file{path, std::ios::binary};

    if (!in_file.is_open()) {
        LOG_DEBUG("Failed to open {}", path);
        return ErrorKind::IoFailure;
    }

    std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        LOG_DEBUG("IO error in reading {}", path);
        return ErrorKind::IoFailure;
    }

    return contents;
}

} // namespace exegrader
