#pragma once

#include <exegrader/common/class_traits.hpp>
#include <exegrader/common/error_types.hpp>

#include <filesystem>
#include <string_view>

namespace exegrader {

/// An exclusive temporary directory holding one submission's files.
///
/// The directory and everything within it are removed when the owning Workspace is destroyed,
/// whichever way its scope is left. Moved-from objects own nothing.
class Workspace : NonCopyable
{
public:
    /// Creates a fresh directory (mode 0700) under the system temporary directory
    static Result<Workspace> create(std::string_view prefix = DEFAULT_PREFIX);

    ~Workspace();
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;

    const std::filesystem::path& get_path() const noexcept { return path_; }

    /// Path of a file named `name` directly within the workspace
    std::filesystem::path file(std::string_view name) const { return path_ / name; }

    /// Writes `content` verbatim (binary mode) to `file(name)`, replacing any existing file
    Result<void> write_file(std::string_view name, std::string_view content) const;

    static constexpr std::string_view DEFAULT_PREFIX = "exegrader-";

private:
    explicit Workspace(std::filesystem::path path);

    /// Recursively removes the directory. Failures are logged, never thrown.
    void remove() noexcept;

    std::filesystem::path path_;
};

} // namespace exegrader
