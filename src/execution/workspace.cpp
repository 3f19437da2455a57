#include <exegrader/execution/workspace.hpp>

#include <exegrader/common/error_types.hpp>
#include <exegrader/common/linux.hpp>
#include <exegrader/logging.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace exegrader {

Workspace::Workspace(std::filesystem::path path)
    : path_{std::move(path)} {}

Result<Workspace> Workspace::create(std::string_view prefix) {
    std::error_code err;
    const std::filesystem::path tmp_dir = std::filesystem::temp_directory_path(err);

    if (err) {
        LOG_WARN("Could not determine the temporary directory: {}", err.message());
        return ErrorKind::IoFailure;
    }

    // mkdtemp creates the directory with mode 0700 and guarantees it did not exist before
    const std::string path_template = (tmp_dir / fmt::format("{}XXXXXX", prefix)).string();
    auto created = TRYE(linux::mkdtemp(path_template), SyscallFailure);

    LOG_DEBUG("Created workspace {}", created);

    return Workspace{std::filesystem::path{std::move(created)}};
}

Workspace::~Workspace() {
    remove();
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

Result<void> Workspace::write_file(std::string_view name, std::string_view content) const {
    std::ofstream out{file(name), std::ios::binary | std::ios::trunc};

    if (!out.is_open()) {
        LOG_WARN("Could not open {} for writing", file(name));
        return ErrorKind::IoFailure;
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();

    if (out.fail()) {
        LOG_WARN("Could not write {} bytes to {}", content.size(), file(name));
        return ErrorKind::IoFailure;
    }

    return {};
}

void Workspace::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code err;
    auto num_removed = std::filesystem::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove workspace {}: {}", path_, err.message());
    } else {
        LOG_DEBUG("Removed workspace {} ({} entries)", path_, num_removed);
    }

    path_.clear();
}

} // namespace exegrader
