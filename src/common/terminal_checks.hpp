#pragma once

#include <exegrader/common/expected.hpp>

#include <cstdio>

#include <sys/ioctl.h>

namespace exegrader {

/// Whether the environment advertises a terminal with color support
bool is_color_terminal() noexcept;

/// Whether `file` refers to a terminal
bool in_terminal(FILE* file) noexcept;

Expected<winsize> terminal_size(FILE* file) noexcept;

} // namespace exegrader
