#pragma once

#include <type_traits>

namespace exegrader {

/**
 * \brief Base class marking a derived type as movable but not copyable.
 *
 * Used for types owning an OS resource (a child process, a temporary directory),
 * where a copy would mean a double release.
 */
class NonCopyable
{
public:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

static_assert(!std::is_copy_constructible_v<NonCopyable> && std::is_trivially_move_constructible_v<NonCopyable>,
              "NonCopyable must be trivially movable and not copyable");

/**
 * \brief Base class marking a derived type as neither movable nor copyable.
 */
class NonMovable
{
public:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;
};

static_assert(!std::is_move_constructible_v<NonMovable> && !std::is_copy_constructible_v<NonMovable>,
              "NonMovable must be neither movable nor copyable");

} // namespace exegrader
