#pragma once

namespace polygrader {

/// Mixin for types that own a resource which must not be duplicated
/// (file descriptors, child processes, temporary directories).
/// Moving is still permitted.
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

/// Mixin for types whose address is part of their identity (e.g. captured by worker threads)
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

} // namespace polygrader
