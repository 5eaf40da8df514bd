#pragma once

#include "output/sink.hpp"

#include <iostream>
#include <mutex>
#include <ostream>
#include <string_view>

namespace polygrader {

/// Writes to stdout by default, or any other stream (tests use a std::ostringstream).
/// Writes are serialized, so the sink may be shared between threads.
class StdoutSink : public Sink
{
public:
    explicit StdoutSink(std::ostream& out = std::cout)
        : out_{&out} {}

    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;

private:
    std::ostream* out_;
    std::mutex mutex_;
};

} // namespace polygrader
