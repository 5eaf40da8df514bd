#pragma once

#include "output/result_record.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <polygrader/common/class_traits.hpp>
#include <polygrader/grading_session.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace polygrader {

struct RunMetadata
{
    std::string version_string;
    std::chrono::system_clock::time_point start_time;

    std::size_t num_groups;
    std::size_t num_workers;
};

class Serializer : NonCopyable
{
public:
    Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{&sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_run_metadata(const RunMetadata& data) = 0;

    /// Called once per group, in completion order
    virtual void on_group_result(const ResultRecord& record) = 0;

    /// Called once, after every group finished
    virtual void on_batch_result(const BatchResult& data) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink* sink_;
    VerbosityLevel verbosity_;
};

} // namespace polygrader
