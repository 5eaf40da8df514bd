#include "output/stdout_sink.hpp"

#include <mutex>
#include <ostream>
#include <string_view>

namespace polygrader {

void StdoutSink::write(std::string_view str) {
    std::scoped_lock lock{mutex_};
    *out_ << str;
}

void StdoutSink::flush() {
    std::scoped_lock lock{mutex_};
    out_->flush();
}

} // namespace polygrader
