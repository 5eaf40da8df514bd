#include <polygrader/grading_session.hpp>

#include <range/v3/algorithm/transform.hpp>

#include <cctype>
#include <string>

namespace polygrader {

std::string SourceFile::extension() const {
    std::string ext = path.extension().string();

    ranges::transform(ext, ext.begin(), [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });

    return ext;
}

std::string BuildResult::diagnostics() const {
    std::string res = compiler_stdout.data;

    if (!res.empty() && !compiler_stderr.data.empty() && res.back() != '\n') {
        res += '\n';
    }
    res += compiler_stderr.data;

    if (compiler_stdout.truncated || compiler_stderr.truncated) {
        res += "\n[compiler output truncated]";
    }

    return res;
}

} // namespace polygrader
