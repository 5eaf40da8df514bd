#include "grading/scorers.hpp"

#include <polygrader/grading_session.hpp>

namespace polygrader {

double FixedStaticCodeScorer::score(const Submission& code) const {
    if (auto iter = per_group_.find(code.group_id); iter != per_group_.end()) {
        return iter->second;
    }

    return fallback_;
}

double FixedDocumentationScorer::score(const Submission& documentation) const {
    if (auto iter = per_group_.find(documentation.group_id); iter != per_group_.end()) {
        return iter->second;
    }

    if (documentation.empty()) {
        return 0.0;
    }

    return fallback_;
}

} // namespace polygrader
