#pragma once

#include <polygrader/grading_session.hpp>

#include <functional>
#include <map>
#include <string>
#include <utility>

namespace polygrader {

/// Scores the code of a submission without running it (style, structure, ...).
/// Implementations must be safe to call from several workers at once.
class StaticCodeScorer
{
public:
    virtual ~StaticCodeScorer() = default;

    /// A score in [0, 20]
    virtual double score(const Submission& code) const = 0;
};

/// Scores a group's documentation submission, which may be empty.
/// Implementations must be safe to call from several workers at once.
class DocumentationScorer
{
public:
    virtual ~DocumentationScorer() = default;

    /// A score in [0, 20]
    virtual double score(const Submission& documentation) const = 0;
};

/// Scores read from a table, keyed by group id, with a fallback for unlisted groups
class FixedStaticCodeScorer : public StaticCodeScorer
{
public:
    explicit FixedStaticCodeScorer(double fallback, std::map<std::string, double, std::less<>> per_group = {})
        : fallback_{fallback}
        , per_group_{std::move(per_group)} {}

    double score(const Submission& code) const override;

private:
    double fallback_;
    std::map<std::string, double, std::less<>> per_group_;
};

/// Scores read from a table, keyed by group id, with a fallback for unlisted groups.
/// Groups that handed in no documentation at all score 0.
class FixedDocumentationScorer : public DocumentationScorer
{
public:
    explicit FixedDocumentationScorer(double fallback, std::map<std::string, double, std::less<>> per_group = {})
        : fallback_{fallback}
        , per_group_{std::move(per_group)} {}

    double score(const Submission& documentation) const override;

private:
    double fallback_;
    std::map<std::string, double, std::less<>> per_group_;
};

} // namespace polygrader
