#include "catch2_custom.hpp"

#include "user/submission_loader.hpp"

#include <polygrader/grading_session.hpp>

#include <fmt/format.h>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

using namespace polygrader;
namespace fs = std::filesystem;
using Paths = std::vector<fs::path>;

namespace {

/// A directory tree in the temp directory, removed on destruction
class TempTree
{
public:
    TempTree()
        : root_{fs::temp_directory_path() / fmt::format("polygrader-loader-{}-{}", ::getpid(), ++counter)} {
        fs::create_directories(root_);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    ~TempTree() {
        std::error_code err;
        fs::remove_all(root_, err);
    }

    void add(const fs::path& rel_path, std::string_view content) const {
        fs::create_directories((root_ / rel_path).parent_path());
        std::ofstream out{root_ / rel_path, std::ios::binary};
        out << content;
    }

    const fs::path& root() const { return root_; }

private:
    static inline int counter = 0;
    fs::path root_;
};

Paths paths_of(const Submission& submission) {
    return submission.files | ranges::views::transform(&SourceFile::path) | ranges::to<Paths>();
}

} // namespace

TEST_CASE("Files are loaded in path order, relative to the root") {
    TempTree tree;
    tree.add("src/util.c", "int util(void);");
    tree.add("main.c", "int main(void) { return 0; }");
    tree.add("include/util.h", "#pragma once");

    auto submission = SubmissionLoader{}.load("g01", tree.root());

    REQUIRE(submission);
    REQUIRE(submission->group_id == "g01");
    REQUIRE(paths_of(*submission) == Paths{"include/util.h", "main.c", "src/util.c"});
    REQUIRE(submission->files[1].content == "int main(void) { return 0; }");
}

TEST_CASE("Hidden files and directories are skipped") {
    TempTree tree;
    tree.add("main.py", "print(1)");
    tree.add(".hidden.py", "print(2)");
    tree.add(".git/config", "[core]");
    tree.add("pkg/.cache/module.py", "");

    auto submission = SubmissionLoader{}.load("g", tree.root());

    REQUIRE(submission);
    REQUIRE(paths_of(*submission) == Paths{"main.py"});
}

TEST_CASE("Symlinks are not followed") {
    TempTree tree;
    tree.add("main.py", "print(1)");
    fs::create_symlink("/etc/passwd", tree.root() / "passwd.py");
    fs::create_symlink("/nonexistent/target", tree.root() / "dangling.py");

    auto submission = SubmissionLoader{}.load("g", tree.root());

    REQUIRE(submission);
    REQUIRE(paths_of(*submission) == Paths{"main.py"});
}

TEST_CASE("Oversized files and deep trees are left out") {
    TempTree tree;
    tree.add("small.c", "x");
    tree.add("big.c", std::string(100, 'x'));
    tree.add("a/b/c/deep.c", "x");

    auto submission = SubmissionLoader{2, 10}.load("g", tree.root());

    REQUIRE(submission);
    REQUIRE(paths_of(*submission) == Paths{"small.c"});
}

TEST_CASE("Documentation loading keeps only documents") {
    TempTree tree;
    tree.add("README.md", "# Report");
    tree.add("notes/design.TXT", "design");
    tree.add("report.pdf", "%PDF");
    tree.add("main.c", "int main(void) { return 0; }");

    auto docs = SubmissionLoader{}.load_documentation("g", tree.root());

    REQUIRE(docs);
    REQUIRE(paths_of(*docs) == Paths{"README.md", "notes/design.TXT"});
}

TEST_CASE("Empty directories give empty submissions") {
    TempTree tree;

    auto submission = SubmissionLoader{}.load("g", tree.root());

    REQUIRE(submission);
    REQUIRE(submission->empty());
}

TEST_CASE("Missing directories are errors") {
    auto submission = SubmissionLoader{}.load("g", "/polygrader/no/such/dir");

    REQUIRE_FALSE(submission);
    REQUIRE_THAT(submission.error(), Catch::Matchers::ContainsSubstring("not a directory"));
}

TEST_CASE("Loading a group collects code and documentation") {
    TempTree code;
    code.add("main.c", "int main(void) { return 0; }");
    TempTree docs;
    docs.add("report.md", "# Report");
    docs.add("diagram.png", "");

    const GroupSubmission group = SubmissionLoader{}.load_group("g07", code.root(), docs.root());

    REQUIRE_FALSE(group.load_error);
    REQUIRE(group.code.group_id == "g07");
    REQUIRE(paths_of(group.code) == Paths{"main.c"});
    REQUIRE(group.documentation);
    REQUIRE(paths_of(*group.documentation) == Paths{"report.md"});
}

TEST_CASE("A group that cannot be read carries the reason instead of failing") {
    TempTree code;
    code.add("main.c", "int main(void) { return 0; }");

    SECTION("Missing code") {
        const GroupSubmission group = SubmissionLoader{}.load_group("g08", "/polygrader/no/such/dir", code.root());

        REQUIRE(group.load_error);
        REQUIRE_THAT(*group.load_error, Catch::Matchers::ContainsSubstring("/polygrader/no/such/dir"));
        REQUIRE(group.code.group_id == "g08");
        REQUIRE(group.code.empty());
    }

    SECTION("Missing documentation") {
        const GroupSubmission group = SubmissionLoader{}.load_group("g08", code.root(), "/polygrader/no/docs");

        REQUIRE(group.load_error);
        REQUIRE_THAT(*group.load_error, Catch::Matchers::ContainsSubstring("/polygrader/no/docs"));
        REQUIRE_FALSE(group.documentation);
    }
}
