#include "catch2_custom.hpp"

#include "detect/language_detector.hpp"
#include "test_helpers.hpp"
#include "toolchain/toolchain_registry.hpp"

#include <polygrader/grading_session.hpp>

#include <filesystem>
#include <vector>

using namespace polygrader;
using test::make_submission;
using Paths = std::vector<std::filesystem::path>;

namespace {

const ToolchainRegistry& registry() {
    static const ToolchainRegistry instance = ToolchainRegistry::with_builtin_languages();
    return instance;
}

} // namespace

TEST_CASE("Single file submissions") {
    const LanguageDetector detector{registry()};

    auto detection = detector.detect(make_submission("g", {{"hello.py", "print('hi')"}}));

    REQUIRE(detection);
    REQUIRE(detection->language().name == "Python");
    REQUIRE(detection->entry_file == "hello.py");
    REQUIRE(detection->sources == Paths{"hello.py"});
}

TEST_CASE("The language with the most source files wins") {
    const LanguageDetector detector{registry()};

    auto detection = detector.detect(make_submission("g", {
                                                              {"tools/plot.py", ""},
                                                              {"main.c", "int main(void) { return 0; }"},
                                                              {"list.c", ""},
                                                              {"README.md", ""},
                                                          }));

    REQUIRE(detection);
    REQUIRE(detection->language().name == "C");
    REQUIRE(detection->entry_file == "main.c");
    REQUIRE(detection->sources == Paths{"main.c", "list.c"});
}

TEST_CASE("Extensions are matched case-insensitively") {
    const LanguageDetector detector{registry()};

    auto detection = detector.detect(make_submission("g", {{"MAIN.CPP", "int main() {}"}}));

    REQUIRE(detection);
    REQUIRE(detection->language().name == "C++");
}

TEST_CASE("Headers strengthen, but never create, a language's vote") {
    const LanguageDetector detector{registry()};

    SECTION("Headers break a tie in favor of their language") {
        auto detection = detector.detect(make_submission("g", {
                                                                  {"main.cpp", "int main() {}"},
                                                                  {"list.hpp", ""},
                                                                  {"main.py", ""},
                                                              }));

        REQUIRE(detection);
        REQUIRE(detection->language().name == "C++");
        REQUIRE(detection->sources == Paths{"main.cpp"});
    }

    SECTION("Headers alone are unsupported") {
        auto detection = detector.detect(make_submission("g", {{"a.h", ""}, {"b.hpp", ""}}));

        REQUIRE_FALSE(detection);
        REQUIRE(detection.error() == DetectionFailure::Unsupported);
    }
}

TEST_CASE("No recognized extension is unsupported") {
    const LanguageDetector detector{registry()};

    auto detection = detector.detect(make_submission("g", {{"notes.txt", ""}, {"main.rs", "fn main() {}"}}));

    REQUIRE_FALSE(detection);
    REQUIRE(detection.error() == DetectionFailure::Unsupported);

    REQUIRE(detector.detect(make_submission("g", {})).error() == DetectionFailure::Unsupported);
}

TEST_CASE("Ties") {
    const LanguageDetector detector{registry()};

    SECTION("A tie goes to the only language with a recognizable entry point") {
        auto detection = detector.detect(make_submission("g", {
                                                                  {"helpers.js", "module.exports = {}"},
                                                                  {"Main.java", "public class Main {}"},
                                                              }));

        REQUIRE(detection);
        REQUIRE(detection->language().name == "Java");
        REQUIRE(detection->entry_file == "Main.java");
    }

    SECTION("A tie with no entry point anywhere is ambiguous") {
        auto detection = detector.detect(make_submission("g", {{"a.js", ""}, {"b.py", ""}}));

        REQUIRE_FALSE(detection);
        REQUIRE(detection.error() == DetectionFailure::Ambiguous);
    }

    SECTION("A tie with several entry points is ambiguous") {
        auto detection = detector.detect(make_submission("g", {{"main.js", ""}, {"main.py", ""}}));

        REQUIRE_FALSE(detection);
        REQUIRE(detection.error() == DetectionFailure::Ambiguous);
    }
}

TEST_CASE("Entry point selection") {
    const LanguageDetector detector{registry()};

    SECTION("Well-known names rank above content") {
        auto detection = detector.detect(make_submission("g", {
                                                                  {"run.py", "if __name__ == '__main__':\n    run()"},
                                                                  {"main.py", "import run"},
                                                              }));

        REQUIRE(detection);
        REQUIRE(detection->entry_file == "main.py");
    }

    SECTION("Shallower paths win among equal names") {
        auto detection = detector.detect(make_submission("g", {
                                                                  {"tests/main.py", ""},
                                                                  {"main.py", ""},
                                                              }));

        REQUIRE(detection);
        REQUIRE(detection->entry_file == "main.py");
    }

    SECTION("Content signatures find unconventionally named entry points") {
        auto detection = detector.detect(make_submission("g", {
                                                                  {"Util.java", "class Util {}"},
                                                                  {"Game.java", "public static void main(String[] a) {}"},
                                                              }));

        REQUIRE(detection);
        REQUIRE(detection->entry_file == "Game.java");
    }

    SECTION("Interpreted languages without an identifiable entry point fail") {
        auto detection = detector.detect(make_submission("g", {{"a.py", "x = 1"}, {"b.py", "y = 2"}}));

        REQUIRE_FALSE(detection);
        REQUIRE(detection.error() == DetectionFailure::NoEntry);
    }

    SECTION("Native languages link every source, so any file will do") {
        auto detection = detector.detect(make_submission("g", {{"a.c", ""}, {"b.c", ""}}));

        REQUIRE(detection);
        REQUIRE(detection->sources.size() == 2);
    }
}
