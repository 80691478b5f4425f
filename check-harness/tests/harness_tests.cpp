#include <catch2/catch_test_macros.hpp>
#include "../harness.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {
// Scratch directory for reference files; removed with its contents on scope exit.
struct ScratchDir {
    std::string path;

    ScratchDir() {
        char templ[] = "/tmp/check-harness-XXXXXX";
        char* made = ::mkdtemp(templ);
        REQUIRE(made != nullptr);
        path = made;
    }

    ~ScratchDir() {
        std::string cmd = "rm -rf '" + path + "'";
        (void)std::system(cmd.c_str());
    }

    std::string write(const std::string& name, const std::string& contents) const {
        std::string file = path + "/" + name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << contents;
        return file;
    }
};
} // namespace

TEST_CASE("run returns a live process", "[harness][run]") {
    ch::Process process = ch::run("read x");
    REQUIRE(process.running());
    REQUIRE(process.command() == "read x");
    process.kill();
    REQUIRE_FALSE(process.running());
}

TEST_CASE("run reports programs that cannot start", "[harness][run][errors]") {
    try {
        ch::run(std::vector<std::string>{"/nonexistent/program"});
        FAIL("expected a Failure");
    } catch (const ch::Failure& f) {
        REQUIRE(std::string(f.what()).find("could not run /nonexistent/program") != std::string::npos);
    }
}

TEST_CASE("kill is safe to repeat and after exit", "[harness][kill]") {
    SECTION("Twice in a row") {
        ch::Process process = ch::run("read x");
        process.kill();
        process.kill();
        REQUIRE_FALSE(process.running());
    }

    SECTION("After natural exit") {
        ch::Process process = ch::run("exit 0");
        process.exit(0);
        process.kill();
        REQUIRE_FALSE(process.running());
    }
}

TEST_CASE("input without a prompt", "[harness][stdin]") {
    SECTION("Prompt required but nothing printed") {
        ch::Process process = ch::run("read x; echo \"got $x\"");
        try {
            process.input("bar", true, 200ms);
            FAIL("expected a Failure");
        } catch (const ch::Failure& f) {
            REQUIRE(std::string(f.what()) == "expected prompt for input, found none");
        }
        // Nothing was written, so the program is still waiting quietly.
        process.reject(300ms);
        REQUIRE(process.running());
    }

    SECTION("Prompt printed before reading") {
        ch::Process process = ch::run("printf 'name: '; read x; echo \"hello, $x\"");
        process.input("bar", true);
        process.output("name: ", ch::MatchMode::Literal);
        process.output("hello, bar\n").exit(0);
    }

    SECTION("No prompt expected") {
        ch::Process process = ch::run("read x");
        process.input("foo");
        process.exit(0);
    }

    SECTION("Input after exit is a failure") {
        ch::Process process = ch::run("exit 0");
        process.exit(0);
        REQUIRE_THROWS_AS(process.input("late"), ch::Failure);
    }

    SECTION("EOF ends the program's input") {
        ch::Process process = ch::run("cat");
        process.input("abc").output("abc\n");
        process.input_eof().exit(0);
    }
}

TEST_CASE("output without an expectation drains pending output", "[harness][stdout]") {
    SECTION("Silent program returns empty output and is no longer running") {
        ch::Process process = ch::run("true");
        REQUIRE(process.output(1s) == "");
        REQUIRE_FALSE(process.running());
    }

    SECTION("Program that prints returns its output verbatim") {
        ch::Process process = ch::run("echo foo");
        REQUIRE(process.output() == "foo\n");
    }

    SECTION("Silence from a running program is not a failure") {
        ch::Process process = ch::run("read x");
        REQUIRE(process.output(100ms) == "");
        REQUIRE(process.running());
    }
}

TEST_CASE("output with an expectation", "[harness][stdout]") {
    SECTION("Mismatch on an exited program") {
        ch::Process process = ch::run("true");
        REQUIRE_THROWS_AS(process.output("foo"), ch::Failure);
        REQUIRE_FALSE(process.running());
    }

    SECTION("Exact line") {
        ch::Process process = ch::run("echo foo");
        process.output("foo\n");
    }

    SECTION("Sequential matches consume output in order") {
        ch::Process process = ch::run("printf 'foo\\nbar\\n'");
        process.output("foo\n").output("bar").output("\n").exit(0);
        REQUIRE(process.child().output().cursor() == process.child().output().size());
    }

    SECTION("Regex") {
        ch::Process process = ch::run("echo foo; read x");
        process.output(".o.");
        process.output("\n");
        REQUIRE(process.running());
    }

    SECTION("Regex $ matches at the end of the line") {
        ch::Process process = ch::run("echo foo; read x");
        process.output("foo$").output("\n");
        REQUIRE(process.running());
    }

    SECTION("Regex over a very long line") {
        ch::Process process = ch::run("head -c 100000 /dev/zero | tr '\\0' a; echo end");
        process.output("[\\s\\S]*end", ch::MatchMode::Regex, 10s);
        process.output("\n").exit(0);
    }

    SECTION("Regex metacharacters are literal in literal mode") {
        ch::Process process = ch::run("echo foo");
        REQUIRE_THROWS_AS(process.output(".o.", ch::MatchMode::Literal), ch::Failure);
        process.output("foo\n", ch::MatchMode::Literal);
    }

    SECTION("Mismatch leaves a live program alive") {
        ch::Process process = ch::run("echo bar; read x");
        try {
            process.output("foo", ch::MatchMode::Literal);
            FAIL("expected a Failure");
        } catch (const ch::Failure& f) {
            REQUIRE(f.payload().expected == std::string("foo"));
            REQUIRE(f.payload().actual == std::string("bar\n"));
        }
        REQUIRE(process.running());
        REQUIRE_THROWS_AS(process.output("foo", ch::MatchMode::Regex, 200ms), ch::Failure);
        REQUIRE(process.running());
        // Unmatched output is still there for the next assertion.
        process.output("bar\n");
    }

    SECTION("End of output") {
        ch::Process process = ch::run("echo a; echo b");
        process.output_eof();
        REQUIRE(process.output(100ms) == "");
    }

    SECTION("End of output times out while the program keeps running") {
        ch::Process process = ch::run("read x");
        REQUIRE_THROWS_AS(process.output_eof(200ms), ch::Failure);
        REQUIRE(process.running());
    }
}

TEST_CASE("output against reference text from a file", "[harness][stdout][file]") {
    ScratchDir dir;

    SECTION("Literal file contents") {
        const std::string reference = dir.write("foo.txt", "foo");
        {
            ch::Process process = ch::run("echo bar");
            std::ifstream f(reference);
            REQUIRE_THROWS_AS(process.output(f, ch::MatchMode::Literal), ch::Failure);
        }
        {
            ch::Process process = ch::run("echo foo");
            std::ifstream f(reference);
            process.output(f, ch::MatchMode::Literal);
        }
    }

    SECTION("File contents as a regex") {
        const std::string reference = dir.write("pattern.txt", ".a.");
        ch::Process process = ch::run("echo bar");
        std::ifstream f(reference);
        process.output(f);
    }

    SECTION("Unreadable stream") {
        ch::Process process = ch::run("echo foo");
        std::ifstream f(dir.path + "/missing.txt");
        REQUIRE_THROWS_AS(process.output(f), ch::Failure);
    }
}

TEST_CASE("exit with and without an expected code", "[harness][exit]") {
    SECTION("Wrong code") {
        ch::Process process = ch::run("exit 1");
        try {
            process.exit(0);
            FAIL("expected a Failure");
        } catch (const ch::Failure& f) {
            REQUIRE(std::string(f.what()) == "expected exit code 0, not 1");
            REQUIRE(f.payload().expected == std::string("0"));
            REQUIRE(f.payload().actual == std::string("1"));
            REQUIRE(f.payload().exit_code == 1);
        }
        process.kill();
    }

    SECTION("Matching code") {
        ch::Process process = ch::run("exit 1");
        process.exit(1);
    }

    SECTION("Observed code") {
        ch::Process process = ch::run("exit 1");
        REQUIRE(process.exit() == 1);
    }

    SECTION("Program that does not exit") {
        ch::Process process = ch::run("read x");
        try {
            process.exit(0, 200ms);
            FAIL("expected a Failure");
        } catch (const ch::Failure& f) {
            REQUIRE(std::string(f.what()) == "timed out while waiting for program to exit");
        }
        REQUIRE(process.running());
        REQUIRE_THROWS_AS(process.exit(200ms), ch::Failure);
    }
}

TEST_CASE("reject", "[harness][reject]") {
    SECTION("Program waiting for input") {
        ch::Process process = ch::run("read x; echo \"got $x\"");
        process.reject(200ms);
        process.input("foo");
        REQUIRE_THROWS_AS(process.reject(), ch::Failure);
    }

    SECTION("Program that prints") {
        ch::Process process = ch::run("echo unexpected");
        try {
            process.reject();
            FAIL("expected a Failure");
        } catch (const ch::Failure& f) {
            REQUIRE(std::string(f.what()) == "expected program to reject input, but it did not");
            REQUIRE(f.payload().actual == std::string("unexpected\n"));
        }
    }

    SECTION("Consumed output does not count") {
        ch::Process process = ch::run("echo ready; read x");
        process.output("ready\n");
        process.reject(200ms);
    }
}

TEST_CASE("exists", "[harness][exists]") {
    ScratchDir dir;
    const std::string file = dir.write("foo.py", "");
    ch::exists(file);
    ch::exists(dir.path);
    try {
        ch::exists("i_do_not_exist");
        FAIL("expected a Failure");
    } catch (const ch::Failure& f) {
        REQUIRE(std::string(f.what()) == "i_do_not_exist not found");
    }
}

TEST_CASE("diff", "[harness][diff]") {
    ScratchDir dir;
    const std::string foo = dir.write("foo.txt", "foo");

    REQUIRE_FALSE(ch::diff(foo, dir.write("same.txt", "foo")));
    REQUIRE(ch::diff(foo, dir.write("bar.txt", "bar")));
    REQUIRE_FALSE(ch::diff(foo, dir.write("crlf.txt", "foo\r\n")));
    REQUIRE_FALSE(ch::diff(foo, dir.write("trailing.txt", "foo  \t\n\n\n")));
    REQUIRE(ch::diff(foo, dir.write("leading.txt", "  foo")));
    REQUIRE(ch::diff(dir.write("two.txt", "a\nb\n"), dir.write("joined.txt", "ab\n")));
    REQUIRE(ch::diff(foo, dir.path + "/missing.txt"));
}
