#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include "process_test_util.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <unistd.h>

using namespace mcpexec;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: empty string returns empty", "[util]") {
    REQUIRE(trim("").empty());
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: lowercases ASCII", "[util]") {
    REQUIRE(to_lower("PyThOn") == "python");
    REQUIRE(to_lower("already") == "already");
}

// ── replace_all ──────────────────────────────────────────────────

TEST_CASE("replace_all: multiple replacements", "[util]") {
    REQUIRE(replace_all("{file} and {file}", "{file}", "a.py") == "a.py and a.py");
}

TEST_CASE("replace_all: no match", "[util]") {
    REQUIRE(replace_all("hello", "xyz", "abc") == "hello");
}

TEST_CASE("replace_all: empty from returns original", "[util]") {
    REQUIRE(replace_all("hello", "", "x") == "hello");
}

TEST_CASE("replace_all: replacement containing the pattern terminates", "[util]") {
    REQUIRE(replace_all("aa", "a", "aa") == "aaaa");
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex characters", "[util]") {
    std::string id = generate_id();
    REQUIRE(id.size() == 16);
    REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("generate_id: successive ids differ", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) ids.insert(generate_id());
    REQUIRE(ids.size() == 100);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
}

TEST_CASE("expand_home: empty string unchanged", "[util]") {
    REQUIRE(expand_home("").empty());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    std::string dir = make_temp_dir("mcpexec_util");
    REQUIRE_FALSE(dir.empty());
    std::string path = dir + "/nested/deeper/file.json";

    REQUIRE(atomic_write_file(path, "{}\n"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "{}\n");

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: replaces existing content", "[util]") {
    std::string dir = make_temp_dir("mcpexec_util");
    std::string path = dir + "/file.txt";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "second");

    std::filesystem::remove_all(dir);
}
