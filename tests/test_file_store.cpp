#include <catch2/catch_test_macros.hpp>
#include "file_store.hpp"
#include "errors.hpp"
#include "process_test_util.hpp"
#include <functional>
#include <sys/stat.h>

using namespace mcpexec;

namespace {

struct StoreFixture {
    std::string dir = make_temp_dir("mcpexec_files");
    SandboxRoot sandbox{dir};
    FileStore store{1024};

    ~StoreFixture() { std::filesystem::remove_all(dir); }
};

ErrorKind error_kind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ExecError& e) {
        return e.kind();
    }
    FAIL("expected ExecError");
    return ErrorKind::ExecutionFailure;
}

} // namespace

TEST_CASE("FileStore: write then read returns identical bytes", "[files]") {
    StoreFixture f;
    std::string content("line one\nbinary \x01\x02\x00 tail", 24);
    auto path = f.sandbox.resolve("data/blob.bin");

    REQUIRE(f.store.write(path, content) == content.size());
    REQUIRE(f.store.read(path) == content);
}

TEST_CASE("FileStore: write creates parent directories", "[files]") {
    StoreFixture f;
    f.store.write(f.sandbox.resolve("a/b/c/file.txt"), "x");
    REQUIRE(std::filesystem::is_regular_file(f.sandbox.path() / "a/b/c/file.txt"));
}

TEST_CASE("FileStore: write overwrites", "[files]") {
    StoreFixture f;
    auto path = f.sandbox.resolve("f.txt");
    f.store.write(path, "a much longer first version");
    f.store.write(path, "short");
    REQUIRE(f.store.read(path) == "short");
}

TEST_CASE("FileStore: read missing file is NotFound", "[files]") {
    StoreFixture f;
    REQUIRE(error_kind([&] { f.store.read(f.sandbox.resolve("nope.txt")); }) ==
            ErrorKind::NotFound);
}

TEST_CASE("FileStore: read or write a directory is ValidationError", "[files]") {
    StoreFixture f;
    std::filesystem::create_directories(f.sandbox.path() / "dir");
    auto path = f.sandbox.resolve("dir");
    REQUIRE(error_kind([&] { f.store.read(path); }) == ErrorKind::ValidationError);
    REQUIRE(error_kind([&] { f.store.write(path, "x"); }) == ErrorKind::ValidationError);
}

TEST_CASE("FileStore: read or write a FIFO is ValidationError", "[files]") {
    StoreFixture f;
    auto fifo = f.sandbox.path() / "pipe";
    REQUIRE(::mkfifo(fifo.c_str(), 0600) == 0);
    std::filesystem::create_symlink("pipe", f.sandbox.path() / "pipe-link");

    // Opening a FIFO with no writer would block; both calls must return
    auto path = f.sandbox.resolve("pipe");
    REQUIRE(error_kind([&] { f.store.read(path); }) == ErrorKind::ValidationError);
    REQUIRE(error_kind([&] { f.store.write(path, "x"); }) == ErrorKind::ValidationError);

    auto link = f.sandbox.resolve("pipe-link");
    REQUIRE(error_kind([&] { f.store.read(link); }) == ErrorKind::ValidationError);
}

TEST_CASE("FileStore: size limit applies to reads and writes", "[files]") {
    StoreFixture f;
    std::string big(2048, 'z');
    auto path = f.sandbox.resolve("big.txt");
    REQUIRE(error_kind([&] { f.store.write(path, big); }) == ErrorKind::ValidationError);
    REQUIRE_FALSE(std::filesystem::exists(path.path()));

    std::ofstream(path.path()) << big;
    REQUIRE(error_kind([&] { f.store.read(path); }) == ErrorKind::ValidationError);
}

TEST_CASE("FileStore: list returns sorted typed entries", "[files]") {
    StoreFixture f;
    f.store.write(f.sandbox.resolve("b.txt"), "12345");
    f.store.write(f.sandbox.resolve("a/inner.txt"), "x");
    std::filesystem::create_symlink(f.sandbox.path() / "b.txt", f.sandbox.path() / "c-link");

    auto entries = f.store.list(f.sandbox.root());
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].name == "a");
    REQUIRE(entries[0].type == "directory");
    REQUIRE(entries[1].name == "b.txt");
    REQUIRE(entries[1].type == "file");
    REQUIRE(entries[1].size == 5);
    REQUIRE(entries[2].name == "c-link");
    REQUIRE(entries[2].type == "symlink");
}

TEST_CASE("FileStore: list of a file describes just that file", "[files]") {
    StoreFixture f;
    f.store.write(f.sandbox.resolve("only.txt"), "abc");
    auto entries = f.store.list(f.sandbox.resolve("only.txt"));
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].name == "only.txt");
    REQUIRE(entries[0].size == 3);
}

TEST_CASE("FileStore: list missing path is NotFound", "[files]") {
    StoreFixture f;
    REQUIRE(error_kind([&] { f.store.list(f.sandbox.resolve("ghost")); }) ==
            ErrorKind::NotFound);
}
