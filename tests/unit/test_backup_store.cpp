#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "BackupStore.hpp"
#include "RunContext.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

#include <sys/stat.h>

namespace fs = std::filesystem;

TEST_CASE("BackupStore mirrors the target path under the run namespace") {
    TempDir temp;
    RunContext context(false, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const fs::path target = temp.path() / "home" / ".config" / "electron-flags.conf";
    write_text_file(target, "--old-flag\n");

    const auto result = store.snapshot(target);
    REQUIRE(result.preserved());
    CHECK_FALSE(result.simulated);
    CHECK(*result.location == context.backup_run_dir() / target.relative_path());
    CHECK(read_text_file(*result.location) == "--old-flag\n");
}

TEST_CASE("BackupStore reports nothing to preserve for absent paths") {
    TempDir temp;
    RunContext context(false, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const auto result = store.snapshot(temp.path() / "missing.conf");
    CHECK_FALSE(result.preserved());
    CHECK_FALSE(fs::exists(context.backup_run_dir()));
}

TEST_CASE("BackupStore layers repeated snapshots of one path") {
    TempDir temp;
    RunContext context(false, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);
    const fs::path target = temp.path() / "file.txt";

    write_text_file(target, "v1");
    const auto first = store.snapshot(target);
    write_text_file(target, "v2");
    const auto second = store.snapshot(target);
    write_text_file(target, "v3");
    const auto third = store.snapshot(target);

    REQUIRE(first.preserved());
    REQUIRE(second.preserved());
    REQUIRE(third.preserved());
    CHECK(second.location->filename() == "file.txt.~1~");
    CHECK(third.location->filename() == "file.txt.~2~");
    CHECK(read_text_file(*first.location) == "v1");
    CHECK(read_text_file(*second.location) == "v2");
    CHECK(read_text_file(*third.location) == "v3");
}

TEST_CASE("BackupStore copies trees with permissions, links and times") {
    TempDir temp;
    RunContext context(false, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const fs::path tree = temp.path() / "App.app";
    write_text_file(tree / "Contents" / "MacOS" / "App", "#!/bin/sh\n");
    fs::permissions(tree / "Contents" / "MacOS" / "App", fs::perms(0755), fs::perm_options::replace);
    fs::create_symlink("MacOS/App", tree / "Contents" / "launcher");
    const auto mtime = fs::last_write_time(tree / "Contents" / "MacOS" / "App");

    const auto result = store.snapshot(tree);
    REQUIRE(result.preserved());
    const fs::path copy = *result.location;

    CHECK(fs::status(copy / "Contents" / "MacOS" / "App").permissions() == fs::perms(0755));
    REQUIRE(fs::is_symlink(fs::symlink_status(copy / "Contents" / "launcher")));
    CHECK(fs::read_symlink(copy / "Contents" / "launcher") == "MacOS/App");
    CHECK(fs::last_write_time(copy / "Contents" / "MacOS" / "App") == mtime);
}

TEST_CASE("BackupStore failure leaves no partial snapshot") {
    TempDir temp;
    RunContext context(false, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const fs::path target = temp.path() / "data" / "settings.ini";
    write_text_file(target, "x=1");
    // A regular file where the run directory should be blocks the copy even for root.
    write_text_file(context.backup_run_dir(), "not a directory");

    try {
        store.snapshot(target);
        FAIL("expected BACKUP_FAILED");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::BACKUP_FAILED);
    }
    CHECK(fs::is_regular_file(context.backup_run_dir()));
    CHECK(read_text_file(target) == "x=1");
}

TEST_CASE("BackupStore refuses trees holding special files") {
    TempDir temp;
    RunContext context(false, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const fs::path tree = temp.path() / "tree";
    write_text_file(tree / "a.txt", "a");
    REQUIRE(::mkfifo((tree / "pipe").c_str(), 0644) == 0);

    CHECK_THROWS_AS(store.snapshot(tree), ErrorCodes::AppException);
    CHECK_FALSE(fs::exists(context.backup_run_dir() / tree.relative_path()));
}

TEST_CASE("BackupStore under dry-run copies nothing but tracks presence") {
    TempDir temp;
    RunContext context(true, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const fs::path fresh = temp.path() / "fresh.conf";
    CHECK_FALSE(store.is_present(fresh));
    CHECK_FALSE(store.snapshot(fresh).preserved());
    CHECK(store.is_present(fresh));

    const auto second = store.snapshot(fresh);
    CHECK(second.preserved());
    CHECK(second.simulated);
    CHECK_FALSE(fs::exists(temp.path() / "state"));
}

TEST_CASE("BackupStore under dry-run sees a simulated tree replacement") {
    TempDir temp;
    RunContext context(true, false, temp.path() / "state", "20250101-120000");
    BackupStore store(context);

    const fs::path source = temp.path() / "staging";
    write_text_file(source / "Contents" / "MacOS" / "App", "new");
    const fs::path destination = temp.path() / "installed";
    write_text_file(destination / "stale.txt", "old");

    store.simulate_tree(source, destination);

    CHECK(store.is_present(destination));
    CHECK(store.is_present(destination / "Contents" / "MacOS" / "App"));
    CHECK_FALSE(store.is_present(destination / "stale.txt"));
}
