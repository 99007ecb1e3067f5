#include <gtest/gtest.h>
#include "sync/Mount.hpp"
#include "sync/PlaceholderHost.hpp"
#include "sync/PlaceholderState.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <regex>

using namespace stratus::sync;
using namespace stratus::test;

using S = PlaceholderState;
using E = PlaceholderEvent;

TEST(PlaceholderTransitionTest, HydrationCycle) {
    EXPECT_EQ(transition(S::Dehydrated, E::HydrationRequested), S::Hydrating);
    EXPECT_EQ(transition(S::Hydrating, E::DownloadSucceeded), S::Hydrated);
    EXPECT_EQ(transition(S::Hydrating, E::DownloadFailed), S::Dehydrated);
    EXPECT_EQ(transition(S::Hydrated, E::Dehydrated), S::Dehydrated);
}

TEST(PlaceholderTransitionTest, LocalEditsAndUploads) {
    EXPECT_EQ(transition(S::Hydrated, E::LocalWrite), S::DirtyLocal);
    EXPECT_EQ(transition(S::Dehydrated, E::LocalWrite), S::DirtyLocal);
    EXPECT_EQ(transition(S::DirtyLocal, E::LocalWrite), S::DirtyLocal);
    EXPECT_EQ(transition(S::DirtyLocal, E::UploadSucceeded), S::Hydrated);
}

TEST(PlaceholderTransitionTest, RemoteChanges) {
    EXPECT_EQ(transition(S::Dehydrated, E::RemoteChange), S::Dehydrated);
    EXPECT_EQ(transition(S::Hydrated, E::RemoteChange), S::Hydrating);
    EXPECT_EQ(transition(S::DirtyLocal, E::RemoteChange), S::Conflicted);
    EXPECT_EQ(transition(S::Conflicted, E::RemoteChange), S::Conflicted);
}

TEST(PlaceholderTransitionTest, ConflictResolution) {
    EXPECT_EQ(transition(S::Conflicted, E::ResolvedKeepRemote), S::Dehydrated);
    EXPECT_EQ(transition(S::Conflicted, E::ResolvedKeepLocal), S::DirtyLocal);
}

TEST(PlaceholderTransitionTest, IllegalTransitionsAreRejected) {
    EXPECT_FALSE(transition(S::Dehydrated, E::DownloadSucceeded));
    EXPECT_FALSE(transition(S::Dehydrated, E::Dehydrated));
    EXPECT_FALSE(transition(S::Hydrating, E::LocalWrite));
    EXPECT_FALSE(transition(S::Hydrated, E::UploadSucceeded));
    EXPECT_FALSE(transition(S::DirtyLocal, E::Dehydrated));
    EXPECT_FALSE(transition(S::Conflicted, E::LocalWrite));
    EXPECT_FALSE(transition(S::Conflicted, E::UploadSucceeded));
}

TEST(PlaceholderTransitionTest, StateNamesRoundTrip) {
    for (const auto s : {S::Dehydrated, S::Hydrating, S::Hydrated, S::DirtyLocal, S::Conflicted})
        EXPECT_EQ(placeholderStateFromString(to_string(s)), s);
    EXPECT_EQ(to_string(S::DirtyLocal), "dirty-local");
    EXPECT_THROW(placeholderStateFromString("frozen"), std::invalid_argument);
}

TEST(PlaceholderTableTest, UnknownPathsStartDehydrated) {
    PlaceholderTable table;
    EXPECT_FALSE(table.get("docs/a.txt"));
    EXPECT_EQ(table.apply("docs/a.txt", E::HydrationRequested), S::Hydrating);
    EXPECT_EQ(table.get("docs/a.txt"), S::Hydrating);
    EXPECT_EQ(table.size(), 1u);
}

TEST(PlaceholderTableTest, IllegalEventLeavesEntryUntouched) {
    PlaceholderTable table;
    table.set("a.txt", S::Conflicted);
    EXPECT_FALSE(table.apply("a.txt", E::UploadSucceeded));
    EXPECT_EQ(table.get("a.txt"), S::Conflicted);

    EXPECT_FALSE(table.apply("fresh.txt", E::DownloadSucceeded));
    EXPECT_FALSE(table.get("fresh.txt"));
}

TEST(PlaceholderTableTest, QueriesByState) {
    PlaceholderTable table;
    table.set("a", S::Conflicted);
    table.set("b", S::Hydrated);
    table.set("c", S::Conflicted);

    auto conflicted = table.inState(S::Conflicted);
    std::ranges::sort(conflicted);
    EXPECT_EQ(conflicted, (std::vector<std::filesystem::path>{"a", "c"}));

    EXPECT_TRUE(table.erase("a"));
    EXPECT_FALSE(table.erase("a"));
    EXPECT_EQ(table.inState(S::Conflicted).size(), 1u);
}

TEST(LocalPlaceholderHostTest, PlaceholdersReportLogicalSize) {
    TempDir dir("stratus-host");
    LocalPlaceholderHost host(dir.path());

    host.createPlaceholder("docs/report.pdf", 4096, false);
    EXPECT_TRUE(host.exists("docs/report.pdf"));
    EXPECT_EQ(std::filesystem::file_size(dir / "docs/report.pdf"), 4096u);

    host.createPlaceholder("photos", 0, true);
    EXPECT_TRUE(std::filesystem::is_directory(dir / "photos"));
}

TEST(LocalPlaceholderHostTest, CommitReplacesPlaceholderContent) {
    TempDir dir("stratus-host");
    TempDir staging("stratus-staging");
    LocalPlaceholderHost host(dir.path());

    host.createPlaceholder("a.txt", 5, false);
    writeFile(staging / "task.part", "hello");
    host.commitHydration(staging / "task.part", "a.txt");

    EXPECT_EQ(readFile(dir / "a.txt"), "hello");
    EXPECT_FALSE(std::filesystem::exists(staging / "task.part"));

    host.dehydrate("a.txt", 5);
    EXPECT_EQ(std::filesystem::file_size(dir / "a.txt"), 5u);
    EXPECT_NE(readFile(dir / "a.txt"), "hello");
}

TEST(LocalPlaceholderHostTest, RenameAndRemove) {
    TempDir dir("stratus-host");
    LocalPlaceholderHost host(dir.path());
    writeFile(dir / "old.txt", "x");

    host.rename("old.txt", "nested/new.txt");
    EXPECT_FALSE(host.exists("old.txt"));
    EXPECT_EQ(readFile(dir / "nested/new.txt"), "x");

    EXPECT_TRUE(host.remove("nested"));
    EXPECT_FALSE(host.exists("nested/new.txt"));
    EXPECT_FALSE(host.remove("nested"));
}

TEST(LocalPlaceholderHostTest, PathsCannotEscapeTheRoot) {
    TempDir dir("stratus-host");
    LocalPlaceholderHost host(dir.path());

    EXPECT_EQ(host.localPath("/a/b.txt"), dir.path() / "a/b.txt");
    EXPECT_THROW(host.localPath("../etc/passwd"), std::invalid_argument);
    EXPECT_THROW(host.localPath(""), std::invalid_argument);
}

TEST(ConflictCopyNameTest, KeepsDirectoryAndExtension) {
    const auto copy = conflictCopyName("docs/report.txt", 1700000000);
    EXPECT_EQ(copy.parent_path(), "docs");
    EXPECT_TRUE(std::regex_match(copy.filename().string(), std::regex(R"(report \(conflict \d{14}\)\.txt)")))
        << copy.filename();

    const auto bare = conflictCopyName("Makefile", 1700000000);
    EXPECT_TRUE(std::regex_match(bare.string(), std::regex(R"(Makefile \(conflict \d{14}\))"))) << bare;
}
