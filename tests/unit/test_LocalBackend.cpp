#include <gtest/gtest.h>
#include "transfer/LocalBackend.hpp"
#include "crypto/Hash.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace stratus::transfer;
using namespace stratus::test;

class LocalBackendTest : public ::testing::Test {
protected:
    TempDir dir{"stratus-localbackend"};
    LocalBackend backend{dir.path()};

    SessionHandle open(const fs::path& remote, const uintmax_t size, const uintmax_t chunk) {
        return backend.openSession(remote, size, {{attr::CHUNK_SIZE, std::to_string(chunk)}, {"owner", "test"}});
    }
};

TEST_F(LocalBackendTest, ChunksAssembleIntoObject) {
    const auto data = patternBytes(10);
    auto session = open("docs/a.bin", data.size(), 4);
    EXPECT_EQ(session.chunk_size, 4u);
    EXPECT_EQ(session.remote_path, "/docs/a.bin");

    // Out of order, with one duplicate write.
    backend.writeChunk(session, 8, {data.begin() + 8, data.end()});
    backend.writeChunk(session, 0, {data.begin(), data.begin() + 4});
    backend.writeChunk(session, 4, {data.begin() + 4, data.begin() + 8});
    backend.writeChunk(session, 4, {data.begin() + 4, data.begin() + 8});
    EXPECT_EQ(session.acknowledged.size(), 3u);

    const auto obj = backend.finalize(session);
    EXPECT_EQ(obj.path, "/docs/a.bin");
    EXPECT_EQ(obj.remote_id, "docs/a.bin");
    EXPECT_EQ(obj.size, 10u);
    EXPECT_EQ(obj.etag, stratus::crypto::Hash::blake2b(data));
    EXPECT_EQ(obj.attributes.at("owner"), "test");
    EXPECT_EQ(readFile(dir / "docs/a.bin"), std::string(data.begin(), data.end()));

    EXPECT_FALSE(backend.resume(session.token));
}

TEST_F(LocalBackendTest, FinalizeRefusesGaps) {
    auto session = open("gap.bin", 8, 4);
    backend.writeChunk(session, 4, patternBytes(4));
    EXPECT_THROW(backend.finalize(session), BackendError);
    EXPECT_FALSE(fs::exists(dir / "gap.bin"));
    EXPECT_TRUE(backend.resume(session.token));
}

TEST_F(LocalBackendTest, WritesPastDeclaredSizeAreRejected) {
    auto session = open("small.bin", 4, 4);
    try {
        backend.writeChunk(session, 2, patternBytes(4));
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_FALSE(e.transient());
    }

    SessionHandle ghost;
    ghost.token = "deadbeef";
    ghost.total_size = 4;
    EXPECT_THROW(backend.writeChunk(ghost, 0, patternBytes(4)), BackendError);
}

TEST_F(LocalBackendTest, ResumeRebuildsAcknowledgedChunks) {
    auto session = open("r.bin", 12, 4);
    const auto first = backend.writeChunk(session, 0, patternBytes(4, 1));
    backend.writeChunk(session, 8, patternBytes(4, 3));

    const auto resumed = backend.resume(session.token);
    ASSERT_TRUE(resumed);
    EXPECT_EQ(resumed->remote_path, "/r.bin");
    EXPECT_EQ(resumed->total_size, 12u);
    EXPECT_EQ(resumed->chunk_size, 4u);
    EXPECT_EQ(resumed->attributes.at("owner"), "test");
    ASSERT_EQ(resumed->acknowledged.size(), 2u);
    EXPECT_EQ(resumed->acknowledged.at(0), first);
    EXPECT_TRUE(resumed->acknowledged.contains(8));

    backend.abort(*resumed);
    EXPECT_FALSE(backend.resume(session.token));
    EXPECT_FALSE(backend.resume("0123456789abcdef"));
    EXPECT_THROW(backend.resume("../escape"), BackendError);
}

TEST_F(LocalBackendTest, ReadChunkClampsToObjectEnd) {
    writeFile(dir / "plain.txt", "hello world");
    EXPECT_EQ(backend.readChunk("/plain.txt", 6, 100), (std::vector<uint8_t>{'w', 'o', 'r', 'l', 'd'}));
    EXPECT_TRUE(backend.readChunk("plain.txt", 11, 4).empty());
    EXPECT_THROW(backend.readChunk("plain.txt", 12, 4), BackendError);
    EXPECT_THROW(backend.readChunk("absent.txt", 0, 4), BackendError);
}

TEST_F(LocalBackendTest, StatAndListSkipInternalState) {
    writeFile(dir / "a.txt", "a");
    writeFile(dir / "nested/b.txt", "bb");
    open("pending.bin", 4, 4);

    EXPECT_FALSE(backend.stat("missing.txt"));
    const auto b = backend.stat("nested/b.txt");
    ASSERT_TRUE(b);
    EXPECT_EQ(b->size, 2u);
    EXPECT_TRUE(b->attributes.empty());

    auto all = backend.list("/");
    std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) { return a.path < b.path; });
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].path, "/a.txt");
    EXPECT_EQ(all[1].path, "/nested/b.txt");

    EXPECT_EQ(backend.list("nested").size(), 1u);
    EXPECT_TRUE(backend.list("nowhere").empty());
}

TEST_F(LocalBackendTest, CopyMoveAndRemoveCarryAttributes) {
    auto session = open("src.bin", 3, 4);
    backend.writeChunk(session, 0, patternBytes(3));
    backend.finalize(session);

    const auto copied = backend.copy("src.bin", "copies/dup.bin");
    EXPECT_EQ(copied.attributes.at("owner"), "test");
    EXPECT_TRUE(backend.stat("src.bin"));

    const auto moved = backend.move("src.bin", "moved.bin");
    EXPECT_EQ(moved.attributes.at("owner"), "test");
    EXPECT_FALSE(backend.stat("src.bin"));

    EXPECT_TRUE(backend.remove("moved.bin"));
    EXPECT_FALSE(backend.remove("moved.bin"));
    EXPECT_THROW(backend.copy("moved.bin", "x.bin"), BackendError);
    EXPECT_THROW(backend.move("moved.bin", "x.bin"), BackendError);
}

TEST_F(LocalBackendTest, RemotePathsStayInsideRoot) {
    EXPECT_THROW(backend.stat("../outside"), std::invalid_argument);
    EXPECT_THROW(backend.stat(".stratus/uploads"), std::invalid_argument);
    EXPECT_THROW(backend.openSession("", 1, {}), std::invalid_argument);
}
