#include "storage/fsFileStore.hpp"
#include "storage/memoryFileStore.hpp"
#include "testStreams.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace p2ps;
using namespace p2ps::test;

namespace fs = std::filesystem;

namespace {

std::atomic<int> dir_counter{0};

//reads everything out of a handle
std::string drain(ReadHandle& handle) {
    std::string contents;
    uint8_t     buff[512];
    ssize_t     n;
    while ((n = handle.source->read(buff, sizeof(buff))) > 0)
        contents.append(reinterpret_cast<const char*>(buff), n);
    return contents;
}

size_t entriesIn(const fs::path& dir) {
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

class FsFileStoreTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("p2ps-test-" + std::to_string(getpid()) + "-" + std::to_string(dir_counter++));
        fs::remove_all(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} //namespace

TEST(PlainNameTest, AcceptsAndRejects) {
    EXPECT_TRUE(isPlainName("hello.txt"));
    EXPECT_TRUE(isPlainName("my file (1).txt"));
    EXPECT_TRUE(isPlainName(".hidden"));

    EXPECT_FALSE(isPlainName(""));
    EXPECT_FALSE(isPlainName("."));
    EXPECT_FALSE(isPlainName(".."));
    EXPECT_FALSE(isPlainName("../secret"));
    EXPECT_FALSE(isPlainName("dir/file"));
    EXPECT_FALSE(isPlainName("dir\\file"));
    EXPECT_FALSE(isPlainName(std::string("a\0b", 3)));
}

TEST_F(FsFileStoreTest, CreatesDirectoryOnDemand) {
    FsFileStore store(dir / "nested" / "shared");

    EXPECT_TRUE(store.listNames().empty());
    EXPECT_TRUE(fs::is_directory(dir / "nested" / "shared"));
}

TEST_F(FsFileStoreTest, ListsRegularFilesSorted) {
    FsFileStore store(dir);
    ASSERT_EQ(store.createSampleFile("c.txt", "c"), EXIT_SUCCESS);
    ASSERT_EQ(store.createSampleFile("a.txt", "a"), EXIT_SUCCESS);
    ASSERT_EQ(store.createSampleFile("b.txt", "b"), EXIT_SUCCESS);
    fs::create_directory(dir / "subdir");

    EXPECT_EQ(store.listNames(), (std::vector<std::string>{"a.txt", "b.txt", "c.txt"}));
}

TEST_F(FsFileStoreTest, SampleFileReadsBack) {
    FsFileStore store(dir);
    ASSERT_EQ(store.createSampleFile("hello.txt", "Hello there\n"), EXIT_SUCCESS);

    ReadHandle handle;
    ASSERT_EQ(store.openForRead("hello.txt", handle), ErrorCode::OK);
    EXPECT_EQ(handle.size, 12u);
    EXPECT_EQ(drain(handle), "Hello there\n");
}

TEST_F(FsFileStoreTest, SampleFileRejectsPath) {
    FsFileStore store(dir);
    EXPECT_EQ(store.createSampleFile("../escape.txt", "x"), EXIT_FAILURE);
}

TEST_F(FsFileStoreTest, OpenMissingOrInvalid) {
    FsFileStore store(dir);
    ReadHandle  handle;

    EXPECT_EQ(store.openForRead("missing.txt", handle), ErrorCode::NOT_FOUND_ERROR);
    EXPECT_EQ(store.openForRead("../missing.txt", handle), ErrorCode::INVALID_NAME);
    EXPECT_EQ(handle.source, nullptr);
}

TEST_F(FsFileStoreTest, WriteIsInvisibleUntilCommit) {
    FsFileStore store(dir);
    auto        sink = store.openForWrite("data.bin");
    ASSERT_NE(sink, nullptr);

    std::vector<uint8_t> payload = patternBytes(5000);
    ASSERT_TRUE(sink->write(payload.data(), payload.size()));
    EXPECT_TRUE(store.listNames().empty());

    ASSERT_EQ(sink->commit(), EXIT_SUCCESS);
    EXPECT_EQ(store.listNames(), std::vector<std::string>{"data.bin"});
    EXPECT_EQ(entriesIn(dir), 1u);

    ReadHandle handle;
    ASSERT_EQ(store.openForRead("data.bin", handle), ErrorCode::OK);
    EXPECT_EQ(drain(handle), asString(payload));
}

TEST_F(FsFileStoreTest, DiscardLeavesNothing) {
    FsFileStore store(dir);
    auto        sink = store.openForWrite("data.bin");
    ASSERT_NE(sink, nullptr);

    std::vector<uint8_t> payload = patternBytes(100);
    ASSERT_TRUE(sink->write(payload.data(), payload.size()));
    sink->discard();

    EXPECT_EQ(entriesIn(dir), 0u);
    EXPECT_EQ(sink->commit(), EXIT_FAILURE);
    EXPECT_EQ(entriesIn(dir), 0u);
}

TEST_F(FsFileStoreTest, DroppedSinkDiscards) {
    FsFileStore store(dir);
    {
        auto sink = store.openForWrite("data.bin");
        ASSERT_NE(sink, nullptr);
        std::vector<uint8_t> payload = patternBytes(100);
        ASSERT_TRUE(sink->write(payload.data(), payload.size()));
    }

    EXPECT_EQ(entriesIn(dir), 0u);
}

TEST_F(FsFileStoreTest, CommitReplacesExistingFile) {
    FsFileStore store(dir);
    ASSERT_EQ(store.createSampleFile("notes.txt", "old contents"), EXIT_SUCCESS);

    auto sink = store.openForWrite("notes.txt");
    ASSERT_NE(sink, nullptr);
    std::string fresh = "new";
    ASSERT_TRUE(sink->write(reinterpret_cast<const uint8_t*>(fresh.data()), fresh.size()));
    ASSERT_EQ(sink->commit(), EXIT_SUCCESS);

    ReadHandle handle;
    ASSERT_EQ(store.openForRead("notes.txt", handle), ErrorCode::OK);
    EXPECT_EQ(drain(handle), "new");
}

TEST_F(FsFileStoreTest, WriteRejectsPath) {
    FsFileStore store(dir);
    EXPECT_EQ(store.openForWrite("../data.bin"), nullptr);
    EXPECT_EQ(store.openForWrite(""), nullptr);
}

TEST_F(FsFileStoreTest, DigestIsSha256) {
    FsFileStore store(dir);
    ASSERT_EQ(store.createSampleFile("abc.txt", "abc"), EXIT_SUCCESS);
    ASSERT_EQ(store.createSampleFile("empty.txt", ""), EXIT_SUCCESS);

    EXPECT_EQ(store.digest("abc.txt"),
              std::optional<std::string>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    EXPECT_EQ(store.digest("empty.txt"),
              std::optional<std::string>("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
    EXPECT_EQ(store.digest("missing.txt"), std::nullopt);
}

TEST(MemoryFileStoreTest, ListsSortedNames) {
    MemoryFileStore store;
    store.put("zeta", "z");
    store.put("alpha", "a");
    store.put("mid", "m");

    EXPECT_EQ(store.listNames(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
    EXPECT_TRUE(store.remove("mid"));
    EXPECT_FALSE(store.remove("mid"));
    EXPECT_EQ(store.listNames(), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST(MemoryFileStoreTest, OpenSourceSurvivesRemoval) {
    MemoryFileStore store;
    store.put("doc", "contents");

    ReadHandle handle;
    ASSERT_EQ(store.openForRead("doc", handle), ErrorCode::OK);
    store.remove("doc");

    EXPECT_EQ(handle.size, 8u);
    EXPECT_EQ(drain(handle), "contents");
    EXPECT_EQ(store.openForRead("doc", handle), ErrorCode::NOT_FOUND_ERROR);
}

TEST(MemoryFileStoreTest, SinkCommitsIntoStore) {
    MemoryFileStore store;
    auto            sink = store.openForWrite("new.bin");
    ASSERT_NE(sink, nullptr);

    std::vector<uint8_t> payload = patternBytes(300);
    ASSERT_TRUE(sink->write(payload.data(), payload.size()));
    EXPECT_EQ(store.contents("new.bin"), std::nullopt);

    ASSERT_EQ(sink->commit(), EXIT_SUCCESS);
    EXPECT_EQ(store.contents("new.bin"), std::optional<std::vector<uint8_t>>(payload));
}

TEST(MemoryFileStoreTest, DiscardedSinkLeavesNothing) {
    MemoryFileStore store;
    auto            sink = store.openForWrite("new.bin");
    ASSERT_NE(sink, nullptr);

    std::vector<uint8_t> payload = patternBytes(10);
    ASSERT_TRUE(sink->write(payload.data(), payload.size()));
    sink->discard();

    EXPECT_EQ(sink->commit(), EXIT_FAILURE);
    EXPECT_TRUE(store.listNames().empty());
}

TEST(MemoryFileStoreTest, RejectsPaths) {
    MemoryFileStore store;
    ReadHandle      handle;

    EXPECT_EQ(store.openForRead("a/b", handle), ErrorCode::INVALID_NAME);
    EXPECT_EQ(store.openForWrite(".."), nullptr);
}

TEST(MemoryFileStoreTest, DigestMatchesFsStore) {
    MemoryFileStore store;
    store.put("abc", "abc");

    EXPECT_EQ(store.digest("abc"),
              std::optional<std::string>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}
