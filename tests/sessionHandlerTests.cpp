#include "server/internal/sessionHandler.hpp"
#include "storage/memoryFileStore.hpp"
#include "testStreams.hpp"

#include <gtest/gtest.h>

using namespace p2ps;
using namespace p2ps::test;

namespace {

//lists a file it can no longer open, as if deleted after listing
class VanishingFileStore : public FileStore {
public:
    std::vector<std::string> listNames() override { return {"ghost.txt"}; }

    ErrorCode openForRead(const std::string&, ReadHandle&) override {
        return ErrorCode::NOT_FOUND_ERROR;
    }

    std::unique_ptr<ByteSink> openForWrite(const std::string&) override { return nullptr; }
};

class SessionHandlerTest : public ::testing::Test {
protected:
    MemoryFileStore store;
};

} //namespace

TEST_F(SessionHandlerTest, ListsFilesInStoreOrder) {
    store.put("b.txt", "bee");
    store.put("a.txt", "ay");
    ScriptedStream conn("LIST_FILES\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "2\na.txt\nb.txt\n");
    EXPECT_FALSE(conn.isOpen());
}

TEST_F(SessionHandlerTest, ListsEmptyStore) {
    ScriptedStream conn("LIST_FILES\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "0\n");
}

TEST_F(SessionHandlerTest, CommandIsCaseInsensitive) {
    store.put("a.txt", "ay");
    ScriptedStream conn("list_files\r\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "1\na.txt\n");
}

TEST_F(SessionHandlerTest, SendsRequestedFile) {
    store.put("hello.txt", "hello");
    ScriptedStream conn("DOWNLOAD_FILE\nhello.txt\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "OK\n" + sizeHeader(5) + "hello");
    EXPECT_FALSE(conn.isOpen());
}

TEST_F(SessionHandlerTest, TrimsRequestedName) {
    store.put("hello.txt", "hello");
    ScriptedStream conn("download_file\n  hello.txt \r\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "OK\n" + sizeHeader(5) + "hello");
}

TEST_F(SessionHandlerTest, SendsEmptyFile) {
    store.put("empty", std::vector<uint8_t>());
    ScriptedStream conn("DOWNLOAD_FILE\nempty\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "OK\n" + sizeHeader(0));
}

TEST_F(SessionHandlerTest, BlankNameIsRejected) {
    ScriptedStream conn("DOWNLOAD_FILE\n   \n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "ERROR: No file name provided\n");
}

TEST_F(SessionHandlerTest, MissingNameIsRejected) {
    store.put("a.txt", "ay");
    ScriptedStream conn("DOWNLOAD_FILE\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "ERROR: No file name provided\n");
    EXPECT_FALSE(conn.isOpen());
}

TEST_F(SessionHandlerTest, UnknownFileGetsNoPayload) {
    store.put("a.txt", "ay");
    ScriptedStream conn("DOWNLOAD_FILE\nnope.txt\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "ERROR: File not found: nope.txt\n");
}

TEST_F(SessionHandlerTest, PathOutsideStoreIsNotFound) {
    ScriptedStream conn("DOWNLOAD_FILE\n../../etc/passwd\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "ERROR: File not found: ../../etc/passwd\n");
}

TEST_F(SessionHandlerTest, FileGoneAfterListingIsNotFound) {
    VanishingFileStore vanishing;
    ScriptedStream     conn("DOWNLOAD_FILE\nghost.txt\n");

    EXPECT_EQ(handleSession(conn, vanishing, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "ERROR: File not found: ghost.txt\n");
}

TEST_F(SessionHandlerTest, UnknownCommandIsEchoed) {
    ScriptedStream conn("HELLO\nLIST_FILES\n");

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "ERROR: Unknown command: HELLO\n");
    EXPECT_FALSE(conn.isOpen());
}

TEST_F(SessionHandlerTest, ClosedBeforeCommandSendsNothing) {
    ScriptedStream conn("");

    //what a reachability check looks like from this side
    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::OK);
    EXPECT_EQ(conn.written(), "");
    EXPECT_EQ(conn.closeCalls(), 1);
}

TEST_F(SessionHandlerTest, WriteFailureStillCloses) {
    store.put("a.txt", "ay");
    ScriptedStream conn("LIST_FILES\n");
    conn.failWrites();

    EXPECT_EQ(handleSession(conn, store, "test"), ErrorCode::IO_ERROR);
    EXPECT_EQ(conn.closeCalls(), 1);
}
