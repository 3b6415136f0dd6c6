#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <csignal>
#include <cstring>
#include <limits>
#include <string>
#include <vector>
#include <sys/resource.h>
#include "checksum/checksum.hpp"
#include "network/message_channel.hpp"
#include "store/store.hpp"
#include "transfer/transfer_engine.hpp"
#include "test_utils.hpp"

using namespace fts::network;
using fts::checksum::Checksum;
using fts::store::Store;
using fts::transfer::TransferEngine;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class MockMessageChannel : public MessageChannel {
public:
    MOCK_METHOD(NetworkError, receive, (Message& message), (override));
    MOCK_METHOD(bool, send, (const Message& message), (override));
    MOCK_METHOD(std::size_t, read_payload, (char* data, std::size_t size), (override));
    MOCK_METHOD(bool, write_payload, (const char* data, std::size_t size), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, is_open, (), (const, override));
};

// Caps the size of files this process may write, restoring the previous
// limit and SIGXFSZ disposition on destruction
class ScopedFileSizeLimit {
public:
    explicit ScopedFileSizeLimit(rlim_t limit) {
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        getrlimit(RLIMIT_FSIZE, &previous_limit_);
        rlimit capped = previous_limit_;
        capped.rlim_cur = limit;
        active_ = setrlimit(RLIMIT_FSIZE, &capped) == 0;
    }

    ~ScopedFileSizeLimit() {
        setrlimit(RLIMIT_FSIZE, &previous_limit_);
        std::signal(SIGXFSZ, previous_handler_);
    }

    ScopedFileSizeLimit(const ScopedFileSizeLimit&) = delete;
    ScopedFileSizeLimit& operator=(const ScopedFileSizeLimit&) = delete;

    bool active() const { return active_; }

private:
    rlimit previous_limit_{};
    void (*previous_handler_)(int) = SIG_DFL;
    bool active_ = false;
};

class TransferEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<TempDirectory> test_dir;
    std::unique_ptr<Store> store;
    NiceMock<MockMessageChannel> channel;

    // Everything the engine sent, in order
    std::vector<Message> sent;
    // Payload bytes the engine reads from the client side
    std::string incoming;
    std::size_t incoming_position = 0;
    // Payload bytes the engine wrote to the client side
    std::string outgoing;

    void SetUp() override {
        init_test_logging();
        test_dir = std::make_unique<TempDirectory>("transfer_engine_test");
        store = std::make_unique<Store>(test_dir->path());

        ON_CALL(channel, send(_)).WillByDefault(Invoke([this](const Message& message) {
            sent.push_back(message);
            return true;
        }));
        ON_CALL(channel, read_payload(_, _)).WillByDefault(Invoke([this](char* data, std::size_t size) {
            std::size_t n = std::min(size, incoming.size() - incoming_position);
            std::memcpy(data, incoming.data() + incoming_position, n);
            incoming_position += n;
            return n;
        }));
        ON_CALL(channel, write_payload(_, _)).WillByDefault(Invoke([this](const char* data, std::size_t size) {
            outgoing.append(data, size);
            return true;
        }));
        ON_CALL(channel, is_open()).WillByDefault(Return(true));
    }

    void TearDown() override {
        store.reset();
        test_dir.reset();
    }

    // Queues the client's checksum reply for the storage workflow
    void reply_with(const Message& message) {
        EXPECT_CALL(channel, receive(_))
            .WillOnce(DoAll(SetArgReferee<0>(message), Return(NetworkError::SUCCESS)));
    }

    static void expect_response(const Message& message, bool ok, const std::string& text) {
        ASSERT_TRUE(std::holds_alternative<Response>(message));
        EXPECT_EQ(std::get<Response>(message).ok, ok);
        EXPECT_EQ(std::get<Response>(message).message, text);
    }

    static std::vector<uint8_t> md5(const std::string& data) {
        return Checksum::compute(data);
    }
};

//==============================================
// SESSION LOOP
//==============================================

TEST_F(TransferEngineTest, CleanCloseEndsSession) {
    EXPECT_CALL(channel, receive(_)).WillOnce(Return(NetworkError::CONNECTION_CLOSED));
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine(channel, *store).run();
    EXPECT_TRUE(sent.empty());
}

TEST_F(TransferEngineTest, ReceiveErrorIsTerminal) {
    EXPECT_CALL(channel, receive(_)).WillOnce(Return(NetworkError::INVALID_MESSAGE));
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine(channel, *store).run();
}

TEST_F(TransferEngineTest, EmptyMessageEndsSession) {
    EXPECT_CALL(channel, receive(_))
        .WillOnce(DoAll(SetArgReferee<0>(Message{}), Return(NetworkError::SUCCESS)));
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine(channel, *store).run();
    EXPECT_TRUE(sent.empty());
}

TEST_F(TransferEngineTest, UnexpectedMessageIsIgnored) {
    EXPECT_CALL(channel, receive(_))
        .WillOnce(DoAll(SetArgReferee<0>(Message{Response{true, "stray"}}), Return(NetworkError::SUCCESS)))
        .WillOnce(Return(NetworkError::CONNECTION_CLOSED));

    TransferEngine(channel, *store).run();
    EXPECT_TRUE(sent.empty());
}

TEST_F(TransferEngineTest, SessionHandlesSeveralRequests) {
    write_file(test_dir->path() / "a.txt", "first");
    write_file(test_dir->path() / "b.txt", "second");

    EXPECT_CALL(channel, receive(_))
        .WillOnce(DoAll(SetArgReferee<0>(Message{RetrievalRequest{"a.txt"}}), Return(NetworkError::SUCCESS)))
        .WillOnce(DoAll(SetArgReferee<0>(Message{RetrievalRequest{"b.txt"}}), Return(NetworkError::SUCCESS)))
        .WillOnce(Return(NetworkError::CONNECTION_CLOSED));

    TransferEngine(channel, *store).run();

    EXPECT_EQ(outgoing, "firstsecond");
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<ChecksumVerification>(sent[3]));
}


//==============================================
// STORAGE WORKFLOW
//==============================================

TEST_F(TransferEngineTest, StoreWithMatchingChecksum) {
    incoming = "payload bytes";
    reply_with(ChecksumVerification{md5(incoming)});
    EXPECT_CALL(channel, close()).Times(0);

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(StorageRequest{"stored.txt", incoming.size()});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::CONTINUE);
    ASSERT_EQ(sent.size(), 2u);
    expect_response(sent[0], true, "Ready for data");
    expect_response(sent[1], true, "File stored successfully");
    EXPECT_EQ(read_file(test_dir->path() / "stored.txt"), incoming);
}

TEST_F(TransferEngineTest, StoreEmptyFile) {
    reply_with(ChecksumVerification{md5("")});

    TransferEngine engine(channel, *store);
    engine.handle_storage(StorageRequest{"empty.txt", 0});

    ASSERT_EQ(sent.size(), 2u);
    expect_response(sent[1], true, "File stored successfully");
    EXPECT_TRUE(std::filesystem::exists(test_dir->path() / "empty.txt"));
}

TEST_F(TransferEngineTest, StoreWithMismatchedChecksumRemovesFile) {
    incoming = "payload bytes";
    reply_with(ChecksumVerification{md5("something else")});
    EXPECT_CALL(channel, close()).Times(0);

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(StorageRequest{"bad.txt", incoming.size()});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::CONTINUE);
    ASSERT_EQ(sent.size(), 2u);
    expect_response(sent[1], false, "Checksum verification failed");
    EXPECT_FALSE(std::filesystem::exists(test_dir->path() / "bad.txt"));
}

TEST_F(TransferEngineTest, NonChecksumReplyCountsAsMismatch) {
    incoming = "data";
    reply_with(Response{true, "not a checksum"});

    TransferEngine engine(channel, *store);
    engine.handle_storage(StorageRequest{"odd.txt", incoming.size()});

    ASSERT_EQ(sent.size(), 2u);
    expect_response(sent[1], false, "Checksum verification failed");
    EXPECT_FALSE(std::filesystem::exists(test_dir->path() / "odd.txt"));
}

TEST_F(TransferEngineTest, ChecksumReceiveFailureRemovesFileSilently) {
    incoming = "partial";
    EXPECT_CALL(channel, receive(_)).WillOnce(Return(NetworkError::CONNECTION_LOST));
    EXPECT_CALL(channel, close()).Times(0);

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(StorageRequest{"lost.txt", 100});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::CONTINUE);
    ASSERT_EQ(sent.size(), 1u);
    expect_response(sent[0], true, "Ready for data");
    EXPECT_FALSE(std::filesystem::exists(test_dir->path() / "lost.txt"));
}

TEST_F(TransferEngineTest, WriteFailureDrainsPayloadAndKeepsSession) {
    incoming = std::string(300000, 'w');
    reply_with(ChecksumVerification{md5(incoming)});
    EXPECT_CALL(channel, close()).Times(0);

    auto outcome = TransferEngine::WorkflowResult::DISCONNECT;
    {
        ScopedFileSizeLimit limit(100000);
        ASSERT_TRUE(limit.active());
        TransferEngine engine(channel, *store);
        outcome = engine.handle_storage(StorageRequest{"too_big.bin", incoming.size()});
    }

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::CONTINUE);
    EXPECT_EQ(incoming_position, incoming.size());
    ASSERT_EQ(sent.size(), 2u);
    expect_response(sent[0], true, "Ready for data");
    expect_response(sent[1], false, "Failed to write file");
    EXPECT_FALSE(std::filesystem::exists(test_dir->path() / "too_big.bin"));
}

TEST_F(TransferEngineTest, FreeSpaceQueryFailureIsRejected) {
    // Store root vanishes after startup, so the filesystem query fails
    std::filesystem::remove_all(test_dir->path());
    EXPECT_CALL(channel, read_payload(_, _)).Times(0);
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(StorageRequest{"orphan.txt", 10});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::DISCONNECT);
    ASSERT_EQ(sent.size(), 1u);
    expect_response(sent[0], false, "Cannot check disk space");
}

TEST_F(TransferEngineTest, ExistingFileIsRejected) {
    write_file(test_dir->path() / "taken.txt", "original");
    EXPECT_CALL(channel, receive(_)).Times(0);
    EXPECT_CALL(channel, read_payload(_, _)).Times(0);
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(StorageRequest{"taken.txt", 3});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::DISCONNECT);
    ASSERT_EQ(sent.size(), 1u);
    expect_response(sent[0], false, "File already exists");
    EXPECT_EQ(read_file(test_dir->path() / "taken.txt"), "original");
}

TEST_F(TransferEngineTest, InsufficientSpaceIsRejected) {
    EXPECT_CALL(channel, read_payload(_, _)).Times(0);
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(
        StorageRequest{"huge.bin", std::numeric_limits<uint64_t>::max()});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::DISCONNECT);
    ASSERT_EQ(sent.size(), 1u);
    expect_response(sent[0], false, "Insufficient disk space");
    EXPECT_FALSE(std::filesystem::exists(test_dir->path() / "huge.bin"));
}

TEST_F(TransferEngineTest, InvalidStorageNameIsRejected) {
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_storage(StorageRequest{"../..", 1});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::DISCONNECT);
    ASSERT_EQ(sent.size(), 1u);
    expect_response(sent[0], false, "Invalid file name");
}

TEST_F(TransferEngineTest, TraversalNameIsStoredInsideRoot) {
    incoming = "contained";
    reply_with(ChecksumVerification{md5(incoming)});

    TransferEngine engine(channel, *store);
    engine.handle_storage(StorageRequest{"../../escaped.txt", incoming.size()});

    EXPECT_EQ(read_file(test_dir->path() / "escaped.txt"), incoming);
    EXPECT_FALSE(std::filesystem::exists(test_dir->path().parent_path() / "escaped.txt"));
}


//==============================================
// RETRIEVAL WORKFLOW
//==============================================

TEST_F(TransferEngineTest, RetrieveSendsSizeBytesAndChecksum) {
    const std::string content(200000, 'r');
    write_file(test_dir->path() / "big.bin", content);
    EXPECT_CALL(channel, close()).Times(0);

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_retrieval(RetrievalRequest{"big.bin"});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::CONTINUE);
    ASSERT_EQ(sent.size(), 2u);
    ASSERT_TRUE(std::holds_alternative<RetrievalResponse>(sent[0]));
    EXPECT_TRUE(std::get<RetrievalResponse>(sent[0]).ok);
    EXPECT_EQ(std::get<RetrievalResponse>(sent[0]).size, content.size());
    EXPECT_EQ(outgoing, content);
    ASSERT_TRUE(std::holds_alternative<ChecksumVerification>(sent[1]));
    EXPECT_EQ(std::get<ChecksumVerification>(sent[1]).checksum, md5(content));
}

TEST_F(TransferEngineTest, RetrieveMissingFile) {
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_retrieval(RetrievalRequest{"missing.txt"});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::DISCONNECT);
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<RetrievalResponse>(sent[0]));
    EXPECT_FALSE(std::get<RetrievalResponse>(sent[0]).ok);
    EXPECT_EQ(std::get<RetrievalResponse>(sent[0]).message, "File not found");
    EXPECT_EQ(std::get<RetrievalResponse>(sent[0]).size, 0u);
    EXPECT_TRUE(outgoing.empty());
}

TEST_F(TransferEngineTest, RetrieveDirectoryIsNotFound) {
    std::filesystem::create_directory(test_dir->path() / "folder");

    TransferEngine engine(channel, *store);
    engine.handle_retrieval(RetrievalRequest{"folder"});

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_FALSE(std::get<RetrievalResponse>(sent[0]).ok);
}

TEST_F(TransferEngineTest, RetrieveSendFailureDisconnects) {
    write_file(test_dir->path() / "file.bin", std::string(1000, 'x'));
    EXPECT_CALL(channel, write_payload(_, _)).WillOnce(Return(false));
    EXPECT_CALL(channel, close()).Times(::testing::AtLeast(1));

    TransferEngine engine(channel, *store);
    auto outcome = engine.handle_retrieval(RetrievalRequest{"file.bin"});

    EXPECT_EQ(outcome, TransferEngine::WorkflowResult::DISCONNECT);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<RetrievalResponse>(sent[0]));
}
