#include "../stream/StreamReader.hpp"
#include "../engine/Errors.hpp"
#include "../manager/PriorityScheduler.hpp"
#include "FakeTransferEngine.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

class StreamReaderTest : public ::testing::Test {
protected:
    // Ten 1 KiB pieces, readahead covers four of them
    StreamReaderTest()
        : metadata(makeMetadata({{"movie.mp4", 10240}}, 1024)),
          content(makeContent(10240)),
          transfer(std::make_shared<FakeTransfer>(metadata, content, true)) {
        options.readahead = 4096;
        options.deadline_step_ms = 50;
        options.wait_slice = std::chrono::milliseconds(10);

        stream.session_id = 1;
        stream.transfer = transfer;
        stream.file = metadata.files[0];
        stream.piece_length = metadata.piece_length;
        stream.num_pieces = metadata.num_pieces;
        stream.etag = "\"movie\"";
        stream.scheduler = std::make_shared<PriorityScheduler>(
            transfer, stream.file, stream.piece_length, stream.num_pieces);
        stream.scheduler->prime();
    }

    TransferMetadata metadata;
    std::string content;
    std::shared_ptr<FakeTransfer> transfer;
    ActiveStream stream;
    ReaderOptions options;
    CancelCheck never = [] { return false; };
};

TEST_F(StreamReaderTest, ReadsCompletedPieces) {
    transfer->completePiece(0);
    StreamReader reader(stream, options);

    std::string buffer(1024, '\0');
    ASSERT_EQ(1024u, reader.read(0, buffer.data(), buffer.size(), never));
    EXPECT_EQ(content.substr(0, 1024), buffer);
    EXPECT_EQ(1024, reader.position());
    EXPECT_EQ("\"movie\"", reader.identity());
}

TEST_F(StreamReaderTest, ReadBlocksUntilPieceArrives) {
    StreamReader reader(stream, options);
    std::thread completer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        transfer->completePiece(2);
    });

    std::string buffer(512, '\0');
    EXPECT_EQ(512u, reader.read(2048, buffer.data(), buffer.size(), never));
    EXPECT_EQ(content.substr(2048, 512), buffer);
    completer.join();
}

TEST_F(StreamReaderTest, ClampsAtEndOfFile) {
    transfer->completeAll();
    StreamReader reader(stream, options);

    std::string buffer(1024, '\0');
    EXPECT_EQ(240u, reader.read(10000, buffer.data(), buffer.size(), never));
    EXPECT_EQ(content.substr(10000, 240), buffer.substr(0, 240));
    EXPECT_EQ(0u, reader.read(10240, buffer.data(), buffer.size(), never));
}

TEST_F(StreamReaderTest, RejectsOffsetsOutsideFile) {
    StreamReader reader(stream, options);
    char byte;

    EXPECT_THROW(reader.read(10241, &byte, 1, never), RangeNotSatisfiableError);
    EXPECT_THROW(reader.read(-1, &byte, 1, never), RangeNotSatisfiableError);
}

TEST_F(StreamReaderTest, CancelledReadGivesUp) {
    StreamReader reader(stream, options);
    std::atomic<bool> cancelled{false};
    std::thread canceller([&cancelled] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        cancelled = true;
    });

    char byte;
    EXPECT_THROW(reader.read(0, &byte, 1, [&cancelled] { return cancelled.load(); }), ReadCancelledError);
    canceller.join();
}

TEST_F(StreamReaderTest, DetachWakesBlockedRead) {
    StreamReader reader(stream, options);
    std::thread dropper([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        transfer->detach();
    });

    char byte;
    EXPECT_THROW(reader.read(0, &byte, 1, never), TransferClosedError);
    dropper.join();
}

TEST_F(StreamReaderTest, FailedTransferEndsRead) {
    transfer->setFailed("disk full");
    StreamReader reader(stream, options);

    char byte;
    EXPECT_THROW(reader.read(0, &byte, 1, never), TransferClosedError);
}

TEST_F(StreamReaderTest, ReadaheadDeadlinesGrowWithDistance) {
    transfer->completePiece(0);
    StreamReader reader(stream, options);

    char byte;
    reader.read(0, &byte, 1, never);
    EXPECT_EQ((std::map<int, int>{{1, 50}, {2, 100}, {3, 150}}), transfer->pieceDeadlines());
}

TEST_F(StreamReaderTest, SeekMovesHeadWindow) {
    transfer->completePiece(8);
    StreamReader reader(stream, options);

    std::string buffer(1024, '\0');
    ASSERT_EQ(1024u, reader.read(8192, buffer.data(), buffer.size(), never));
    EXPECT_EQ(content.substr(8192, 1024), buffer);
    EXPECT_EQ(9216, reader.position());

    auto priorities = transfer->piecePriorities();
    EXPECT_EQ(PiecePriority::Normal, priorities.at(0));
    EXPECT_EQ(PiecePriority::Immediate, priorities.at(8));
    EXPECT_EQ(PiecePriority::Immediate, priorities.at(9));
    EXPECT_EQ((std::map<int, int>{{9, 50}}), transfer->pieceDeadlines());
}

TEST_F(StreamReaderTest, NewReaderMovesHeadWindowBack) {
    transfer->completePiece(0);
    transfer->completePiece(8);
    std::string buffer(1024, '\0');
    {
        StreamReader first(stream, options);
        ASSERT_EQ(1024u, first.read(8192, buffer.data(), buffer.size(), never));
    }
    EXPECT_EQ(8192, stream.scheduler->getWindow().head_begin);

    // A player seeking back opens a fresh request at the start
    StreamReader second(stream, options);
    ASSERT_EQ(1024u, second.read(0, buffer.data(), buffer.size(), never));
    EXPECT_EQ(content.substr(0, 1024), buffer);
    EXPECT_EQ(0, stream.scheduler->getWindow().head_begin);

    auto priorities = transfer->piecePriorities();
    EXPECT_EQ(PiecePriority::Immediate, priorities.at(0));
    EXPECT_EQ(PiecePriority::Normal, priorities.at(8));
    EXPECT_EQ(PiecePriority::Immediate, priorities.at(9));
}

TEST_F(StreamReaderTest, FirstReadAtHeadKeepsPriorities) {
    transfer->completePiece(0);
    int calls = transfer->priorityCalls();

    StreamReader reader(stream, options);
    char byte;
    reader.read(10, &byte, 1, never);
    EXPECT_EQ(calls, transfer->priorityCalls());
}

TEST_F(StreamReaderTest, CloseReleasesDeadlinesAndListener) {
    transfer->completePiece(0);
    {
        StreamReader reader(stream, options);
        EXPECT_EQ(1u, transfer->listenerCount());
        char byte;
        reader.read(0, &byte, 1, never);
        EXPECT_FALSE(transfer->pieceDeadlines().empty());
    }
    EXPECT_EQ(0u, transfer->listenerCount());
    EXPECT_TRUE(transfer->pieceDeadlines().empty());
}

TEST_F(StreamReaderTest, AvailabilityFollowsCompletedPieces) {
    transfer->completePiece(0);
    transfer->completePiece(1);
    StreamReader reader(stream, options);

    EXPECT_TRUE(reader.isAvailable(0, 2048));
    EXPECT_FALSE(reader.isAvailable(1024, 2048));
    EXPECT_FALSE(reader.isAvailable(10000, 1000));
}

TEST_F(StreamReaderTest, RequiresTransfer) {
    ActiveStream empty;
    EXPECT_THROW({ StreamReader reader(empty, options); }, NoActiveSessionError);
}
