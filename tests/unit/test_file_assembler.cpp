#include <gtest/gtest.h>
#include "tether/transfer/file_assembler.hpp"
#include "helpers/test_sources.hpp"
#include "tether/core/logger.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace tether;
using namespace tether::transfer;
using tether::core::TransferError;

namespace {
    // Sink whose writes start failing after a number of successful ones
    class FailingSink : public ChunkSink {
    public:
        explicit FailingSink(int writes_before_failure) : remaining_(writes_before_failure) {}
        
        core::Result open() override { return core::Result(); }
        core::Result write(std::span<const std::uint8_t> bytes) override {
            if (remaining_-- <= 0) {
                return core::Result(TransferError::SINK_WRITE_ERROR, "No space left on device");
            }
            written_ += bytes.size();
            return core::Result();
        }
        core::Result finish() override { return core::Result(); }
        void discard(bool) override {}
        std::uint64_t get_bytes_written() const override { return written_; }
    
    private:
        int remaining_;
        std::uint64_t written_ = 0;
    };
}

class FileAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.download_dir = temp_dir_ / "downloads";
        options_.progress_interval = 2;
    }
    
    std::shared_ptr<TransferSession> make_session(const std::string& id = "download_1_00000001") {
        return std::make_shared<TransferSession>(id, "laptop", SessionRole::RECEIVER);
    }
    
    network::ChunkMessage chunk(const std::string& session_id, std::uint64_t index,
                                const std::vector<std::uint8_t>& bytes) {
        return network::ChunkMessage::from_bytes(session_id, index, bytes);
    }
    
    tether::testing::TempDir temp_dir_;
    AssemblerOptions options_;
};

TEST_F(FileAssemblerTest, OutputPathNaming) {
    FileAssembler assembler(options_);
    EXPECT_EQ(assembler.output_path_for("laptop", "download_5_abcdef01"),
              options_.download_dir / "laptop_download_5_abcdef01_file_to_download.txt");
}

TEST_F(FileAssemblerTest, AssemblesChunksInOrder) {
    FileAssembler assembler(options_);
    auto session = make_session();
    auto data = tether::testing::make_pattern(2500);
    
    std::vector<std::uint8_t> part0(data.begin(), data.begin() + 1000);
    std::vector<std::uint8_t> part1(data.begin() + 1000, data.begin() + 2000);
    std::vector<std::uint8_t> part2(data.begin() + 2000, data.end());
    
    EXPECT_TRUE(assembler.on_chunk(session, chunk(session->get_session_id(), 0, part0)));
    EXPECT_EQ(session->get_state(), SessionState::IN_PROGRESS);
    EXPECT_TRUE(assembler.has_open_sink(session->get_session_id()));
    
    EXPECT_TRUE(assembler.on_chunk(session, chunk(session->get_session_id(), 1, part1)));
    EXPECT_TRUE(assembler.on_chunk(session, chunk(session->get_session_id(), 2, part2)));
    
    auto result = assembler.on_complete(session,
        network::CompleteMessage{session->get_session_id(), 3, 2500, std::nullopt});
    EXPECT_TRUE(result) << result.describe();
    EXPECT_EQ(session->get_state(), SessionState::COMPLETED);
    EXPECT_FALSE(assembler.has_open_sink(session->get_session_id()));
    
    auto path = assembler.output_path_for("laptop", session->get_session_id());
    EXPECT_EQ(tether::testing::read_file(path), data);
}

TEST_F(FileAssemblerTest, ZeroChunkCompletionCreatesEmptyFile) {
    FileAssembler assembler(options_);
    auto session = make_session();
    
    EXPECT_TRUE(assembler.on_complete(session,
        network::CompleteMessage{session->get_session_id(), 0, 0, std::nullopt}));
    EXPECT_EQ(session->get_state(), SessionState::COMPLETED);
    
    auto path = assembler.output_path_for("laptop", session->get_session_id());
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(FileAssemblerTest, SequenceGapFailsAndDeletesPartial) {
    FileAssembler assembler(options_);
    auto session = make_session();
    auto path = assembler.output_path_for("laptop", session->get_session_id());
    
    assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1, 2, 3}));
    EXPECT_TRUE(std::filesystem::exists(path));
    
    auto result = assembler.on_chunk(session, chunk(session->get_session_id(), 2, {4, 5, 6}));
    EXPECT_EQ(result.error, TransferError::SEQUENCE_MISMATCH);
    EXPECT_EQ(session->get_state(), SessionState::FAILED);
    EXPECT_FALSE(assembler.has_open_sink(session->get_session_id()));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FileAssemblerTest, SequenceCheckCanBeDisabled) {
    options_.verify_sequence = false;
    FileAssembler assembler(options_);
    auto session = make_session();
    
    EXPECT_TRUE(assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1})));
    EXPECT_TRUE(assembler.on_chunk(session, chunk(session->get_session_id(), 5, {2})));
    EXPECT_EQ(session->get_state(), SessionState::IN_PROGRESS);
}

TEST_F(FileAssemblerTest, TotalsMismatchFailsCompletion) {
    FileAssembler assembler(options_);
    auto session = make_session();
    
    assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1, 2, 3}));
    auto result = assembler.on_complete(session,
        network::CompleteMessage{session->get_session_id(), 1, 4, std::nullopt});
    
    EXPECT_EQ(result.error, TransferError::SIZE_MISMATCH);
    EXPECT_EQ(session->get_state(), SessionState::FAILED);
    EXPECT_FALSE(std::filesystem::exists(assembler.output_path_for("laptop", session->get_session_id())));
}

TEST_F(FileAssemblerTest, UndecodablePayloadFailsSession) {
    FileAssembler assembler(options_);
    auto session = make_session();
    
    network::ChunkMessage bad{session->get_session_id(), 0, "@@not base64@@", std::nullopt};
    auto result = assembler.on_chunk(session, bad);
    
    EXPECT_EQ(result.error, TransferError::MALFORMED_ENVELOPE);
    EXPECT_EQ(session->get_state(), SessionState::FAILED);
}

TEST_F(FileAssemblerTest, RemoteErrorDeletesPartialByDefault) {
    FileAssembler assembler(options_);
    auto session = make_session();
    auto path = assembler.output_path_for("laptop", session->get_session_id());
    
    assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1, 2, 3}));
    auto result = assembler.on_error(session,
        network::ErrorMessage{session->get_session_id(), "Input/output error", std::nullopt});
    
    EXPECT_EQ(result.error, TransferError::REMOTE_ERROR);
    EXPECT_EQ(session->get_failure()->message, "Input/output error");
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FileAssemblerTest, RemoteErrorIsLoggedOnce) {
    core::Logger::initialize("", core::LogLevel::Debug);
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%v");
    core::Logger::get()->sinks().push_back(sink);
    
    FileAssembler assembler(options_);
    auto session = make_session();
    assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1, 2, 3}));
    assembler.on_error(session,
        network::ErrorMessage{session->get_session_id(), "Disk unplugged", std::nullopt});
    core::Logger::get()->flush();
    
    core::Logger::get()->sinks().pop_back();
    auto text = captured.str();
    
    std::size_t mentions = 0;
    for (auto pos = text.find("Disk unplugged"); pos != std::string::npos;
         pos = text.find("Disk unplugged", pos + 1)) {
        mentions++;
    }
    EXPECT_EQ(mentions, 1u);
    EXPECT_NE(text.find("laptop"), std::string::npos);
}

TEST_F(FileAssemblerTest, KeepPartialFiles) {
    options_.keep_partial_files = true;
    FileAssembler assembler(options_);
    auto session = make_session();
    auto path = assembler.output_path_for("laptop", session->get_session_id());
    
    assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1, 2, 3}));
    session->fail(core::Result(TransferError::CONNECTION_LOST, "Client disconnected"));
    assembler.abandon(session->get_session_id());
    
    EXPECT_FALSE(assembler.has_open_sink(session->get_session_id()));
    EXPECT_EQ(tether::testing::read_file(path), (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST_F(FileAssemblerTest, SinkWriteFailureFailsSession) {
    FileAssembler assembler(options_, [](const std::filesystem::path&) {
        return std::make_unique<FailingSink>(1);
    });
    auto session = make_session();
    
    EXPECT_TRUE(assembler.on_chunk(session, chunk(session->get_session_id(), 0, {1})));
    auto result = assembler.on_chunk(session, chunk(session->get_session_id(), 1, {2}));
    
    EXPECT_EQ(result.error, TransferError::SINK_WRITE_ERROR);
    EXPECT_EQ(session->get_state(), SessionState::FAILED);
    EXPECT_EQ(assembler.get_open_sink_count(), 0u);
}

TEST_F(FileAssemblerTest, ChunksAfterCompletionAreIgnored) {
    FileAssembler assembler(options_);
    auto session = make_session();
    
    assembler.on_complete(session, network::CompleteMessage{session->get_session_id(), 0, 0, std::nullopt});
    auto result = assembler.on_chunk(session, chunk(session->get_session_id(), 0, {9}));
    
    EXPECT_EQ(result.error, TransferError::INVALID_STATE);
    EXPECT_EQ(session->get_state(), SessionState::COMPLETED);
    EXPECT_EQ(std::filesystem::file_size(assembler.output_path_for("laptop", session->get_session_id())), 0u);
}

TEST_F(FileAssemblerTest, ConcurrentSessionsUseSeparateFiles) {
    FileAssembler assembler(options_);
    auto first = make_session("download_1_00000001");
    auto second = std::make_shared<TransferSession>("download_2_00000002", "desktop", SessionRole::RECEIVER);
    
    assembler.on_chunk(first, chunk(first->get_session_id(), 0, {1, 1}));
    assembler.on_chunk(second, chunk(second->get_session_id(), 0, {2}));
    EXPECT_EQ(assembler.get_open_sink_count(), 2u);
    
    assembler.on_complete(first, network::CompleteMessage{first->get_session_id(), 1, 2, std::nullopt});
    assembler.on_complete(second, network::CompleteMessage{second->get_session_id(), 1, 1, std::nullopt});
    
    EXPECT_EQ(tether::testing::read_file(assembler.output_path_for("laptop", first->get_session_id())),
              (std::vector<std::uint8_t>{1, 1}));
    EXPECT_EQ(tether::testing::read_file(assembler.output_path_for("desktop", second->get_session_id())),
              (std::vector<std::uint8_t>{2}));
}
