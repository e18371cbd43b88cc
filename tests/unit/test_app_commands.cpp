#include <gtest/gtest.h>
#include "tether/app/client_commands.hpp"
#include "tether/app/server_commands.hpp"
#include "tether/client/fetch_agent.hpp"
#include "tether/core/logger.hpp"
#include "helpers/fake_channel.hpp"
#include "helpers/test_sources.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

using namespace tether;
using tether::core::TransferError;
using tether::testing::LoopbackChannel;
using tether::transfer::SessionState;

class RunDownloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        server::ServiceOptions options;
        options.assembler.download_dir = temp_dir_ / "downloads";
        service_ = std::make_unique<server::FetchService>(options);
    }
    
    // Agent wired to the service over in-memory channels; nothing is sent
    // until register_agent() is called
    std::unique_ptr<client::FetchAgent> make_agent(const std::string& client_id,
                                                   const std::filesystem::path& file_path) {
        client::AgentOptions agent_options;
        agent_options.client_id = client_id;
        agent_options.file_path = file_path;
        agent_options.chunk_size = 1024;
        auto agent = std::make_unique<client::FetchAgent>(agent_options);
    
        to_client_ = std::make_shared<LoopbackChannel>("10.0.0.7:5000");
        to_server_ = std::make_shared<LoopbackChannel>("10.0.0.1:8080");
    
        auto* agent_ptr = agent.get();
        auto* service = service_.get();
        std::weak_ptr<LoopbackChannel> weak_to_server = to_server_;
        std::weak_ptr<LoopbackChannel> weak_to_client = to_client_;
    
        to_client_->set_receiver([agent_ptr, weak_to_server](const network::Envelope& envelope) {
            if (auto channel = weak_to_server.lock()) agent_ptr->handle_envelope(channel, envelope);
        });
        to_server_->set_receiver([service, weak_to_client](const network::Envelope& envelope) {
            if (auto channel = weak_to_client.lock()) service->handle_envelope(channel, envelope);
        });
        return agent;
    }
    
    void register_agent(client::FetchAgent& agent) {
        agent.on_connected(to_server_);
    }
    
    tether::testing::TempDir temp_dir_;
    std::unique_ptr<server::FetchService> service_;
    std::shared_ptr<LoopbackChannel> to_client_;
    std::shared_ptr<LoopbackChannel> to_server_;
    app::ShutdownSignal shutdown_;
};

TEST_F(RunDownloadTest, WaitsForLateClientThenDownloads) {
    auto data = tether::testing::make_pattern(5000);
    auto file = temp_dir_ / "file_to_download.txt";
    tether::testing::write_file(file, data);
    auto agent = make_agent("laptop", file);
    
    std::thread late_client([this, &agent]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        register_agent(*agent);
    });
    
    std::string error;
    auto stats = app::run_download(*service_, "laptop", shutdown_, std::chrono::milliseconds(20), error);
    late_client.join();
    
    ASSERT_TRUE(stats.has_value()) << error;
    EXPECT_EQ(stats->state, SessionState::COMPLETED);
    EXPECT_EQ(stats->chunks, 5u);
    EXPECT_EQ(stats->bytes, 5000u);
    EXPECT_TRUE(error.empty());
    
    auto output = service_->get_assembler().output_path_for("laptop", stats->session_id);
    EXPECT_EQ(tether::testing::read_file(output), data);
}

TEST_F(RunDownloadTest, ShutdownInterruptsWaitForClient) {
    std::thread interrupter([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        shutdown_.trigger();
    });
    
    auto started = std::chrono::steady_clock::now();
    std::string error;
    auto stats = app::run_download(*service_, "laptop", shutdown_, std::chrono::seconds(30), error);
    interrupter.join();
    
    EXPECT_FALSE(stats.has_value());
    EXPECT_TRUE(error.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_TRUE(service_->list_clients().empty());
}

TEST_F(RunDownloadTest, FailedTransferIsReturned) {
    auto agent = make_agent("laptop", temp_dir_ / "missing.txt");
    register_agent(*agent);
    
    std::string error;
    auto stats = app::run_download(*service_, "laptop", shutdown_, std::chrono::milliseconds(20), error);
    
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->state, SessionState::FAILED);
    ASSERT_TRUE(stats->failure.has_value());
    EXPECT_EQ(stats->failure->error, TransferError::REMOTE_ERROR);
    EXPECT_EQ(stats->failure->message, "File not found");
}

class GenerateTextFileTest : public ::testing::Test {
protected:
    tether::testing::TempDir temp_dir_;
};

TEST_F(GenerateTextFileTest, WritesAlphanumericTextOfRequestedSize) {
    auto path = temp_dir_ / "nested" / "file_to_download.txt";
    std::uint64_t size = 1536 * 1024 + 3;
    
    auto result = app::generate_text_file(path, size);
    ASSERT_TRUE(result) << result.describe();
    
    auto content = tether::testing::read_file(path);
    ASSERT_EQ(content.size(), size);
    EXPECT_TRUE(std::all_of(content.begin(), content.end(),
                            [](std::uint8_t c) { return std::isalnum(c) != 0; }));
}

TEST_F(GenerateTextFileTest, ZeroSizeCreatesEmptyFile) {
    auto path = temp_dir_ / "empty.txt";
    ASSERT_TRUE(app::generate_text_file(path, 0));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(GenerateTextFileTest, ReportsProgressPerStep) {
    core::Logger::initialize("", core::LogLevel::Info);
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%v");
    core::Logger::get()->sinks().push_back(sink);
    
    auto result = app::generate_text_file(temp_dir_ / "progress.txt", 3 * 1024 * 1024, 1024 * 1024);
    core::Logger::get()->flush();
    core::Logger::get()->sinks().pop_back();
    ASSERT_TRUE(result);
    
    auto text = captured.str();
    std::size_t reports = 0;
    for (auto pos = text.find("MB of"); pos != std::string::npos; pos = text.find("MB of", pos + 1)) {
        reports++;
    }
    EXPECT_EQ(reports, 3u);
}

TEST_F(GenerateTextFileTest, UnwritableLocationFails) {
    auto blocker = temp_dir_ / "blocker";
    tether::testing::write_file(blocker, {1});
    
    auto result = app::generate_text_file(blocker / "file.txt", 1024);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, TransferError::SINK_WRITE_ERROR);
}
