#include "tether/client/tether_client.hpp"
#include "tether/core/logger.hpp"

namespace tether::client {

ClientSettings ClientSettings::from_config(const core::Config& config) {
    ClientSettings settings;
    settings.server_host = config.get_string("client.server_host", "localhost");
    settings.server_port = static_cast<std::uint16_t>(config.get_int("client.server_port", 8080));
    settings.reconnect_interval = std::chrono::milliseconds(
        config.get_uint64("client.reconnect_interval_ms", 5000));
    return settings;
}

TetherClient::TetherClient(ClientSettings settings, AgentOptions options,
                           FetchAgent::SourceFactory source_factory)
    : settings_(std::move(settings))
    , agent_(std::move(options), std::move(source_factory))
    , running_(false)
    , stopping_(false) {
}

TetherClient::~TetherClient() {
    stop();
}

void TetherClient::run() {
    if (stopping_) {
        return;
    }
    running_ = true;
    LOG_INFO("Client {} serving {}", agent_.get_options().client_id,
             agent_.get_options().file_path.string());
    
    while (running_) {
        run_once();
        
        if (!wait_before_reconnect()) {
            break;
        }
    }
    
    LOG_INFO("Client {} stopped", agent_.get_options().client_id);
}

bool TetherClient::run_once() {
    auto tcp_client = std::make_unique<network::TcpClient>();
    
    tcp_client->set_envelope_handler(
        [this](std::shared_ptr<network::Connection> connection, network::Envelope envelope) {
            agent_.handle_envelope(connection, envelope);
        });
    
    tcp_client->set_disconnect_handler([this](std::shared_ptr<network::Connection>) {
        LOG_WARN("Disconnected from server");
        agent_.handle_disconnect();
    });
    
    network::TcpClient* client = tcp_client.get();
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        tcp_client_ = std::move(tcp_client);
    }
    
    bool connected = client->connect(settings_.server_host, settings_.server_port,
                                     settings_.connect_timeout);
    if (connected) {
        agent_.on_connected(client->get_connection());
        if (stopping_) {
            client->disconnect();
        }
        client->run();
    }
    
    std::lock_guard<std::mutex> lock(client_mutex_);
    tcp_client_.reset();
    return connected;
}

void TetherClient::stop() {
    stopping_ = true;
    running_ = false;
    
    std::lock_guard<std::mutex> lock(client_mutex_);
    stop_cv_.notify_all();
    if (tcp_client_) {
        tcp_client_->disconnect();
    }
}

bool TetherClient::is_connected() const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    return tcp_client_ && tcp_client_->is_connected();
}

bool TetherClient::wait_before_reconnect() {
    if (!running_) {
        return false;
    }
    
    LOG_INFO("Reconnecting in {}ms", settings_.reconnect_interval.count());
    
    std::unique_lock<std::mutex> lock(client_mutex_);
    stop_cv_.wait_for(lock, settings_.reconnect_interval, [this]() { return !running_; });
    return running_;
}

}
