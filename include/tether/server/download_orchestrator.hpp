#pragma once

#include "tether/server/connection_registry.hpp"
#include <string>

namespace tether::server {

struct DownloadTicket {
    core::Result result;
    std::string client_id;
    std::string session_id;
    std::string status;
    SessionPtr session;
    
    bool accepted() const { return result.success(); }
};

// Starts server-initiated downloads: picks the session id, attaches a
// receiver session in the registry and asks the client for its file.
class DownloadOrchestrator {
public:
    explicit DownloadOrchestrator(ConnectionRegistry& registry);
    
    // Returns as soon as the request is queued; data arrives asynchronously
    DownloadTicket request_download(const std::string& client_id);
    
    // download_<epoch ms>_<8 hex>
    static std::string generate_session_id();

private:
    ConnectionRegistry& registry_;
};

}
