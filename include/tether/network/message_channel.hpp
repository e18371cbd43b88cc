#pragma once

#include "tether/network/envelope.hpp"
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>

namespace tether::network {

// A duplex, in-order envelope stream. The send callback fires once the
// envelope has been written to the transport (or failed to be).
class MessageChannel {
public:
    using SendCallback = std::function<void(const boost::system::error_code&)>;
    
    virtual ~MessageChannel() = default;
    
    virtual void send_envelope(const Envelope& envelope, SendCallback on_flushed = nullptr) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual const std::string& get_remote_endpoint() const = 0;
};

}
