#pragma once

#include <cstdint>

namespace tether::transfer {

// Credit window between "read the next chunk" and "the previous send was
// flushed". A credit is taken before a chunk is read and handed to the
// transport and returned on its write completion, so at most
// window_size chunks are ever buffered. Not thread-safe; owned by one
// sender on its I/O thread.
class FlowController {
public:
    explicit FlowController(std::uint32_t window_size = 1);
    
    bool try_acquire();
    void release();
    
    std::uint32_t get_window_size() const { return window_size_; }
    std::uint32_t get_outstanding() const { return outstanding_; }
    std::uint32_t get_peak_outstanding() const { return peak_outstanding_; }
    bool is_idle() const { return outstanding_ == 0; }
    
private:
    std::uint32_t window_size_;
    std::uint32_t outstanding_;
    std::uint32_t peak_outstanding_;
};

}
