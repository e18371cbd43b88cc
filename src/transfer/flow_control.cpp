#include "tether/transfer/flow_control.hpp"
#include <algorithm>
#include <stdexcept>

namespace tether::transfer {

FlowController::FlowController(std::uint32_t window_size)
    : window_size_(std::max(window_size, 1u))
    , outstanding_(0)
    , peak_outstanding_(0)
{
}

bool FlowController::try_acquire() {
    if (outstanding_ >= window_size_) {
        return false;
    }
    
    outstanding_++;
    peak_outstanding_ = std::max(peak_outstanding_, outstanding_);
    return true;
}

void FlowController::release() {
    if (outstanding_ == 0) {
        throw std::logic_error("FlowController released more credits than acquired");
    }
    outstanding_--;
}

}
