#pragma once

#include <cstdint>

namespace railmap {

// Cancellation token for a host-driven animation loop. Each start() opens a
// new generation; a step carrying an older generation, or arriving after
// cancel(), must do nothing.
class AnimationLoop {
public:
    std::uint32_t start() noexcept {
        generation_++;
        running_ = true;
        return generation_;
    }

    void cancel() noexcept { running_ = false; }

    bool isRunning() const noexcept { return running_; }
    bool isCurrent(std::uint32_t token) const noexcept { return running_ && token == generation_; }
    std::uint32_t generation() const noexcept { return generation_; }

private:
    std::uint32_t generation_{0};
    bool running_{false};
};

} // namespace railmap
