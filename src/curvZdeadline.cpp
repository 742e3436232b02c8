#include "curvZdeadline.hpp"

Deadline::Deadline(std::chrono::milliseconds budget, Clock clock)
    : clock_(clock ? std::move(clock) : Clock(&Deadline::steady_now)), budget_(budget) {
    start_ = clock_();
}

Deadline::Deadline() : unlimited_(true) {
}

Deadline Deadline::unlimited() {
    return Deadline();
}

std::chrono::milliseconds Deadline::steady_now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
}

std::chrono::milliseconds Deadline::elapsed() const {
    if (unlimited_) return std::chrono::milliseconds(0);
    return clock_() - start_;
}

bool Deadline::expired() const {
    if (unlimited_) return false;
    return elapsed() > budget_;
}
