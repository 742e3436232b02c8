#ifndef CURVZDEADLINE_HPP
#define CURVZDEADLINE_HPP

#include <chrono>
#include <functional>

// Wall-clock budget for the approximation searches.
// The clock is injectable so tests can drive time deterministically.
class Deadline {
public:
    using Clock = std::function<std::chrono::milliseconds()>;

    explicit Deadline(std::chrono::milliseconds budget, Clock clock = Clock());

    // Never expires; the clock is not consulted.
    static Deadline unlimited();

    // Monotonic milliseconds from std::chrono::steady_clock.
    static std::chrono::milliseconds steady_now();

    bool expired() const;
    std::chrono::milliseconds elapsed() const;
    std::chrono::milliseconds budget() const { return budget_; }

private:
    Deadline();

    Clock clock_;
    std::chrono::milliseconds start_{0};
    std::chrono::milliseconds budget_{0};
    bool unlimited_ = false;
};

#endif // CURVZDEADLINE_HPP
