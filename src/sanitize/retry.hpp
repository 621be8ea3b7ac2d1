#ifndef DOCSANITIZER_SANITIZE_RETRY_HPP
#define DOCSANITIZER_SANITIZE_RETRY_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>

namespace docsanitizer {
namespace sanitize {

/**
 * @brief How the engine waits between backend retries. Tests inject NoDelay.
 */
class DelayStrategy
{
public:
    virtual ~DelayStrategy() = default;

    /// Wait for @p delay, returning early once @p cancelled is set.
    virtual void wait(std::chrono::milliseconds delay, const std::atomic<bool> &cancelled) = 0;
};

// Sleeps in short slices so a cancelled request does not sit out its backoff.
class SleepDelay : public DelayStrategy
{
public:
    void wait(std::chrono::milliseconds delay, const std::atomic<bool> &cancelled) override
    {
        const auto slice = std::chrono::milliseconds(50);
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (!cancelled.load()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(slice, remaining));
        }
    }
};

class NoDelay : public DelayStrategy
{
public:
    void wait(std::chrono::milliseconds, const std::atomic<bool> &) override {}
};

/**
 * @struct BackoffPolicy
 * @brief Exponential backoff: initialDelay * multiplier^attempt, capped.
 */
struct BackoffPolicy
{
    size_t maxRetries = 3;
    std::chrono::milliseconds initialDelay{500};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay{30000};

    /// Delay before retry number @p attempt (0-based).
    std::chrono::milliseconds delayFor(size_t attempt) const
    {
        double delay = static_cast<double>(initialDelay.count());
        for (size_t i = 0; i < attempt; ++i) {
            delay *= multiplier;
            if (delay >= static_cast<double>(maxDelay.count())) {
                return maxDelay;
            }
        }
        return std::min(maxDelay, std::chrono::milliseconds(static_cast<long long>(delay)));
    }
};

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_RETRY_HPP
