#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace edi {
namespace core {

/**
 * "Loading..." cue shown while the main thread is blocked on a request.
 *
 * The dots are printed from a std::jthread that starts in the constructor.
 * The owner cancels it with stop(), which requests stop on the thread's
 * stop_token and joins; nothing is emitted by the worker once stop() has
 * returned. Create one indicator per request and let it go out of scope
 * afterwards.
 */
class ProgressIndicator {
public:
    using Emitter = std::function<void(const std::string&)>;

    static constexpr std::chrono::milliseconds kDefaultTickInterval{500};
    static constexpr int kDefaultTicksPerGroup = 3;

    explicit ProgressIndicator(Emitter emit,
                               std::chrono::milliseconds tick_interval = kDefaultTickInterval,
                               int ticks_per_group = kDefaultTicksPerGroup);
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    // Idempotent. Blocks until the worker has exited, then ends the line.
    void stop();

    bool isRunning() const { return m_worker.joinable(); }

private:
    void run(std::stop_token stop_token);

    Emitter m_emit;
    std::chrono::milliseconds m_tick_interval;
    int m_ticks_per_group;

    // Only used to let the stop request interrupt the pause between ticks.
    std::mutex m_wait_mutex;
    std::condition_variable_any m_wait_cv;

    // Declared last: the thread starts once everything above is initialized.
    std::jthread m_worker;
};

} // namespace core
} // namespace edi
