#include <edi/core/progress_indicator.h>
#include <utility>

namespace edi {
namespace core {

ProgressIndicator::ProgressIndicator(Emitter emit, std::chrono::milliseconds tick_interval, int ticks_per_group)
    : m_emit(std::move(emit)),
      m_tick_interval(tick_interval),
      m_ticks_per_group(ticks_per_group > 0 ? ticks_per_group : kDefaultTicksPerGroup),
      m_worker([this](std::stop_token st) { run(st); }) {}

ProgressIndicator::~ProgressIndicator() {
    stop();
}

void ProgressIndicator::stop() {
    if (!m_worker.joinable()) {
        return;
    }
    m_worker.request_stop();
    m_worker.join();
    m_emit("\n");
}

void ProgressIndicator::run(std::stop_token stop_token) {
    m_emit("\nLoading");
    while (!stop_token.stop_requested()) {
        for (int tick = 0; tick < m_ticks_per_group; ++tick) {
            m_emit(".");
            std::unique_lock<std::mutex> lock(m_wait_mutex);
            // Returns early when stop is requested; the predicate never
            // becomes true otherwise, so this is a plain interruptible sleep.
            m_wait_cv.wait_for(lock, stop_token, m_tick_interval, [] { return false; });
            if (stop_token.stop_requested()) {
                return;
            }
        }
    }
}

} // namespace core
} // namespace edi
