#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace utils {

    /**
     * @brief Stop signal shared between an owner and its worker thread.
     *
     * Workers sleep through waitFor() instead of sleep_for() so that
     * requestStop() wakes them immediately.
     */
    class CancellationSignal {
    public:
        void requestStop() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopped_ = true;
            }
            condition_.notify_all();
        }

        bool stopRequested() const {
            return stopped_.load();
        }

        void reset() {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = false;
        }

        /**
         * @return true if a stop was requested before the timeout elapsed
         */
        template<typename Rep, typename Period>
        bool waitFor(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            return condition_.wait_for(lock, timeout, [this] { return stopped_.load(); });
        }

    private:
        std::mutex mutex_;
        std::condition_variable condition_;
        std::atomic<bool> stopped_{false};
    };

}
