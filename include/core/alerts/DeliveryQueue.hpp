#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "core/types/Result.hpp"

namespace core::alerts {

    /**
     * @brief Single worker thread running outbound notification deliveries.
     *
     * Bus handlers enqueue and return; the network I/O happens here. Each
     * task is independent: a failure or exception is logged and counted,
     * and the next task runs.
     */
    class DeliveryQueue {
    public:
        using Task = std::function<types::Result()>;

        DeliveryQueue() = default;

        ~DeliveryQueue();

        DeliveryQueue(const DeliveryQueue &) = delete;

        DeliveryQueue &operator=(const DeliveryQueue &) = delete;

        bool isRunning() const {
            return running_.load() && !stopping_.load();
        }

        void start();

        /**
         * @brief Finish the tasks already queued, then join the worker
         */
        void stop();

        /**
         * @return false when the queue is not running and the task was dropped
         */
        bool enqueue(std::string label, Task task);

        size_t getQueueSize() const;

        /**
         * @brief Block until the queue is empty and no task is running
         */
        bool waitUntilIdle(std::chrono::milliseconds timeout);

        struct Statistics {
            size_t totalEnqueued = 0;
            size_t totalDelivered = 0;
            size_t totalFailed = 0;
            size_t currentQueueSize = 0;
        };

        Statistics getStatistics() const;

    private:
        struct Entry {
            std::string label;
            Task task;
        };

        mutable std::mutex queueMutex_;
        std::condition_variable queueCondition_;
        std::condition_variable idleCondition_;
        std::deque<Entry> queue_;
        bool busy_ = false;

        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};
        std::thread processingThread_;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        void processingLoop();

        void execute(Entry &entry);
    };

} // namespace core::alerts
