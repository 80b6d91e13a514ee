#include "core/alerts/DeliveryQueue.hpp"
#include "logger/Logger.hpp"

namespace core::alerts {

    DeliveryQueue::~DeliveryQueue() {
        stop();
    }

    void DeliveryQueue::start() {
        if (running_) {
            Logger::logWarning("[DeliveryQueue] Already running");
            return;
        }

        running_ = true;
        stopping_ = false;

        processingThread_ = std::thread([this]() {
            try {
                processingLoop();
            } catch (const std::exception &e) {
                Logger::logError("[DeliveryQueue] Processing thread crashed: " + std::string(e.what()));
                running_ = false;
            }
        });

        Logger::logInfo("[DeliveryQueue] Started");
    }

    void DeliveryQueue::stop() {
        if (!running_) return;

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            stopping_ = true;
        }
        queueCondition_.notify_all();

        if (processingThread_.joinable()) {
            processingThread_.join();
        }
        running_ = false;

        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!queue_.empty()) {
            Logger::logWarning("[DeliveryQueue] Dropped " + std::to_string(queue_.size()) + " undelivered task(s)");
            queue_.clear();
        }
        Logger::logInfo("[DeliveryQueue] Stopped");
    }

    bool DeliveryQueue::enqueue(std::string label, Task task) {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_ || stopping_) {
                Logger::logWarning("[DeliveryQueue] Not running, dropping " + label);
                return false;
            }
            queue_.push_back(Entry{std::move(label), std::move(task)});
        }
        queueCondition_.notify_one();

        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.totalEnqueued++;
        return true;
    }

    size_t DeliveryQueue::getQueueSize() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return queue_.size();
    }

    bool DeliveryQueue::waitUntilIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(queueMutex_);
        return idleCondition_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
    }

    DeliveryQueue::Statistics DeliveryQueue::getStatistics() const {
        Statistics stats;
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats = stats_;
        }
        stats.currentQueueSize = getQueueSize();
        return stats;
    }

    void DeliveryQueue::processingLoop() {
        while (true) {
            Entry entry;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                queueCondition_.wait(lock, [this] { return stopping_.load() || !queue_.empty(); });

                // Pending deliveries are still attempted on shutdown
                if (queue_.empty()) break;

                entry = std::move(queue_.front());
                queue_.pop_front();
                busy_ = true;
            }

            execute(entry);

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                busy_ = false;
            }
            idleCondition_.notify_all();
        }
    }

    void DeliveryQueue::execute(Entry &entry) {
        bool delivered = false;
        try {
            auto result = entry.task();
            delivered = result.isSuccess();
            if (delivered) {
                Logger::logDebug("[DeliveryQueue] Delivered " + entry.label);
            } else {
                Logger::logWarning("[DeliveryQueue] " + entry.label + " failed: " + result.message);
            }
        } catch (const std::exception &e) {
            Logger::logError("[DeliveryQueue] " + entry.label + " threw: " + std::string(e.what()));
        }

        std::lock_guard<std::mutex> lock(statsMutex_);
        if (delivered) {
            stats_.totalDelivered++;
        } else {
            stats_.totalFailed++;
        }
    }

} // namespace core::alerts
