#include "core/printer/state/StatusTracker.hpp"

namespace core::state {

    StatusTracker::StatusTracker(int printerId)
            : printerId_(printerId), status_(printer::CanonicalStatus::offline(printerId)) {
    }

    void StatusTracker::update(printer::CanonicalStatus status) {
        auto now = std::chrono::steady_clock::now();
        status.printerId = printerId_;
        if (status.receivedAt == std::chrono::steady_clock::time_point{}) {
            status.receivedAt = now;
        }

        std::lock_guard<std::mutex> lock(statusMutex_);
        status_ = std::move(status);
        lastIngest_ = status_.receivedAt;
        updateCount_++;
    }

    printer::CanonicalStatus StatusTracker::snapshot() const {
        std::lock_guard<std::mutex> lock(statusMutex_);
        return status_;
    }

    void StatusTracker::markOffline(const std::string &reason) {
        std::lock_guard<std::mutex> lock(statusMutex_);
        status_.state = printer::PrinterState::Offline;
        if (!reason.empty()) {
            status_.lastError = reason;
        }
    }

    std::chrono::steady_clock::time_point StatusTracker::lastIngest() const {
        std::lock_guard<std::mutex> lock(statusMutex_);
        return lastIngest_;
    }

    bool StatusTracker::isFresh(std::chrono::milliseconds maxAge, std::chrono::steady_clock::time_point now) const {
        std::lock_guard<std::mutex> lock(statusMutex_);
        if (updateCount_ == 0) return false;
        return now - lastIngest_ < maxAge;
    }

} // namespace core::state
