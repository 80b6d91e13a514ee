#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

#include "core/printer/CanonicalStatus.hpp"

namespace core::state {

    /**
     * @brief Latest CanonicalStatus of one printer, replaced atomically.
     *
     * Owned by the printer's connection; the ingestion thread writes, any
     * thread reads a copy.
     */
    class StatusTracker {
    public:
        explicit StatusTracker(int printerId);

        void update(printer::CanonicalStatus status);

        printer::CanonicalStatus snapshot() const;

        /**
         * @brief Switch to OFFLINE, keeping the reason for display
         */
        void markOffline(const std::string &reason);

        /**
         * @brief Time of the last successful ingestion (epoch of steady_clock if never)
         */
        std::chrono::steady_clock::time_point lastIngest() const;

        bool hasIngested() const { return updateCount_ > 0; }

        bool isFresh(std::chrono::milliseconds maxAge,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const;

        size_t getUpdateCount() const { return updateCount_; }

        int getPrinterId() const { return printerId_; }

    private:
        const int printerId_;
        mutable std::mutex statusMutex_;
        printer::CanonicalStatus status_;
        std::chrono::steady_clock::time_point lastIngest_{};
        std::atomic<size_t> updateCount_{0};
    };

} // namespace core::state
