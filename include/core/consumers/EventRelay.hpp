#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include "application/config/Settings.hpp"
#include "core/events/EventSystem.hpp"
#include "storage/RelayRepository.hpp"

namespace core::consumers {

    /**
     * @brief Copies every bus event into the ws_events table for pollers in other processes.
     *
     * Rows older than the TTL are pruned from the write path, at most once
     * per cleanup interval.
     */
    class EventRelay {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        EventRelay(storage::Database &db, config::RelayConfig config = {}, Clock clock = {});

        void attach(events::EventBus &bus);

        void detach(events::EventBus &bus);

        void record(const events::Event &event);

        /**
         * @return rows removed
         */
        int prune();

    private:
        storage::RelayRepository relay_;
        config::RelayConfig config_;
        Clock clock_;
        std::shared_ptr<events::IEventObserver> observer_;

        std::mutex pruneMutex_;
        std::chrono::system_clock::time_point lastPrune_{};
    };

} // namespace core::consumers
