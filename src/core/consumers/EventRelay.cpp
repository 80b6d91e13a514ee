#include "core/consumers/EventRelay.hpp"
#include "core/events/EventTypes.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"

namespace core::consumers {

    EventRelay::EventRelay(storage::Database &db, config::RelayConfig config, Clock clock)
            : relay_(db),
              config_(config),
              clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
              observer_(events::makeObserver([this](const events::Event &event) { record(event); })) {
    }

    void EventRelay::attach(events::EventBus &bus) {
        bus.subscribe(events::types::WILDCARD, observer_);
    }

    void EventRelay::detach(events::EventBus &bus) {
        bus.unsubscribe(events::types::WILDCARD, observer_);
    }

    void EventRelay::record(const events::Event &event) {
        try {
            // Device filenames are not guaranteed to be valid UTF-8
            auto payload = event.data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            relay_.append(event.type, payload, utils::toEpochSeconds(event.timestamp));
        } catch (const types::StorageException &e) {
            Logger::logError("[EventRelay] Cannot relay " + event.type + ": " + e.what());
            return;
        }

        bool due;
        {
            std::lock_guard lock(pruneMutex_);
            auto now = clock_();
            due = now - lastPrune_ >= config_.cleanupInterval;
            if (due) lastPrune_ = now;
        }
        if (due) prune();
    }

    int EventRelay::prune() {
        double cutoff = utils::toEpochSeconds(clock_()) - std::chrono::duration<double>(config_.ttl).count();
        try {
            int removed = relay_.pruneOlderThan(cutoff);
            if (removed > 0) {
                Logger::logDebug("[EventRelay] Pruned " + std::to_string(removed) + " expired row(s)");
            }
            return removed;
        } catch (const types::StorageException &e) {
            Logger::logError("[EventRelay] Prune failed: " + std::string(e.what()));
            return 0;
        }
    }

} // namespace core::consumers
