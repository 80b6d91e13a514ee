#include "core/consumers/CareCounterUpdater.hpp"
#include "core/events/EventTypes.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::consumers {

    CareCounterUpdater::CareCounterUpdater(storage::Database &db)
            : printers_(db),
              observer_(events::makeObserver([this](const events::Event &event) { onJobCompleted(event); })) {
    }

    void CareCounterUpdater::attach(events::EventBus &bus) {
        bus.subscribe(events::types::JOB_COMPLETED, observer_);
    }

    void CareCounterUpdater::detach(events::EventBus &bus) {
        bus.unsubscribe(events::types::JOB_COMPLETED, observer_);
    }

    void CareCounterUpdater::onJobCompleted(const events::Event &event) {
        const auto &data = event.data;
        if (!data.value("success", false)) return;

        int printerId = data.value("printer_id", 0);
        if (printerId <= 0) return;

        double hours = 0.0;
        auto duration = data.find("duration_seconds");
        if (duration != data.end() && duration->is_number()) {
            hours = duration->get<double>() / 3600.0;
        }

        try {
            printers_.addCompletedPrint(printerId, hours);
        } catch (const types::StorageException &e) {
            Logger::logError("[CareCounters] Cannot update printer " + std::to_string(printerId) + ": " + e.what());
        }
    }

} // namespace core::consumers
