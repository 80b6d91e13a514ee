#pragma once

#include <memory>

#include "core/events/EventSystem.hpp"
#include "storage/PrinterRepository.hpp"

namespace core::consumers {

    /**
     * @brief Adds successful prints to the printer's usage and maintenance counters
     */
    class CareCounterUpdater {
    public:
        explicit CareCounterUpdater(storage::Database &db);

        void attach(events::EventBus &bus);

        void detach(events::EventBus &bus);

    private:
        storage::PrinterRepository printers_;
        std::shared_ptr<events::IEventObserver> observer_;

        void onJobCompleted(const events::Event &event);
    };

} // namespace core::consumers
