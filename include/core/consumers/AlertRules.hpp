#pragma once

#include <memory>
#include <optional>

#include "core/alerts/AlertDispatcher.hpp"
#include "core/events/EventSystem.hpp"

namespace core::consumers {

    /**
     * @brief Turns lifecycle and connectivity events into alerts
     */
    class AlertRules {
    public:
        explicit AlertRules(alerts::AlertDispatcher &dispatcher);

        void attach(events::EventBus &bus);

        void detach(events::EventBus &bus);

        /**
         * @return the alert an event maps to, nullopt for events that raise none
         */
        static std::optional<alerts::Alert> alertFor(const events::Event &event);

    private:
        alerts::AlertDispatcher &dispatcher_;
        std::shared_ptr<events::IEventObserver> observer_;

        void onEvent(const events::Event &event);
    };

} // namespace core::consumers
