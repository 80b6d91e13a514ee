#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "connector/kafka/MessageSender.hpp"
#include "core/events/EventSystem.hpp"

namespace connector::kafka {

    /**
     * @brief Mirrors bus events onto the external message bus.
     *
     * Printer telemetry and connectivity go to <prefix>.<printer>.status,
     * job events to <prefix>.<printer>.job, alerts to <prefix>.alerts and
     * fleet summaries to <prefix>.fleet. Send failures are counted and
     * logged, they never reach the publisher.
     */
    class EventRepublisher {
    public:
        EventRepublisher(std::shared_ptr<MessageSender> sender, std::string topicPrefix);

        void attach(core::events::EventBus &bus);

        void detach(core::events::EventBus &bus);

        void republish(const core::events::Event &event);

        /**
         * @return nullopt for event types that are not mirrored
         */
        static std::optional<std::string> topicFor(const std::string &prefix, const core::events::Event &event);

        /**
         * @brief Printer name as a topic segment: lowercase, [a-z0-9_-] only
         */
        static std::string sanitize(const std::string &name);

        static std::string envelope(const core::events::Event &event);

        size_t sentCount() const { return sent_; }

        size_t failedCount() const { return failed_; }

    private:
        std::shared_ptr<MessageSender> sender_;
        std::string prefix_;
        std::shared_ptr<core::events::IEventObserver> observer_;
        std::atomic<size_t> sent_{0};
        std::atomic<size_t> failed_{0};
    };

}
