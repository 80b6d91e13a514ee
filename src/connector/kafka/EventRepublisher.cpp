#include "connector/kafka/EventRepublisher.hpp"
#include "core/events/EventTypes.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"

#include <cctype>

namespace connector::kafka {

    namespace event_types = core::events::types;

    namespace {
        bool startsWith(const std::string &text, const char *prefix) {
            return text.rfind(prefix, 0) == 0;
        }

        std::string printerSegment(const core::events::Event &event) {
            std::string name = event.data.value("printer_name", "");
            std::string segment = EventRepublisher::sanitize(name);
            if (segment.empty()) {
                segment = "printer-" + std::to_string(event.data.value("printer_id", 0));
            }
            return segment;
        }
    }

    EventRepublisher::EventRepublisher(std::shared_ptr<MessageSender> sender, std::string topicPrefix)
            : sender_(std::move(sender)),
              prefix_(topicPrefix.empty() ? "printfleet" : std::move(topicPrefix)),
              observer_(core::events::makeObserver([this](const core::events::Event &event) { republish(event); })) {
    }

    void EventRepublisher::attach(core::events::EventBus &bus) {
        bus.subscribe(event_types::WILDCARD, observer_);
        Logger::logInfo("[Republisher] Mirroring events to " + prefix_ + ".* via " + sender_->getSenderName());
    }

    void EventRepublisher::detach(core::events::EventBus &bus) {
        bus.unsubscribe(event_types::WILDCARD, observer_);
    }

    std::string EventRepublisher::sanitize(const std::string &name) {
        std::string result;
        result.reserve(name.size());
        for (unsigned char c: name) {
            if (std::isalnum(c)) {
                result += static_cast<char>(std::tolower(c));
            } else if (c == '-' || c == '_') {
                result += static_cast<char>(c);
            } else if (!result.empty() && result.back() != '_') {
                // spaces, dots and other separators
                result += '_';
            }
        }
        while (!result.empty() && result.back() == '_') result.pop_back();
        return result;
    }

    std::optional<std::string> EventRepublisher::topicFor(const std::string &prefix,
                                                          const core::events::Event &event) {
        if (event.type == event_types::ALERT_DISPATCHED) return prefix + ".alerts";
        if (event.type == event_types::FLEET_SUMMARY) return prefix + ".fleet";
        if (startsWith(event.type, "job.")) return prefix + "." + printerSegment(event) + ".job";
        if (startsWith(event.type, "printer.")) return prefix + "." + printerSegment(event) + ".status";
        return std::nullopt;
    }

    std::string EventRepublisher::envelope(const core::events::Event &event) {
        nlohmann::json message = {
                {"event_type", event.type},
                {"source", event.source},
                {"timestamp", ::utils::formatUtc(event.timestamp)},
                {"data", event.data}
        };
        return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    void EventRepublisher::republish(const core::events::Event &event) {
        auto topic = topicFor(prefix_, event);
        if (!topic) return;

        std::string key = event.data.value("printer_name", "");
        if (sender_->sendMessage(*topic, envelope(event), key)) {
            sent_++;
        } else {
            failed_++;
            Logger::logDebug("[Republisher] Could not republish " + event.type + " to " + *topic);
        }
    }

}
