#include "core/events/EventSystem.hpp"
#include "core/events/EventTypes.hpp"
#include "logger/Logger.hpp"

#include <algorithm>

namespace core::events {

    namespace {
        bool sameObserver(const std::weak_ptr<IEventObserver> &stored, const std::shared_ptr<IEventObserver> &candidate) {
            return !stored.owner_before(candidate) && !candidate.owner_before(stored);
        }
    }

    EventBus &EventBus::getInstance() {
        static EventBus instance;
        return instance;
    }

    EventBus::ObserverList &EventBus::listFor(const std::string &type) {
        if (type == types::WILDCARD) {
            return wildcardHandlers_;
        }
        return handlers_[type];
    }

    bool EventBus::subscribe(const std::string &type, const std::shared_ptr<IEventObserver> &observer) {
        if (!observer || type.empty()) return false;

        std::lock_guard<std::mutex> lock(observersMutex_);
        auto &list = listFor(type);
        auto existing = std::find_if(list.begin(), list.end(), [&](const std::weak_ptr<IEventObserver> &stored) {
            return sameObserver(stored, observer);
        });
        if (existing != list.end()) {
            return false;
        }
        list.push_back(observer);
        return true;
    }

    void EventBus::unsubscribe(const std::string &type, const std::shared_ptr<IEventObserver> &observer) {
        if (!observer) return;

        std::lock_guard<std::mutex> lock(observersMutex_);
        auto &list = listFor(type);
        list.erase(std::remove_if(list.begin(), list.end(), [&](const std::weak_ptr<IEventObserver> &stored) {
            return sameObserver(stored, observer);
        }), list.end());
    }

    std::vector<std::shared_ptr<IEventObserver>> EventBus::snapshot(ObserverList &list) {
        std::vector<std::shared_ptr<IEventObserver>> alive;
        alive.reserve(list.size());

        auto it = list.begin();
        while (it != list.end()) {
            if (auto observer = it->lock()) {
                alive.push_back(std::move(observer));
                ++it;
            } else {
                it = list.erase(it);
            }
        }
        return alive;
    }

    void EventBus::publish(const Event &event) {
        std::vector<std::shared_ptr<IEventObserver>> exact;
        std::vector<std::shared_ptr<IEventObserver>> wildcard;
        {
            // Copy under the lock so handlers may subscribe or publish re-entrantly
            std::lock_guard<std::mutex> lock(observersMutex_);
            auto found = handlers_.find(event.type);
            if (found != handlers_.end()) {
                exact = snapshot(found->second);
            }
            wildcard = snapshot(wildcardHandlers_);
        }

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.eventsPublished++;
        }

        dispatch(exact, event);
        dispatch(wildcard, event);
    }

    void EventBus::dispatch(const std::vector<std::shared_ptr<IEventObserver>> &observers, const Event &event) {
        for (const auto &observer: observers) {
            bool failed = false;
            try {
                observer->onEvent(event);
            } catch (const std::exception &e) {
                failed = true;
                Logger::logError("[EventBus] Handler for '" + event.type + "' from " + event.source +
                                 " threw: " + e.what());
            } catch (...) {
                failed = true;
                Logger::logError("[EventBus] Handler for '" + event.type + "' from " + event.source +
                                 " threw a non-standard exception");
            }

            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.handlerInvocations++;
            if (failed) stats_.handlerErrors++;
        }
    }

    size_t EventBus::subscriberCount(const std::string &type) const {
        std::lock_guard<std::mutex> lock(observersMutex_);
        if (type == types::WILDCARD) {
            return wildcardHandlers_.size();
        }
        auto found = handlers_.find(type);
        return found == handlers_.end() ? 0 : found->second.size();
    }

    void EventBus::clear() {
        std::lock_guard<std::mutex> lock(observersMutex_);
        handlers_.clear();
        wildcardHandlers_.clear();
    }

    EventBus::Statistics EventBus::getStatistics() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }

} // namespace core::events
