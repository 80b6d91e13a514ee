#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace core::events {

    struct Event {
        std::string type;
        std::string source;
        nlohmann::json data;
        std::chrono::system_clock::time_point timestamp;

        Event(std::string t, std::string src, nlohmann::json payload = nlohmann::json::object())
                : type(std::move(t)), source(std::move(src)), data(std::move(payload)),
                  timestamp(std::chrono::system_clock::now()) {}
    };

    class IEventObserver {
    public:
        virtual ~IEventObserver() = default;

        virtual void onEvent(const Event &event) = 0;
    };

    /**
     * @brief Adapts a closure to IEventObserver so lambdas can subscribe
     */
    class FunctionObserver : public IEventObserver {
    public:
        explicit FunctionObserver(std::function<void(const Event &)> fn) : fn_(std::move(fn)) {}

        void onEvent(const Event &event) override {
            if (fn_) fn_(event);
        }

    private:
        std::function<void(const Event &)> fn_;
    };

    inline std::shared_ptr<IEventObserver> makeObserver(std::function<void(const Event &)> fn) {
        return std::make_shared<FunctionObserver>(std::move(fn));
    }

    /**
     * @brief In-process publish/subscribe hub.
     *
     * Observers are held weakly: the subscriber owns its lifetime, and an
     * expired observer is dropped on the next publish. Handlers run on the
     * publisher's thread, exact-type handlers first, then "*" handlers, each
     * group in registration order. A throwing handler is logged and skipped.
     */
    class EventBus {
    public:
        static EventBus &getInstance();

        EventBus() = default;

        EventBus(const EventBus &) = delete;

        EventBus &operator=(const EventBus &) = delete;

        /**
         * @return false if this observer was already registered for this type
         */
        bool subscribe(const std::string &type, const std::shared_ptr<IEventObserver> &observer);

        void unsubscribe(const std::string &type, const std::shared_ptr<IEventObserver> &observer);

        void publish(const Event &event);

        size_t subscriberCount(const std::string &type) const;

        void clear();

        struct Statistics {
            size_t eventsPublished = 0;
            size_t handlerInvocations = 0;
            size_t handlerErrors = 0;
        };

        Statistics getStatistics() const;

    private:
        using ObserverList = std::vector<std::weak_ptr<IEventObserver>>;

        mutable std::mutex observersMutex_;
        std::unordered_map<std::string, ObserverList> handlers_;
        ObserverList wildcardHandlers_;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        ObserverList &listFor(const std::string &type);

        static std::vector<std::shared_ptr<IEventObserver>> snapshot(ObserverList &list);

        void dispatch(const std::vector<std::shared_ptr<IEventObserver>> &observers, const Event &event);
    };

} // namespace core::events
