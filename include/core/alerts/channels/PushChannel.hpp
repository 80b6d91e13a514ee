#pragma once

#include <memory>
#include <string>

#include "connector/client/HttpClient.hpp"
#include "core/alerts/Alert.hpp"
#include "core/types/Result.hpp"
#include "storage/AlertRepository.hpp"

namespace core::alerts::channels {

    /**
     * @brief Browser push through an HTTP push gateway.
     *
     * The gateway receives the subscription (endpoint and keys) together
     * with the notification and performs the Web Push encryption itself.
     */
    class PushChannel {
    public:
        PushChannel(std::shared_ptr<connector::HttpClient> http, std::string gatewayUrl, long timeoutMs = 10000);

        bool enabled() const { return !gatewayUrl_.empty(); }

        types::Result deliver(const storage::PushSubscription &subscription, const Alert &alert) const;

        static std::string buildBody(const storage::PushSubscription &subscription, const Alert &alert);

    private:
        std::shared_ptr<connector::HttpClient> http_;
        std::string gatewayUrl_;
        long timeoutMs_;
    };

} // namespace core::alerts::channels
