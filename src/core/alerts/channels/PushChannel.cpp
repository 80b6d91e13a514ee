#include "core/alerts/channels/PushChannel.hpp"

#include <nlohmann/json.hpp>

namespace core::alerts::channels {

    PushChannel::PushChannel(std::shared_ptr<connector::HttpClient> http, std::string gatewayUrl, long timeoutMs)
            : http_(std::move(http)), gatewayUrl_(std::move(gatewayUrl)), timeoutMs_(timeoutMs) {
    }

    std::string PushChannel::buildBody(const storage::PushSubscription &subscription, const Alert &alert) {
        nlohmann::json body = {
                {"subscription", {
                        {"endpoint", subscription.endpoint},
                        {"keys", {{"p256dh", subscription.p256dh}, {"auth", subscription.auth}}}
                }},
                {"notification", {
                        {"title", alert.title},
                        {"body", alert.message},
                        {"alert_type", alert.type},
                        {"severity", severityToString(alert.severity)}
                }}
        };
        return body.dump();
    }

    types::Result PushChannel::deliver(const storage::PushSubscription &subscription, const Alert &alert) const {
        if (!enabled()) {
            return types::Result::unsupported("No push gateway configured");
        }

        connector::HttpRequest request;
        request.method = "POST";
        request.url = gatewayUrl_;
        request.headers.emplace_back("Content-Type", "application/json");
        request.body = buildBody(subscription, alert);
        request.timeoutMs = timeoutMs_;

        auto response = http_->perform(request);
        if (response.transportFailed()) {
            return types::Result::error(response.error);
        }
        if (!response.ok()) {
            return types::Result::error("Push gateway returned HTTP " + std::to_string(response.status));
        }
        return types::Result::success();
    }

} // namespace core::alerts::channels
