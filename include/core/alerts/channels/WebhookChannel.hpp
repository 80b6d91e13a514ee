#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "connector/client/HttpClient.hpp"
#include "core/alerts/Alert.hpp"
#include "core/types/Result.hpp"
#include "storage/WebhookRepository.hpp"

namespace core::alerts::channels {

    /**
     * @brief Posts alerts to chat and automation webhooks.
     *
     * The request shape follows the stored webhook type: discord, slack,
     * ntfy, telegram (url holds "bot_token|chat_id") or generic JSON.
     */
    class WebhookChannel {
    public:
        explicit WebhookChannel(std::shared_ptr<connector::HttpClient> http, long timeoutMs = 10000);

        types::Result deliver(const storage::WebhookRecord &webhook, const Alert &alert) const;

        /**
         * @return nullopt when the webhook cannot be addressed (telegram without a chat id)
         */
        static std::optional<connector::HttpRequest> buildRequest(const storage::WebhookRecord &webhook,
                                                                  const Alert &alert,
                                                                  std::chrono::system_clock::time_point now);

        static int severityColor(Severity severity);

    private:
        std::shared_ptr<connector::HttpClient> http_;
        long timeoutMs_;
    };

} // namespace core::alerts::channels
