#include "core/alerts/channels/WebhookChannel.hpp"
#include "core/utils/Time.hpp"

#include <nlohmann/json.hpp>

namespace core::alerts::channels {

    namespace {
        const char *ntfyPriority(Severity severity) {
            switch (severity) {
                case Severity::Critical:
                    return "urgent";
                case Severity::Error:
                case Severity::Warning:
                    return "high";
                default:
                    return "default";
            }
        }

        std::string trim(const std::string &text) {
            auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        connector::HttpRequest jsonPost(const std::string &url, const nlohmann::json &body) {
            connector::HttpRequest request;
            request.method = "POST";
            request.url = url;
            request.headers.emplace_back("Content-Type", "application/json");
            request.body = body.dump();
            return request;
        }
    }

    WebhookChannel::WebhookChannel(std::shared_ptr<connector::HttpClient> http, long timeoutMs)
            : http_(std::move(http)), timeoutMs_(timeoutMs) {
    }

    int WebhookChannel::severityColor(Severity severity) {
        switch (severity) {
            case Severity::Info:
                return 0x3498db;
            case Severity::Warning:
                return 0xf39c12;
            case Severity::Error:
                return 0xe74c3c;
            case Severity::Critical:
                return 0x9b59b6;
        }
        return 0x3498db;
    }

    std::optional<connector::HttpRequest> WebhookChannel::buildRequest(const storage::WebhookRecord &webhook,
                                                                       const Alert &alert,
                                                                       std::chrono::system_clock::time_point now) {
        const std::string severity = severityToString(alert.severity);

        if (webhook.webhookType == "discord") {
            nlohmann::json embed = {
                    {"title", alert.title},
                    {"description", alert.message},
                    {"color", severityColor(alert.severity)},
                    {"footer", {{"text", "PrintFleet"}}},
                    {"timestamp", utils::formatUtc(now)}
            };
            return jsonPost(webhook.url, {{"embeds", nlohmann::json::array({embed})}});
        }

        if (webhook.webhookType == "slack") {
            nlohmann::json blocks = nlohmann::json::array({
                    {{"type", "header"}, {"text", {{"type", "plain_text"}, {"text", alert.title}}}},
                    {{"type", "section"}, {"text", {{"type", "mrkdwn"}, {"text", alert.message}}}}
            });
            return jsonPost(webhook.url, {{"blocks", blocks}});
        }

        if (webhook.webhookType == "ntfy") {
            connector::HttpRequest request;
            request.method = "POST";
            request.url = webhook.url;
            request.body = alert.message.empty() ? alert.title : alert.message;
            request.headers.emplace_back("Title", alert.title);
            request.headers.emplace_back("Priority", ntfyPriority(alert.severity));
            request.headers.emplace_back("Tags", "printer");
            return request;
        }

        if (webhook.webhookType == "telegram") {
            auto bar = webhook.url.find('|');
            if (bar == std::string::npos) return std::nullopt;
            std::string token = trim(webhook.url.substr(0, bar));
            std::string chatId = trim(webhook.url.substr(bar + 1));
            if (token.empty() || chatId.empty()) return std::nullopt;

            return jsonPost("https://api.telegram.org/bot" + token + "/sendMessage", {
                    {"chat_id", chatId},
                    {"text", "*" + alert.title + "*\n" + alert.message},
                    {"parse_mode", "Markdown"}
            });
        }

        nlohmann::json body = {
                {"event", alert.type},
                {"title", alert.title},
                {"message", alert.message},
                {"severity", severity},
                {"printer_id", alert.printerId ? nlohmann::json(*alert.printerId) : nlohmann::json()},
                {"job_id", alert.jobId ? nlohmann::json(*alert.jobId) : nlohmann::json()},
                {"timestamp", utils::formatUtc(now)}
        };
        return jsonPost(webhook.url, body);
    }

    types::Result WebhookChannel::deliver(const storage::WebhookRecord &webhook, const Alert &alert) const {
        auto request = buildRequest(webhook, alert, std::chrono::system_clock::now());
        if (!request) {
            return types::Result::error("Webhook '" + webhook.name + "' has no usable address");
        }
        request->timeoutMs = timeoutMs_;

        auto response = http_->perform(*request);
        if (response.transportFailed()) {
            return types::Result::error(response.error);
        }
        if (!response.ok()) {
            return types::Result::error("HTTP " + std::to_string(response.status));
        }
        return types::Result::success();
    }

} // namespace core::alerts::channels
