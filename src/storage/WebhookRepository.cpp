#include "storage/WebhookRepository.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace storage {

    bool WebhookRecord::accepts(const std::string &alertType) const {
        return alertTypes.empty() || std::find(alertTypes.begin(), alertTypes.end(), alertType) != alertTypes.end();
    }

    int64_t WebhookRepository::insert(const WebhookRecord &webhook) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO webhooks (name, url, webhook_type, alert_types, enabled) VALUES (?, ?, ?, ?, ?)");
        stmt.bind(1, webhook.name).bind(2, webhook.url).bind(3, webhook.webhookType);
        if (webhook.alertTypes.empty()) {
            stmt.bindNull(4);
        } else {
            stmt.bind(4, nlohmann::json(webhook.alertTypes).dump());
        }
        stmt.bind(5, webhook.enabled ? 1 : 0);
        stmt.run();
        return db_.lastInsertId();
    }

    std::vector<WebhookRecord> WebhookRepository::listEnabled() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT id, name, url, webhook_type, alert_types, enabled FROM webhooks WHERE enabled = 1 ORDER BY id");
        std::vector<WebhookRecord> webhooks;
        while (stmt.step()) {
            WebhookRecord webhook;
            webhook.id = stmt.columnInt64(0);
            webhook.name = stmt.columnText(1);
            webhook.url = stmt.columnText(2);
            webhook.webhookType = stmt.columnText(3);
            webhook.enabled = stmt.columnInt(5) != 0;

            // alert_types is a JSON array of type names
            std::string types = stmt.columnText(4);
            if (!types.empty()) {
                auto parsed = nlohmann::json::parse(types, nullptr, false);
                if (parsed.is_array()) {
                    for (const auto &type: parsed) {
                        if (type.is_string()) webhook.alertTypes.push_back(type.get<std::string>());
                    }
                } else {
                    Logger::logWarning("[Webhooks] Ignoring malformed alert_types on webhook " +
                                       std::to_string(webhook.id));
                }
            }
            webhooks.push_back(std::move(webhook));
        }
        return webhooks;
    }

} // namespace storage
