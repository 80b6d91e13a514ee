#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "storage/Database.hpp"

namespace storage {

    struct WebhookRecord {
        int64_t id = 0;
        std::string name;
        std::string url;
        std::string webhookType = "generic"; // discord, slack, ntfy, telegram, generic
        std::vector<std::string> alertTypes; // empty: every type
        bool enabled = true;

        bool accepts(const std::string &alertType) const;
    };

    class WebhookRepository {
    public:
        explicit WebhookRepository(Database &db) : db_(db) {}

        int64_t insert(const WebhookRecord &webhook);

        std::vector<WebhookRecord> listEnabled();

    private:
        Database &db_;
    };

} // namespace storage
