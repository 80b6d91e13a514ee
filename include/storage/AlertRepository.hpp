#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "storage/Database.hpp"

namespace storage {

    struct AlertRecord {
        int64_t id = 0;
        int64_t userId = 0; // 0 when no user exists to receive it
        std::string alertType;
        std::string severity;
        std::string title;
        std::string message;
        std::optional<int> printerId;
        std::optional<int64_t> jobId;
        double createdAt = 0.0;
    };

    /**
     * @brief Channels one user wants for one alert type
     */
    struct UserChannels {
        int64_t userId = 0;
        std::string email;
        bool inApp = true;
        bool browserPush = false;
        bool emailEnabled = false;
    };

    struct PushSubscription {
        int64_t id = 0;
        int64_t userId = 0;
        std::string endpoint;
        std::string p256dh;
        std::string auth;
    };

    class AlertRepository {
    public:
        explicit AlertRepository(Database &db) : db_(db) {}

        int64_t insertUser(const std::string &email, bool active = true);

        void setPreference(int64_t userId, const std::string &alertType, bool inApp, bool browserPush, bool email);

        int64_t addPushSubscription(const PushSubscription &subscription);

        void removePushSubscription(int64_t id);

        /**
         * @brief Active users with a preference row for this alert type
         */
        std::vector<UserChannels> preferencesFor(const std::string &alertType);

        /**
         * @brief Every active user with in-app delivery only
         */
        std::vector<UserChannels> activeUsersInAppOnly();

        std::vector<PushSubscription> pushSubscriptionsFor(int64_t userId);

        /**
         * @brief True if an alert with this (type, printer, title) was created at or after since
         */
        bool existsSince(const std::string &alertType, std::optional<int> printerId,
                         const std::string &title, double since);

        int64_t insert(const AlertRecord &record);

        /**
         * @brief Alerts created in [from, to), newest first, one row per (type, printer, title, time)
         */
        std::vector<AlertRecord> createdBetween(double from, double to, int limit = 50);

        int count();

    private:
        Database &db_;
    };

} // namespace storage
