#include "storage/AlertRepository.hpp"

namespace storage {

    int64_t AlertRepository::insertUser(const std::string &email, bool active) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("INSERT INTO users (email, is_active) VALUES (?, ?)");
        stmt.bind(1, email).bind(2, active ? 1 : 0);
        stmt.run();
        return db_.lastInsertId();
    }

    void AlertRepository::setPreference(int64_t userId, const std::string &alertType, bool inApp,
                                        bool browserPush, bool email) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO alert_preferences (user_id, alert_type, in_app, browser_push, email) "
                "VALUES (?, ?, ?, ?, ?) ON CONFLICT(user_id, alert_type) DO UPDATE SET "
                "in_app = excluded.in_app, browser_push = excluded.browser_push, email = excluded.email");
        stmt.bind(1, userId).bind(2, alertType).bind(3, inApp ? 1 : 0).bind(4, browserPush ? 1 : 0)
                .bind(5, email ? 1 : 0);
        stmt.run();
    }

    int64_t AlertRepository::addPushSubscription(const PushSubscription &subscription) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO push_subscriptions (user_id, endpoint, p256dh, auth) VALUES (?, ?, ?, ?)");
        stmt.bind(1, subscription.userId).bind(2, subscription.endpoint).bind(3, subscription.p256dh)
                .bind(4, subscription.auth);
        stmt.run();
        return db_.lastInsertId();
    }

    void AlertRepository::removePushSubscription(int64_t id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("DELETE FROM push_subscriptions WHERE id = ?");
        stmt.bind(1, id);
        stmt.run();
    }

    std::vector<UserChannels> AlertRepository::preferencesFor(const std::string &alertType) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT u.id, u.email, p.in_app, p.browser_push, p.email FROM alert_preferences p "
                "JOIN users u ON u.id = p.user_id WHERE p.alert_type = ? AND u.is_active = 1 ORDER BY u.id");
        stmt.bind(1, alertType);
        std::vector<UserChannels> users;
        while (stmt.step()) {
            UserChannels channels;
            channels.userId = stmt.columnInt64(0);
            channels.email = stmt.columnText(1);
            channels.inApp = stmt.columnInt(2) != 0;
            channels.browserPush = stmt.columnInt(3) != 0;
            channels.emailEnabled = stmt.columnInt(4) != 0;
            users.push_back(std::move(channels));
        }
        return users;
    }

    std::vector<UserChannels> AlertRepository::activeUsersInAppOnly() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("SELECT id, email FROM users WHERE is_active = 1 ORDER BY id");
        std::vector<UserChannels> users;
        while (stmt.step()) {
            UserChannels channels;
            channels.userId = stmt.columnInt64(0);
            channels.email = stmt.columnText(1);
            users.push_back(std::move(channels));
        }
        return users;
    }

    std::vector<PushSubscription> AlertRepository::pushSubscriptionsFor(int64_t userId) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT id, user_id, endpoint, p256dh, auth FROM push_subscriptions WHERE user_id = ?");
        stmt.bind(1, userId);
        std::vector<PushSubscription> subscriptions;
        while (stmt.step()) {
            PushSubscription sub;
            sub.id = stmt.columnInt64(0);
            sub.userId = stmt.columnInt64(1);
            sub.endpoint = stmt.columnText(2);
            sub.p256dh = stmt.columnText(3);
            sub.auth = stmt.columnText(4);
            subscriptions.push_back(std::move(sub));
        }
        return subscriptions;
    }

    bool AlertRepository::existsSince(const std::string &alertType, std::optional<int> printerId,
                                      const std::string &title, double since) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT 1 FROM alerts WHERE alert_type = ? AND printer_id IS ? AND title = ? "
                "AND created_at >= ? LIMIT 1");
        stmt.bind(1, alertType).bind(2, printerId).bind(3, title).bind(4, since);
        return stmt.step();
    }

    int64_t AlertRepository::insert(const AlertRecord &record) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO alerts (user_id, alert_type, severity, title, message, printer_id, job_id, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, record.userId).bind(2, record.alertType).bind(3, record.severity).bind(4, record.title)
                .bind(5, record.message).bind(6, record.printerId).bind(7, record.jobId).bind(8, record.createdAt);
        stmt.run();
        return db_.lastInsertId();
    }

    std::vector<AlertRecord> AlertRepository::createdBetween(double from, double to, int limit) {
        std::lock_guard lock(db_.mutex());
        // One row per alert, not per recipient
        auto stmt = db_.prepare(
                "SELECT MIN(id), MIN(user_id), alert_type, severity, title, message, printer_id, job_id, created_at "
                "FROM alerts WHERE created_at >= ? AND created_at < ? "
                "GROUP BY alert_type, printer_id, title, created_at ORDER BY created_at DESC LIMIT ?");
        stmt.bind(1, from).bind(2, to).bind(3, limit);
        std::vector<AlertRecord> records;
        while (stmt.step()) {
            AlertRecord record;
            record.id = stmt.columnInt64(0);
            record.userId = stmt.columnInt64(1);
            record.alertType = stmt.columnText(2);
            record.severity = stmt.columnText(3);
            record.title = stmt.columnText(4);
            record.message = stmt.columnText(5);
            if (!stmt.isNull(6)) record.printerId = stmt.columnInt(6);
            record.jobId = stmt.optionalInt64(7);
            record.createdAt = stmt.columnDouble(8);
            records.push_back(std::move(record));
        }
        return records;
    }

    int AlertRepository::count() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("SELECT COUNT(*) FROM alerts");
        return stmt.step() ? stmt.columnInt(0) : 0;
    }

} // namespace storage
