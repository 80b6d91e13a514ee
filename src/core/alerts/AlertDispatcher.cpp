#include "core/alerts/AlertDispatcher.hpp"
#include "core/events/EventTypes.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"

namespace core::alerts {

    namespace {
        struct EmailTarget {
            int64_t userId;
            std::string address;
        };

        nlohmann::json optionalJson(const std::optional<int> &value) {
            return value ? nlohmann::json(*value) : nlohmann::json();
        }

        nlohmann::json optionalJson(const std::optional<int64_t> &value) {
            return value ? nlohmann::json(*value) : nlohmann::json();
        }
    }

    AlertDispatcher::AlertDispatcher(storage::Database &db,
                                     events::EventBus &bus,
                                     DeliveryQueue &deliveries,
                                     config::AlertConfig config,
                                     std::shared_ptr<connector::HttpClient> http,
                                     Clock clock)
            : db_(db),
              bus_(bus),
              deliveries_(deliveries),
              config_(std::move(config)),
              clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
              quietHours_(config_.quietHours),
              alerts_(db),
              webhooks_(db),
              webhookChannel_(http, config_.deliveryTimeoutMs),
              emailChannel_(config_.smtp, config_.deliveryTimeoutMs),
              pushChannel_(http, config_.pushGatewayUrl, config_.deliveryTimeoutMs) {
    }

    AlertDispatcher::DispatchResult AlertDispatcher::dispatch(const Alert &alert) {
        DispatchResult result;
        const auto now = clock_();
        const double nowEpoch = utils::toEpochSeconds(now);
        const double windowStart = nowEpoch - std::chrono::duration<double>(config_.dedupWindow).count();

        std::vector<int64_t> recipients;
        std::vector<EmailTarget> emailTargets;
        std::vector<storage::PushSubscription> pushTargets;
        std::vector<storage::WebhookRecord> webhooks;

        try {
            storage::Database::Transaction tx(db_);

            if (alerts_.existsSince(alert.type, alert.printerId, alert.title, windowStart)) {
                tx.commit();
                Logger::logDebug("[AlertDispatcher] Duplicate " + alert.type + " '" + alert.title + "' suppressed");
                std::lock_guard lock(statsMutex_);
                stats_.deduplicated++;
                result.deduplicated = true;
                return result;
            }

            // No preference rows for this type: every active user gets it in-app
            auto users = alerts_.preferencesFor(alert.type);
            if (users.empty()) {
                users = alerts_.activeUsersInAppOnly();
            }

            storage::AlertRecord record;
            record.alertType = alert.type;
            record.severity = severityToString(alert.severity);
            record.title = alert.title;
            record.message = alert.message;
            record.printerId = alert.printerId;
            record.jobId = alert.jobId;
            record.createdAt = nowEpoch;

            for (const auto &user: users) {
                if (user.inApp) {
                    record.userId = user.userId;
                    alerts_.insert(record);
                    recipients.push_back(user.userId);
                }
                if (user.emailEnabled && !user.email.empty()) {
                    emailTargets.push_back({user.userId, user.email});
                }
                if (user.browserPush) {
                    auto subscriptions = alerts_.pushSubscriptionsFor(user.userId);
                    pushTargets.insert(pushTargets.end(), subscriptions.begin(), subscriptions.end());
                }
            }

            if (recipients.empty()) {
                record.userId = 0;
                alerts_.insert(record);
            }
            result.recordsCreated = recipients.empty() ? 1 : recipients.size();

            webhooks = webhooks_.listEnabled();
            tx.commit();
        } catch (const types::StorageException &e) {
            Logger::logError("[AlertDispatcher] Cannot record " + alert.type + ": " + e.what());
            std::lock_guard lock(statsMutex_);
            stats_.storageErrors++;
            return result;
        }

        result.quietHours = quietHours_.isActive(now);

        Logger::logInfo("[AlertDispatcher] " + severityToString(alert.severity) + " " + alert.type + ": " +
                        alert.title + (result.quietHours ? " (quiet hours)" : ""));

        bus_.publish(events::Event(events::types::ALERT_DISPATCHED, "alerts", {
                {"alert_type", alert.type},
                {"severity", severityToString(alert.severity)},
                {"title", alert.title},
                {"message", alert.message},
                {"printer_id", optionalJson(alert.printerId)},
                {"job_id", optionalJson(alert.jobId)},
                {"recipients", recipients},
                {"quiet_hours", result.quietHours},
                {"created_at", nowEpoch}
        }));

        if (!result.quietHours) {
            result.deliveriesQueued += queueWebhooks(webhooks, alert);

            if (emailChannel_.enabled()) {
                for (const auto &target: emailTargets) {
                    auto label = "email " + alert.type + " to user " + std::to_string(target.userId);
                    if (deliveries_.enqueue(label, [this, target, alert]() {
                        return emailChannel_.deliver(target.address, alert);
                    })) {
                        result.deliveriesQueued++;
                    }
                }
            }

            if (pushChannel_.enabled()) {
                for (const auto &subscription: pushTargets) {
                    auto label = "push " + alert.type + " to user " + std::to_string(subscription.userId);
                    if (deliveries_.enqueue(label, [this, subscription, alert]() {
                        return pushChannel_.deliver(subscription, alert);
                    })) {
                        result.deliveriesQueued++;
                    }
                }
            } else if (!pushTargets.empty()) {
                Logger::logDebug("[AlertDispatcher] No push gateway, skipping " +
                                 std::to_string(pushTargets.size()) + " push subscription(s)");
            }
        }

        std::lock_guard lock(statsMutex_);
        stats_.dispatched++;
        stats_.deliveriesQueued += result.deliveriesQueued;
        if (result.quietHours) stats_.suppressedByQuietHours++;
        return result;
    }

    size_t AlertDispatcher::queueWebhooks(const std::vector<storage::WebhookRecord> &webhooks, const Alert &alert) {
        size_t queued = 0;
        for (const auto &webhook: webhooks) {
            if (!webhook.accepts(alert.type)) continue;
            auto label = "webhook '" + webhook.name + "' (" + webhook.webhookType + ") " + alert.type;
            if (deliveries_.enqueue(label, [this, webhook, alert]() {
                return webhookChannel_.deliver(webhook, alert);
            })) {
                queued++;
            }
        }
        return queued;
    }

    std::vector<storage::AlertRecord> AlertDispatcher::quietHoursDigest() {
        auto window = quietHours_.lastWindow(clock_());
        if (!window) return {};
        return alerts_.createdBetween(window->first, window->second, 50);
    }

    size_t AlertDispatcher::sendDigestIfDue() {
        std::lock_guard lock(digestMutex_);

        bool quiet = quietHours_.isActive(clock_());
        bool windowEnded = wasQuiet_ && !quiet;
        wasQuiet_ = quiet;
        if (!windowEnded || !quietHours_.digestEnabled()) return 0;

        std::vector<storage::AlertRecord> records;
        std::vector<storage::WebhookRecord> webhooks;
        std::vector<std::string> addresses;
        try {
            records = quietHoursDigest();
            if (records.empty()) return 0;
            webhooks = webhooks_.listEnabled();
            for (const auto &user: alerts_.activeUsersInAppOnly()) {
                if (!user.email.empty()) addresses.push_back(user.email);
            }
        } catch (const types::StorageException &e) {
            Logger::logError("[AlertDispatcher] Cannot build quiet hours digest: " + std::string(e.what()));
            return 0;
        }

        Alert digest;
        digest.type = "quiet_hours_digest";
        digest.severity = Severity::Info;
        digest.title = "Quiet Hours Digest: " + std::to_string(records.size()) + " alert(s)";
        for (const auto &record: records) {
            digest.message += "[" + record.severity + "] " + record.title + "\n";
        }

        queueWebhooks(webhooks, digest);
        if (emailChannel_.enabled()) {
            for (const auto &address: addresses) {
                deliveries_.enqueue("digest email to " + address, [this, address, digest]() {
                    return emailChannel_.deliver(address, digest);
                });
            }
        }

        Logger::logInfo("[AlertDispatcher] Sent quiet hours digest of " + std::to_string(records.size()) +
                        " alert(s)");
        return records.size();
    }

    AlertDispatcher::Statistics AlertDispatcher::getStatistics() const {
        std::lock_guard lock(statsMutex_);
        return stats_;
    }

} // namespace core::alerts
