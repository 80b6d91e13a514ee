#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "application/config/Settings.hpp"
#include "core/alerts/Alert.hpp"
#include "core/alerts/DeliveryQueue.hpp"
#include "core/alerts/QuietHours.hpp"
#include "core/alerts/channels/EmailChannel.hpp"
#include "core/alerts/channels/PushChannel.hpp"
#include "core/alerts/channels/WebhookChannel.hpp"
#include "core/events/EventSystem.hpp"
#include "storage/AlertRepository.hpp"
#include "storage/Database.hpp"
#include "storage/WebhookRepository.hpp"

namespace core::alerts {

    /**
     * @brief Persists alerts and fans them out to external channels.
     *
     * dispatch() checks the dedup window, resolves recipients and writes
     * the in-app records in one transaction. Every alert that is not a
     * duplicate leaves at least one in-app record. External deliveries
     * are queued on the DeliveryQueue only after the commit, and are
     * skipped entirely during quiet hours.
     */
    class AlertDispatcher {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        AlertDispatcher(storage::Database &db,
                        events::EventBus &bus,
                        DeliveryQueue &deliveries,
                        config::AlertConfig config,
                        std::shared_ptr<connector::HttpClient> http = connector::createHttpClient(),
                        Clock clock = {});

        struct DispatchResult {
            bool deduplicated = false;
            bool quietHours = false;
            size_t recordsCreated = 0;
            size_t deliveriesQueued = 0;
        };

        DispatchResult dispatch(const Alert &alert);

        /**
         * @brief Alerts recorded during the most recent completed quiet window
         */
        std::vector<storage::AlertRecord> quietHoursDigest();

        /**
         * @brief Send one digest through webhooks and email when a quiet window has just ended
         * @return number of alerts summarised, 0 when nothing was sent
         */
        size_t sendDigestIfDue();

        struct Statistics {
            size_t dispatched = 0;
            size_t deduplicated = 0;
            size_t suppressedByQuietHours = 0;
            size_t deliveriesQueued = 0;
            size_t storageErrors = 0;
        };

        Statistics getStatistics() const;

    private:
        storage::Database &db_;
        events::EventBus &bus_;
        DeliveryQueue &deliveries_;
        config::AlertConfig config_;
        Clock clock_;
        QuietHours quietHours_;

        storage::AlertRepository alerts_;
        storage::WebhookRepository webhooks_;

        channels::WebhookChannel webhookChannel_;
        channels::EmailChannel emailChannel_;
        channels::PushChannel pushChannel_;

        std::mutex digestMutex_;
        bool wasQuiet_ = false;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        size_t queueWebhooks(const std::vector<storage::WebhookRecord> &webhooks, const Alert &alert);
    };

} // namespace core::alerts
