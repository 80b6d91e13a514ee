#pragma once

#include <chrono>
#include <string>

#include "application/config/Settings.hpp"
#include "core/alerts/Alert.hpp"
#include "core/types/Result.hpp"

namespace core::alerts::channels {

    /**
     * @brief Plain-text alert mail over SMTP through libcurl
     */
    class EmailChannel {
    public:
        explicit EmailChannel(config::SmtpConfig config, long timeoutMs = 10000);

        bool enabled() const { return config_.enabled && !config_.host.empty(); }

        types::Result deliver(const std::string &to, const Alert &alert) const;

        /**
         * @brief RFC 5322 message with CRLF line endings
         */
        static std::string buildMessage(const std::string &from, const std::string &to, const Alert &alert,
                                        std::chrono::system_clock::time_point date);

    private:
        config::SmtpConfig config_;
        long timeoutMs_;

        std::string senderAddress() const;
    };

} // namespace core::alerts::channels
