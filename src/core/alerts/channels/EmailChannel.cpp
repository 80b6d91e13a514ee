#include "core/alerts/channels/EmailChannel.hpp"

#include <curl/curl.h>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace core::alerts::channels {

    namespace {
        struct UploadState {
            const std::string *payload;
            size_t offset = 0;
        };

        size_t readCallback(char *buffer, size_t size, size_t nitems, void *userp) {
            auto *state = static_cast<UploadState *>(userp);
            size_t room = size * nitems;
            size_t left = state->payload->size() - state->offset;
            size_t count = left < room ? left : room;
            if (count > 0) {
                std::memcpy(buffer, state->payload->data() + state->offset, count);
                state->offset += count;
            }
            return count;
        }

        std::string rfc2822Date(std::chrono::system_clock::time_point tp) {
            auto t = std::chrono::system_clock::to_time_t(tp);
            std::tm utc{};
            gmtime_r(&t, &utc);
            std::ostringstream ss;
            ss << std::put_time(&utc, "%a, %d %b %Y %H:%M:%S +0000");
            return ss.str();
        }
    }

    EmailChannel::EmailChannel(config::SmtpConfig config, long timeoutMs)
            : config_(std::move(config)), timeoutMs_(timeoutMs) {
    }

    std::string EmailChannel::senderAddress() const {
        return config_.fromAddress.empty() ? config_.username : config_.fromAddress;
    }

    std::string EmailChannel::buildMessage(const std::string &from, const std::string &to, const Alert &alert,
                                           std::chrono::system_clock::time_point date) {
        std::ostringstream ss;
        ss << "Date: " << rfc2822Date(date) << "\r\n"
           << "From: " << from << "\r\n"
           << "To: " << to << "\r\n"
           << "Subject: PrintFleet: " << alert.title << "\r\n"
           << "Content-Type: text/plain; charset=utf-8\r\n"
           << "\r\n"
           << alert.title << "\r\n\r\n"
           << alert.message << "\r\n\r\n"
           << "--\r\nPrintFleet\r\n";
        return ss.str();
    }

    types::Result EmailChannel::deliver(const std::string &to, const Alert &alert) const {
        if (!enabled()) {
            return types::Result::unsupported("SMTP not configured");
        }
        if (to.empty()) {
            return types::Result::error("Recipient has no email address");
        }

        std::string from = senderAddress();
        std::string payload = buildMessage(from, to, alert, std::chrono::system_clock::now());
        UploadState upload{&payload};

        CURL *curl = curl_easy_init();
        if (!curl) {
            return types::Result::error("Failed to initialize CURL");
        }

        // Port 465 is implicit TLS, anything else upgrades with STARTTLS when use_tls is set
        std::string scheme = config_.port == 465 ? "smtps://" : "smtp://";
        std::string url = scheme + config_.host + ":" + std::to_string(config_.port);

        struct curl_slist *recipients = curl_slist_append(nullptr, ("<" + to + ">").c_str());
        std::string mailFrom = "<" + from + ">";

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mailFrom.c_str());
        curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs_);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs_);
        if (config_.useTls) {
            curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        }
        if (!config_.username.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERNAME, config_.username.c_str());
            curl_easy_setopt(curl, CURLOPT_PASSWORD, config_.password.c_str());
        }

        CURLcode res = curl_easy_perform(curl);

        curl_slist_free_all(recipients);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return types::Result::error(std::string("SMTP to ") + to + ": " + curl_easy_strerror(res));
        }
        return types::Result::success("Mail sent to " + to);
    }

} // namespace core::alerts::channels
