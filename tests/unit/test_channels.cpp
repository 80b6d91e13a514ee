#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "core/alerts/channels/EmailChannel.hpp"
#include "core/alerts/channels/PushChannel.hpp"
#include "core/alerts/channels/WebhookChannel.hpp"
#include "core/utils/Time.hpp"
#include "support/FakeHttpClient.hpp"

using namespace core::alerts;
using channels::WebhookChannel;

namespace {

    const auto NOW = ::utils::fromEpochSeconds(1700000000.0);

    Alert failedAlert() {
        Alert alert;
        alert.type = alert_types::PRINT_FAILED;
        alert.severity = Severity::Critical;
        alert.title = "Print Failed: cube (Voron)";
        alert.message = "Job 'cube' failed on Voron at 40% progress.";
        alert.printerId = 2;
        alert.jobId = 11;
        return alert;
    }

    storage::WebhookRecord webhook(const std::string &type, const std::string &url) {
        storage::WebhookRecord record;
        record.name = type;
        record.webhookType = type;
        record.url = url;
        return record;
    }

    std::string header(const connector::HttpRequest &request, const std::string &name) {
        for (const auto &h: request.headers) {
            if (h.first == name) return h.second;
        }
        return "";
    }

}

TEST_CASE("Webhook payloads follow the webhook type", "[alerts][webhook]") {
    auto alert = failedAlert();

    SECTION("discord embeds") {
        auto request = WebhookChannel::buildRequest(webhook("discord", "https://discord.example/wh"), alert, NOW);
        REQUIRE(request);
        auto body = nlohmann::json::parse(request->body);
        const auto &embed = body["embeds"][0];
        CHECK(embed["title"] == alert.title);
        CHECK(embed["color"] == WebhookChannel::severityColor(Severity::Critical));
        CHECK(embed["timestamp"] == "2023-11-14T22:13:20Z");
    }

    SECTION("slack blocks") {
        auto request = WebhookChannel::buildRequest(webhook("slack", "https://hooks.slack.example/x"), alert, NOW);
        REQUIRE(request);
        auto body = nlohmann::json::parse(request->body);
        CHECK(body["blocks"][0]["text"]["text"] == alert.title);
        CHECK(body["blocks"][1]["text"]["text"] == alert.message);
    }

    SECTION("ntfy plain text with headers") {
        auto request = WebhookChannel::buildRequest(webhook("ntfy", "https://ntfy.example/fleet"), alert, NOW);
        REQUIRE(request);
        CHECK(request->body == alert.message);
        CHECK(header(*request, "Title") == alert.title);
        CHECK(header(*request, "Priority") == "urgent");
    }

    SECTION("telegram needs token and chat id") {
        auto request = WebhookChannel::buildRequest(webhook("telegram", "123:abc | -100200"), alert, NOW);
        REQUIRE(request);
        CHECK(request->url == "https://api.telegram.org/bot123:abc/sendMessage");
        auto body = nlohmann::json::parse(request->body);
        CHECK(body["chat_id"] == "-100200");
        CHECK(body["parse_mode"] == "Markdown");

        CHECK_FALSE(WebhookChannel::buildRequest(webhook("telegram", "123:abc"), alert, NOW));
    }

    SECTION("generic JSON") {
        auto request = WebhookChannel::buildRequest(webhook("generic", "https://example.net/in"), alert, NOW);
        REQUIRE(request);
        auto body = nlohmann::json::parse(request->body);
        CHECK(body["event"] == "print_failed");
        CHECK(body["severity"] == "critical");
        CHECK(body["job_id"] == 11);
    }
}

TEST_CASE("Webhook filters by alert type", "[alerts][webhook]") {
    auto record = webhook("generic", "https://example.net/in");
    CHECK(record.accepts(alert_types::PRINT_FAILED));
    record.alertTypes = {alert_types::PRINTER_OFFLINE};
    CHECK_FALSE(record.accepts(alert_types::PRINT_FAILED));
    CHECK(record.accepts(alert_types::PRINTER_OFFLINE));
}

TEST_CASE("Webhook delivery reports HTTP failures", "[alerts][webhook]") {
    auto http = std::make_shared<fakes::FakeHttpClient>();
    WebhookChannel channel(http, 2500);
    http->respond(500, "");
    http->failTransport("Couldn't connect to server");

    auto first = channel.deliver(webhook("generic", "https://example.net/in"), failedAlert());
    CHECK(first.isError());
    CHECK(first.message == "HTTP 500");
    CHECK(http->requests()[0].timeoutMs == 2500);

    auto second = channel.deliver(webhook("generic", "https://example.net/in"), failedAlert());
    CHECK(second.message == "Couldn't connect to server");

    CHECK(channel.deliver(webhook("generic", "https://example.net/in"), failedAlert()).isSuccess());
}

TEST_CASE("Email messages are CRLF terminated with a prefixed subject", "[alerts][email]") {
    auto message = channels::EmailChannel::buildMessage("fleet@example.net", "ops@example.net", failedAlert(), NOW);
    CHECK(message.find("Subject: PrintFleet: Print Failed: cube (Voron)\r\n") != std::string::npos);
    CHECK(message.find("To: ops@example.net\r\n") != std::string::npos);
    CHECK(message.find("\r\n\r\n") != std::string::npos);

    core::config::SmtpConfig smtp;
    CHECK_FALSE(channels::EmailChannel(smtp).enabled());
    CHECK(channels::EmailChannel(smtp).deliver("ops@example.net", failedAlert()).code ==
          core::types::ResultCode::Unsupported);
}

TEST_CASE("Push requests go to the gateway", "[alerts][push]") {
    storage::PushSubscription subscription;
    subscription.userId = 4;
    subscription.endpoint = "https://push.example/abc";
    subscription.p256dh = "key";
    subscription.auth = "auth";

    auto body = nlohmann::json::parse(channels::PushChannel::buildBody(subscription, failedAlert()));
    CHECK(body["subscription"]["endpoint"] == "https://push.example/abc");
    CHECK(body["subscription"]["keys"]["p256dh"] == "key");
    CHECK(body["notification"]["alert_type"] == "print_failed");

    auto http = std::make_shared<fakes::FakeHttpClient>();
    CHECK_FALSE(channels::PushChannel(http, "").enabled());

    channels::PushChannel push(http, "https://gateway.example/send");
    REQUIRE(push.deliver(subscription, failedAlert()).isSuccess());
    REQUIRE(http->requests().size() == 1);
    CHECK(http->requests()[0].url == "https://gateway.example/send");
}
