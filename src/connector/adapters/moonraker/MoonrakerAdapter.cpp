#include "connector/adapters/moonraker/MoonrakerAdapter.hpp"
#include "connector/adapters/JsonFields.hpp"
#include "logger/Logger.hpp"

#include <cmath>

namespace connector::adapters::moonraker {

    using core::printer::Heater;
    using core::types::Result;

    MoonrakerAdapter::MoonrakerAdapter(core::printer::PrinterEndpoint endpoint,
                                       StatusCallback onStatus,
                                       AdapterOptions options,
                                       WebSocketFactory socketFactory)
            : PrinterAdapter(std::move(endpoint), std::move(onStatus)),
              options_(options),
              socketFactory_(std::move(socketFactory)) {
    }

    MoonrakerAdapter::~MoonrakerAdapter() {
        disconnect();
    }

    std::string MoonrakerAdapter::url() const {
        int port = endpoint_.port > 0 ? endpoint_.port : 7125;
        return "ws://" + endpoint_.host + ":" + std::to_string(port) + "/websocket";
    }

    bool MoonrakerAdapter::connect() {
        disconnect();

        auto socket = socketFactory_(url());
        if (!socket) {
            recordTransportError("No websocket client available");
            return false;
        }
        if (!endpoint_.apiKey.empty()) {
            socket->setHeader("X-Api-Key", endpoint_.apiKey);
        }

        socket->setOnMessage([this](const std::string &payload) { handleMessage(payload); });
        socket->setOnClose([this](const std::string &reason) {
            recordTransportError("Connection closed" + (reason.empty() ? std::string() : ": " + reason));
        });
        socket->setOnError([this](const std::string &reason) {
            recordTransportError("Connection error: " + reason);
        });

        Logger::logInfo(logTag() + " Connecting to " + url());
        if (!socket->connect(options_.connectTimeout)) {
            recordTransportError("Unable to connect to " + url());
            return false;
        }

        {
            std::lock_guard lock(socketMutex_);
            socket_ = std::move(socket);
        }
        {
            std::lock_guard lock(snapshotMutex_);
            snapshot_ = MoonrakerSnapshot{};
        }

        if (!subscribe()) {
            recordTransportError("Subscription request could not be sent");
            disconnect();
            return false;
        }

        Logger::logInfo(logTag() + " Connected");
        return true;
    }

    void MoonrakerAdapter::disconnect() {
        std::unique_ptr<WebSocketClient> socket;
        {
            std::lock_guard lock(socketMutex_);
            socket = std::move(socket_);
        }
        if (!socket) return;

        // Closing joins the receive thread, which may be waiting on socketMutex_
        socket->setOnClose(nullptr);
        socket->setOnError(nullptr);
        socket->disconnect();
        subscribeRequestId_ = -1;
        Logger::logInfo(logTag() + " Disconnected");
    }

    bool MoonrakerAdapter::isConnected() const {
        std::lock_guard lock(socketMutex_);
        return socket_ && socket_->isConnected();
    }

    bool MoonrakerAdapter::subscribe() {
        // The reply can arrive on the receive thread before send() returns
        int requestId = nextRequestId_++;
        subscribeRequestId_ = requestId;
        nlohmann::json params = {{"objects", MoonrakerSnapshot::subscriptionObjects()}};
        return sendRpc("printer.objects.subscribe", params, requestId).isSuccess();
    }

    Result MoonrakerAdapter::sendRpc(const std::string &method, const nlohmann::json &params, int requestId) {
        int id = requestId > 0 ? requestId : nextRequestId_++;
        nlohmann::json request = {
                {"jsonrpc", "2.0"},
                {"method", method},
                {"params", params},
                {"id", id}
        };

        std::lock_guard lock(socketMutex_);
        if (!socket_ || !socket_->isConnected()) {
            return Result::notConnected();
        }
        if (!socket_->send(request.dump())) {
            return Result::error("Failed to send " + method);
        }
        return Result::success(method + " sent");
    }

    void MoonrakerAdapter::handleMessage(const std::string &payload) {
        nlohmann::json message;
        try {
            message = nlohmann::json::parse(payload);
        } catch (const nlohmann::json::parse_error &e) {
            Logger::logWarning(logTag() + " Dropping malformed frame: " + e.what());
            return;
        }
        if (!message.is_object()) {
            Logger::logWarning(logTag() + " Dropping non-object frame");
            return;
        }

        if (message.contains("id")) {
            if (message.contains("error")) {
                Logger::logWarning(logTag() + " RPC error: " +
                                   message["error"].dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
                return;
            }
            const auto &id = message["id"];
            if (id.is_number_integer() && id.get<int>() == subscribeRequestId_.load()) {
                const auto &result = message.contains("result") ? message["result"] : nlohmann::json();
                if (result.is_object() && result.contains("status")) {
                    std::lock_guard lock(snapshotMutex_);
                    snapshot_.applyDelta(result["status"]);
                }
                publishSnapshot(message);
            }
            return;
        }

        std::string method = fields::string(message, "method");
        if (method == "notify_status_update") {
            const auto &params = message.contains("params") ? message["params"] : nlohmann::json();
            if (!params.is_array() || params.empty() || !params[0].is_object()) {
                Logger::logWarning(logTag() + " Status update without an object payload");
                return;
            }
            {
                std::lock_guard lock(snapshotMutex_);
                snapshot_.applyDelta(params[0]);
            }
            publishSnapshot(params[0]);
        } else if (method == "notify_klippy_shutdown" || method == "notify_klippy_disconnected") {
            std::string notice = method == "notify_klippy_shutdown" ? "shutdown" : "disconnected";
            Logger::logWarning(logTag() + " Klipper reported " + notice);
            {
                std::lock_guard lock(snapshotMutex_);
                snapshot_.klippyNotice = notice;
            }
            publishSnapshot(message);
        } else if (method == "notify_klippy_ready") {
            Logger::logInfo(logTag() + " Klipper ready, resubscribing");
            {
                std::lock_guard lock(snapshotMutex_);
                snapshot_.klippyNotice.clear();
            }
            if (!subscribe()) {
                Logger::logWarning(logTag() + " Resubscribe failed");
            }
        }
    }

    void MoonrakerAdapter::publishSnapshot(const nlohmann::json &raw) {
        core::printer::CanonicalStatus status;
        {
            std::lock_guard lock(snapshotMutex_);
            status = snapshot_.toCanonical();
        }
        status.raw = raw;
        ingest(std::move(status));
    }

    Result MoonrakerAdapter::pause() {
        return sendRpc("printer.print.pause");
    }

    Result MoonrakerAdapter::resume() {
        return sendRpc("printer.print.resume");
    }

    Result MoonrakerAdapter::cancel() {
        return sendRpc("printer.print.cancel");
    }

    Result MoonrakerAdapter::setTemperature(Heater heater, double celsius) {
        if (celsius < 0.0) {
            return Result::error("Temperature must not be negative");
        }
        std::string script = std::string(heater == Heater::Bed ? "M140" : "M104") +
                             " S" + std::to_string(std::lround(celsius));
        return sendRpc("printer.gcode.script", {{"script", script}});
    }

} // namespace connector::adapters::moonraker
