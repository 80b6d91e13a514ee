#include "connector/adapters/elegoo/ElegooAdapter.hpp"
#include "connector/adapters/JsonFields.hpp"
#include "logger/Logger.hpp"

namespace connector::adapters::elegoo {

    using core::types::Result;

    ElegooAdapter::ElegooAdapter(core::printer::PrinterEndpoint endpoint,
                                 StatusCallback onStatus,
                                 AdapterOptions options,
                                 WebSocketFactory socketFactory)
            : PrinterAdapter(std::move(endpoint), std::move(onStatus)),
              options_(options),
              socketFactory_(std::move(socketFactory)),
              mainboardId_(endpoint_.serial) {
    }

    ElegooAdapter::~ElegooAdapter() {
        disconnect();
    }

    std::string ElegooAdapter::url() const {
        int port = endpoint_.port > 0 ? endpoint_.port : sdcp::WEBSOCKET_PORT;
        return "ws://" + endpoint_.host + ":" + std::to_string(port) + "/websocket";
    }

    std::string ElegooAdapter::mainboardId() const {
        std::lock_guard lock(stateMutex_);
        return mainboardId_;
    }

    bool ElegooAdapter::connect() {
        disconnect();

        auto socket = socketFactory_(url());
        if (!socket) {
            recordTransportError("No websocket client available");
            return false;
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

        Result request = sendCommand(sdcp::STATUS_REQUEST);
        if (request.isError()) {
            Logger::logWarning(logTag() + " Initial status request failed: " + request.message);
        }

        Logger::logInfo(logTag() + " Connected");
        return true;
    }

    void ElegooAdapter::disconnect() {
        std::unique_ptr<WebSocketClient> socket;
        {
            std::lock_guard lock(socketMutex_);
            socket = std::move(socket_);
        }
        if (!socket) return;

        socket->setOnClose(nullptr);
        socket->setOnError(nullptr);
        socket->disconnect();
        Logger::logInfo(logTag() + " Disconnected");
    }

    bool ElegooAdapter::isConnected() const {
        std::lock_guard lock(socketMutex_);
        return socket_ && socket_->isConnected();
    }

    void ElegooAdapter::handleMessage(const std::string &payload) {
        auto message = nlohmann::json::parse(payload, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            Logger::logWarning(logTag() + " Dropping malformed frame");
            return;
        }

        if (auto errorCode = parseErrorMessage(message)) {
            Logger::logWarning(logTag() + " Device error " + std::to_string(*errorCode));
            std::optional<SdcpStatus> current;
            {
                std::lock_guard lock(stateMutex_);
                latchedError_ = *errorCode;
                current = lastStatus_;
            }
            if (current) {
                publish(*current, message);
            }
            return;
        }

        auto status = parseStatusMessage(message);
        if (!status) {
            Logger::logDebug(logTag() + " Ignoring topic " + fields::string(message, "Topic", "<none>"));
            return;
        }

        {
            std::lock_guard lock(stateMutex_);
            if (mainboardId_.empty() && !status->mainboardId.empty()) {
                mainboardId_ = status->mainboardId;
            }
            lastStatus_ = *status;
        }
        publish(*status, message);
    }

    void ElegooAdapter::publish(const SdcpStatus &status, const nlohmann::json &raw) {
        auto canonical = status.toCanonical();
        {
            // An sdcp/error notice stays attached until the print it stopped is over
            std::lock_guard lock(stateMutex_);
            if (latchedError_ != 0) {
                if (canonical.isActive() && canonical.deviceErrorCode.empty()) {
                    canonical.deviceErrorCode = "sdcp:" + std::to_string(latchedError_);
                    canonical.deviceErrorMessage = "Device error " + std::to_string(latchedError_);
                } else if (!canonical.isActive()) {
                    latchedError_ = 0;
                }
            }
        }
        canonical.raw = raw;
        ingest(std::move(canonical));
    }

    Result ElegooAdapter::sendCommand(int cmd, const nlohmann::json &data) {
        std::string board = mainboardId();
        std::lock_guard lock(socketMutex_);
        if (!socket_ || !socket_->isConnected()) {
            return Result::notConnected();
        }
        if (!socket_->send(buildCommand(cmd, board, data).dump())) {
            return Result::error("Failed to send SDCP command " + std::to_string(cmd));
        }
        return Result::success("SDCP command " + std::to_string(cmd) + " sent");
    }

    Result ElegooAdapter::pause() {
        return sendCommand(sdcp::PAUSE_PRINT);
    }

    Result ElegooAdapter::resume() {
        return sendCommand(sdcp::RESUME_PRINT);
    }

    Result ElegooAdapter::cancel() {
        return sendCommand(sdcp::STOP_PRINT);
    }

    Result ElegooAdapter::setTemperature(core::printer::Heater, double) {
        return Result::unsupported("SDCP has no temperature command");
    }

    Result ElegooAdapter::setPrintSpeed(int percent) {
        if (percent <= 0) {
            return Result::error("Print speed must be positive");
        }
        return sendCommand(sdcp::SET_PRINT_SPEED, {{"PrintSpeedPct", percent}});
    }

} // namespace connector::adapters::elegoo
