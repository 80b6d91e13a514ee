#include "connector/client/WebSocketClient.hpp"
#include "logger/Logger.hpp"
#include <ixwebsocket/IXWebSocket.h>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace connector {

    class WebSocketClientIx : public WebSocketClient {
    public:
        explicit WebSocketClientIx(const std::string &url)
                : url_(url),
                  connected_(false),
                  handshakeDone_(false) {}

        bool connect(std::chrono::milliseconds openTimeout) override {
            {
                std::lock_guard lock(mutex_);
                handshakeDone_ = false;
            }

            socket_.setUrl(url_);
            socket_.disableAutomaticReconnection();
            socket_.setPingInterval(30);
            if (!headers_.empty()) {
                socket_.setExtraHeaders(headers_);
            }

            socket_.setOnMessageCallback([this](const ix::WebSocketMessagePtr &msg) {
                if (msg->type == ix::WebSocketMessageType::Open) {
                    onSocketOpen();
                } else if (msg->type == ix::WebSocketMessageType::Close) {
                    onSocketClose(msg->closeInfo.reason);
                } else if (msg->type == ix::WebSocketMessageType::Message) {
                    deliver(msg->str);
                } else if (msg->type == ix::WebSocketMessageType::Error) {
                    onSocketError(msg->errorInfo.reason);
                }
            });

            socket_.start();

            std::unique_lock lock(mutex_);
            bool finished = handshakeCondition_.wait_for(lock, openTimeout, [this] { return handshakeDone_; });
            bool ok = finished && connected_;
            lock.unlock();

            if (!ok) {
                Logger::logWarning("[WS] Handshake with " + url_ + (finished ? " failed" : " timed out"));
                socket_.stop();
            }
            return ok;
        }

        void disconnect() override {
            socket_.stop();
            connected_ = false;
        }

        bool send(const std::string &payload) override {
            if (!connected_) {
                Logger::logDebug("[WS] Dropping message, link to " + url_ + " is down");
                return false;
            }
            auto info = socket_.send(payload);
            return info.success;
        }

        bool isConnected() const override {
            return connected_;
        }

        void setHeader(const std::string &name, const std::string &value) override {
            headers_[name] = value;
        }

        ~WebSocketClientIx() override {
            socket_.stop();
        }

    private:
        std::string url_;
        ix::WebSocket socket_;
        ix::WebSocketHttpHeaders headers_;
        std::atomic<bool> connected_;
        std::mutex mutex_;
        std::condition_variable handshakeCondition_;
        bool handshakeDone_;

        void deliver(const std::string &payload) {
            if (!onMessage_) return;
            try {
                onMessage_(payload);
            } catch (const std::exception &e) {
                Logger::logError("[WS] Message handler for " + url_ + " failed: " + std::string(e.what()));
            }
        }

        void finishHandshake() {
            {
                std::lock_guard lock(mutex_);
                handshakeDone_ = true;
            }
            handshakeCondition_.notify_all();
        }

        void onSocketOpen() {
            connected_ = true;
            Logger::logInfo("[WS] Connected to " + url_);
            finishHandshake();
            if (onOpen_) onOpen_();
        }

        void onSocketClose(const std::string &reason) {
            bool wasConnected = connected_.exchange(false);
            finishHandshake();
            if (wasConnected) {
                Logger::logWarning("[WS] Disconnected from " + url_ + (reason.empty() ? "" : ": " + reason));
                if (onClose_) onClose_(reason);
            }
        }

        void onSocketError(const std::string &reason) {
            Logger::logError("[WS] Error on " + url_ + ": " + reason);
            bool wasConnected = connected_.exchange(false);
            finishHandshake();
            if (onError_) onError_(reason);
            if (wasConnected && onClose_) onClose_(reason);
        }
    };

    std::unique_ptr<WebSocketClient> createWebSocketClient(const std::string &url) {
        return std::make_unique<WebSocketClientIx>(url);
    }

} // namespace connector
