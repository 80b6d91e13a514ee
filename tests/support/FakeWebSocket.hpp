#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "connector/client/WebSocketClient.hpp"

namespace fakes {

    /**
     * @brief In-process websocket: records sent frames and lets the test push frames back
     */
    class FakeWebSocket : public connector::WebSocketClient {
    public:
        bool connect(std::chrono::milliseconds) override {
            connected_ = linkUp;
            return connected_;
        }

        void disconnect() override { connected_ = false; }

        bool send(const std::string &payload) override {
            if (!connected_) return false;
            {
                std::lock_guard lock(mutex_);
                sent_.push_back(payload);
            }
            // Answers on the sending thread, before send() returns
            if (responder) responder(*this, payload);
            return true;
        }

        bool isConnected() const override { return connected_; }

        void setHeader(const std::string &name, const std::string &value) override {
            headers.emplace_back(name, value);
        }

        void receive(const std::string &payload) {
            if (onMessage_) onMessage_(payload);
        }

        std::vector<std::string> sent() const {
            std::lock_guard lock(mutex_);
            return sent_;
        }

        bool linkUp = true;
        std::function<void(FakeWebSocket &, const std::string &)> responder;
        std::vector<std::pair<std::string, std::string>> headers;

    private:
        bool connected_ = false;
        mutable std::mutex mutex_;
        std::vector<std::string> sent_;
    };

    /**
     * @brief WebSocketFactory that hands out one prepared FakeWebSocket per call
     */
    class FakeWebSocketFactory {
    public:
        connector::WebSocketFactory function() {
            return [this](const std::string &url) -> std::unique_ptr<connector::WebSocketClient> {
                urls.push_back(url);
                auto socket = std::make_unique<FakeWebSocket>();
                socket->responder = responder;
                latest = socket.get();
                return socket;
            };
        }

        std::function<void(FakeWebSocket &, const std::string &)> responder;
        FakeWebSocket *latest = nullptr;
        std::vector<std::string> urls;
    };

} // namespace fakes
