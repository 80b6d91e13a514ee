#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace connector {

    /**
     * @brief One websocket link to one device.
     *
     * The client never reconnects on its own: a dropped link is reported
     * through onClose and the owner decides when to build a new client.
     */
    class WebSocketClient {
    public:
        virtual ~WebSocketClient() = default;

        /**
         * @brief Start the link and wait until the handshake completes
         * @return false on handshake failure or when openTimeout elapses
         */
        virtual bool connect(std::chrono::milliseconds openTimeout) = 0;

        /**
         * @brief Close the link; returns once the receive thread has exited
         */
        virtual void disconnect() = 0;

        virtual bool send(const std::string &payload) = 0;

        virtual bool isConnected() const = 0;

        virtual void setHeader(const std::string &name, const std::string &value) = 0;

        void setOnMessage(std::function<void(const std::string &)> cb) { onMessage_ = std::move(cb); }

        void setOnOpen(std::function<void()> cb) { onOpen_ = std::move(cb); }

        void setOnClose(std::function<void(const std::string &reason)> cb) { onClose_ = std::move(cb); }

        void setOnError(std::function<void(const std::string &reason)> cb) { onError_ = std::move(cb); }

    protected:
        std::function<void(const std::string &)> onMessage_;
        std::function<void()> onOpen_;
        std::function<void(const std::string &)> onClose_;
        std::function<void(const std::string &)> onError_;
    };

    using WebSocketFactory = std::function<std::unique_ptr<WebSocketClient>(const std::string &url)>;

    std::unique_ptr<WebSocketClient> createWebSocketClient(const std::string &url);
}
