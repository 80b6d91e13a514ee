#pragma once

#include <string>

namespace connector::kafka {

    /**
     * @brief Outbound message sink for the external bus
     */
    class MessageSender {
    public:
        virtual ~MessageSender() = default;

        /**
         * @param topic destination topic
         * @param message JSON payload
         * @param key partitioning key, empty for none
         * @return true if the message was handed to the transport
         */
        virtual bool sendMessage(const std::string &topic, const std::string &message,
                                 const std::string &key = "") = 0;

        virtual bool isReady() const = 0;

        virtual std::string getSenderName() const = 0;
    };

}
