#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "connector/adapters/elegoo/SdcpMessages.hpp"

namespace connector::adapters::elegoo {

    /**
     * @brief SDCP LAN discovery: broadcast M99999 on UDP 3000 and collect
     * every reply that arrives before the window closes
     */
    class ElegooDiscovery {
    public:
        static std::vector<DiscoveredPrinter> discover(
                std::chrono::milliseconds window = std::chrono::milliseconds(3000),
                const std::string &broadcastAddress = "255.255.255.255");
    };

} // namespace connector::adapters::elegoo
