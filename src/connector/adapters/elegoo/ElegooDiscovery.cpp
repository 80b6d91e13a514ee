#include "connector/adapters/elegoo/ElegooDiscovery.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <boost/asio.hpp>

namespace connector::adapters::elegoo {

    using boost::asio::ip::udp;

    std::vector<DiscoveredPrinter> ElegooDiscovery::discover(std::chrono::milliseconds window,
                                                             const std::string &broadcastAddress) {
        std::vector<DiscoveredPrinter> found;

        boost::asio::io_context io;
        udp::socket socket(io);
        boost::system::error_code ec;

        socket.open(udp::v4(), ec);
        if (ec) {
            Logger::logWarning("[Discovery] Cannot open UDP socket: " + ec.message());
            return found;
        }
        socket.set_option(boost::asio::socket_base::broadcast(true), ec);
        if (ec) {
            Logger::logWarning("[Discovery] Broadcast not permitted: " + ec.message());
            return found;
        }

        auto address = boost::asio::ip::make_address_v4(broadcastAddress, ec);
        if (ec) {
            Logger::logWarning("[Discovery] Invalid broadcast address " + broadcastAddress);
            return found;
        }

        const std::string probe = sdcp::DISCOVERY_PROBE;
        socket.send_to(boost::asio::buffer(probe), udp::endpoint(address, sdcp::DISCOVERY_PORT), 0, ec);
        if (ec) {
            Logger::logWarning("[Discovery] Probe failed: " + ec.message());
            return found;
        }

        std::array<char, 4096> buffer{};
        udp::endpoint sender;
        std::function<void()> receive = [&]() {
            socket.async_receive_from(boost::asio::buffer(buffer), sender,
                                      [&](const boost::system::error_code &error, std::size_t size) {
                if (error) return;
                std::string ip = sender.address().to_string();
                auto printer = parseDiscoveryReply(std::string(buffer.data(), size), ip);
                bool known = std::any_of(found.begin(), found.end(),
                                         [&ip](const DiscoveredPrinter &p) { return p.ip == ip; });
                if (printer && !known) {
                    Logger::logInfo("[Discovery] Found " + printer->name + " (" + printer->machineName +
                                    ") at " + ip);
                    found.push_back(std::move(*printer));
                }
                receive();
            });
        };
        receive();

        io.run_for(window);
        socket.close(ec);

        Logger::logInfo("[Discovery] " + std::to_string(found.size()) + " SDCP printer(s) answered");
        return found;
    }

} // namespace connector::adapters::elegoo
