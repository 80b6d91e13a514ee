#include "application/controllers/ApplicationController.hpp"
#include "connector/adapters/elegoo/ElegooDiscovery.hpp"
#include "logger/Logger.hpp"
#include <curl/curl.h>
#include <csignal>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int signal) {
    (void) signal;
    running = false;
    shutdownCondition.notify_all();
}

void waitForShutdownSignal() {
    std::unique_lock<std::mutex> lock(shutdownMutex);
    // Timed wait: notify_all from a signal handler is not guaranteed to wake us
    while (running.load()) {
        shutdownCondition.wait_for(lock, std::chrono::milliseconds(500));
    }
}

int runDiscovery() {
    auto printers = connector::adapters::elegoo::ElegooDiscovery::discover();
    if (printers.empty()) {
        std::cout << "No SDCP printers answered" << std::endl;
        return 0;
    }
    for (const auto &printer: printers) {
        std::cout << printer.ip << "  " << printer.name << "  " << printer.machineName
                  << "  mainboard=" << printer.mainboardId << "  firmware=" << printer.firmware << std::endl;
    }
    return 0;
}

int main(int argc, char **argv) {
    std::string configPath = "config.json";
    bool discover = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--discover") {
            discover = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [config.json] [--discover]" << std::endl;
            return 0;
        } else {
            configPath = arg;
        }
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exitCode = 0;

    try {
        if (discover) {
            exitCode = runDiscovery();
        } else {
            std::signal(SIGINT, handleSignal);
            std::signal(SIGTERM, handleSignal);

            ApplicationController app(configPath);
            if (!app.initialize()) {
                Logger::logError("Application initialization failed");
                exitCode = 1;
            } else {
                waitForShutdownSignal();
                Logger::logInfo("Shutdown signal received");
            }
            app.shutdown();
        }
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    curl_global_cleanup();
    return exitCode;
}
