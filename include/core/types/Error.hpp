#pragma once

#include <stdexcept>
#include <string>

namespace core::types {

    class FleetException : public std::runtime_error {
    public:
        explicit FleetException(const std::string &msg)
                : std::runtime_error(msg) {}
    };

    /**
     * @brief Connect failure, reset or timeout on a printer link
     */
    class TransportException : public FleetException {
    public:
        explicit TransportException(const std::string &msg)
                : FleetException("Transport error: " + msg) {}
    };

    class ParseException : public FleetException {
    public:
        explicit ParseException(const std::string &msg)
                : FleetException("Malformed payload: " + msg) {}
    };

    class StorageException : public FleetException {
    public:
        explicit StorageException(const std::string &msg)
                : FleetException("Storage error: " + msg) {}
    };

    class ConfigException : public FleetException {
    public:
        explicit ConfigException(const std::string &msg)
                : FleetException("Configuration error: " + msg) {}
    };

}
