#pragma once

#include <string>

namespace core::types {

    enum class ResultCode {
        Success,
        Error,
        NotConnected,
        Unsupported,
        Timeout
    };

    struct Result {
        ResultCode code;
        std::string message;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isError() const {
            return code != ResultCode::Success;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg};
        }

        static inline Result error(const std::string &msg = "Error") {
            return {ResultCode::Error, msg};
        }

        static inline Result notConnected(const std::string &msg = "Printer not connected") {
            return {ResultCode::NotConnected, msg};
        }

        static inline Result unsupported(const std::string &msg = "Command not supported by this protocol") {
            return {ResultCode::Unsupported, msg};
        }

        static inline Result timeout(const std::string &msg = "Timeout waiting for printer") {
            return {ResultCode::Timeout, msg};
        }
    };

}
