#include "core/printer/PrinterAdapter.hpp"
#include "logger/Logger.hpp"

namespace core::printer {

    PrinterAdapter::PrinterAdapter(PrinterEndpoint endpoint, StatusCallback onStatus)
            : endpoint_(std::move(endpoint)),
              tracker_(endpoint_.printerId),
              onStatus_(std::move(onStatus)) {
    }

    std::string PrinterAdapter::lastTransportError() const {
        std::lock_guard<std::mutex> lock(errorMutex_);
        return lastTransportError_;
    }

    void PrinterAdapter::ingest(CanonicalStatus status) {
        status.printerId = endpoint_.printerId;
        if (status.state != PrinterState::Offline) {
            std::lock_guard<std::mutex> lock(errorMutex_);
            lastTransportError_.clear();
        }
        tracker_.update(status);

        if (!onStatus_) return;
        try {
            onStatus_(tracker_.snapshot());
        } catch (const std::exception &e) {
            Logger::logError(logTag() + " Status handler failed: " + e.what());
        }
    }

    void PrinterAdapter::recordTransportError(const std::string &reason) {
        {
            std::lock_guard<std::mutex> lock(errorMutex_);
            lastTransportError_ = reason;
        }
        tracker_.markOffline(reason);
        Logger::logWarning(logTag() + " " + reason);
    }

    std::string PrinterAdapter::logTag() const {
        return "[" + protocolKindToString(kind()) + ":" + endpoint_.name + "]";
    }

} // namespace core::printer
