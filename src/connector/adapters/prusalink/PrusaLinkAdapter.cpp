#include "connector/adapters/prusalink/PrusaLinkAdapter.hpp"
#include "connector/adapters/prusalink/PrusaLinkStatusParser.hpp"
#include "logger/Logger.hpp"

namespace connector::adapters::prusalink {

    using core::printer::CanonicalStatus;
    using core::printer::PrinterState;
    using core::types::Result;

    PrusaLinkAdapter::PrusaLinkAdapter(core::printer::PrinterEndpoint endpoint,
                                       StatusCallback onStatus,
                                       AdapterOptions options,
                                       std::shared_ptr<HttpClient> http)
            : PrinterAdapter(std::move(endpoint), std::move(onStatus)),
              options_(options),
              http_(std::move(http)) {
    }

    PrusaLinkAdapter::~PrusaLinkAdapter() {
        disconnect();
    }

    std::string PrusaLinkAdapter::baseUrl() const {
        int port = endpoint_.port > 0 ? endpoint_.port : 80;
        return "http://" + endpoint_.host + ":" + std::to_string(port);
    }

    bool PrusaLinkAdapter::connect() {
        disconnect();
        legacyApi_ = false;

        Logger::logInfo(logTag() + " Polling " + baseUrl() + " every " +
                        std::to_string(options_.pollInterval.count()) + "s");
        if (!pollOnce()) {
            return false;
        }

        std::lock_guard lock(workerMutex_);
        stop_.reset();
        worker_ = std::thread(&PrusaLinkAdapter::pollLoop, this);
        return true;
    }

    void PrusaLinkAdapter::disconnect() {
        std::lock_guard lock(workerMutex_);
        stop_.requestStop();
        if (worker_.joinable()) {
            // Returns after the in-flight request, bounded by the request timeout
            worker_.join();
            Logger::logInfo(logTag() + " Poller stopped");
        }
        connected_ = false;
    }

    void PrusaLinkAdapter::pollLoop() {
        while (!stop_.waitFor(options_.pollInterval)) {
            try {
                pollOnce();
            } catch (const std::exception &e) {
                fail(std::string("Poll failed: ") + e.what());
            }
        }
    }

    HttpResponse PrusaLinkAdapter::request(const std::string &method, const std::string &path) {
        HttpRequest req;
        req.method = method;
        req.url = baseUrl() + path;
        req.timeoutMs = static_cast<long>(options_.requestTimeout.count());
        req.headers.emplace_back("Accept", "application/json");
        if (!endpoint_.apiKey.empty()) {
            req.headers.emplace_back("X-Api-Key", endpoint_.apiKey);
        } else if (!endpoint_.username.empty()) {
            req.digestUser = endpoint_.username;
            req.digestPassword = endpoint_.password;
        }
        return http_->perform(req);
    }

    bool PrusaLinkAdapter::fail(const std::string &reason) {
        connected_ = false;
        recordTransportError(reason);
        return false;
    }

    bool PrusaLinkAdapter::pollOnce() {
        return legacyApi_ ? pollLegacy() : pollV1();
    }

    bool PrusaLinkAdapter::pollV1() {
        auto response = request("GET", "/api/v1/status");
        if (response.transportFailed()) {
            return fail("Request failed: " + response.error);
        }
        if (response.status == 404) {
            Logger::logInfo(logTag() + " /api/v1/status not available, using legacy API");
            legacyApi_ = true;
            return pollLegacy();
        }
        if (response.status == 401 || response.status == 403) {
            return fail("Authentication rejected (HTTP " + std::to_string(response.status) + ")");
        }

        CanonicalStatus status;
        if (response.status == 204) {
            status.state = PrinterState::Idle;
        } else if (response.ok()) {
            auto body = nlohmann::json::parse(response.body, nullptr, false);
            if (body.is_discarded() || !body.is_object()) {
                Logger::logWarning(logTag() + " Dropping malformed status body");
                connected_ = true;
                return true;
            }
            status = PrusaLinkStatusParser::parseStatus(body);
        } else {
            return fail("Unexpected HTTP " + std::to_string(response.status) + " from /api/v1/status");
        }

        // File details only change with the job, fetch them once per job id
        if (!status.deviceJobId.empty()) {
            if (status.deviceJobId != lastJobId_) {
                auto job = request("GET", "/api/v1/job");
                if (job.ok()) {
                    auto body = nlohmann::json::parse(job.body, nullptr, false);
                    if (!body.is_discarded()) {
                        PrusaLinkStatusParser::applyJob(status, body);
                        lastJobId_ = status.deviceJobId;
                        lastFilename_ = status.filename;
                    }
                }
            } else {
                status.filename = lastFilename_;
            }
        }

        connected_ = true;
        ingest(std::move(status));
        return true;
    }

    bool PrusaLinkAdapter::pollLegacy() {
        auto printer = request("GET", "/api/printer");
        if (printer.transportFailed()) {
            return fail("Request failed: " + printer.error);
        }
        if (!printer.ok()) {
            return fail("Unexpected HTTP " + std::to_string(printer.status) + " from /api/printer");
        }

        auto printerBody = nlohmann::json::parse(printer.body, nullptr, false);
        if (printerBody.is_discarded() || !printerBody.is_object()) {
            Logger::logWarning(logTag() + " Dropping malformed printer body");
            connected_ = true;
            return true;
        }

        nlohmann::json jobBody;
        auto job = request("GET", "/api/job");
        if (job.ok()) {
            jobBody = nlohmann::json::parse(job.body, nullptr, false);
            if (jobBody.is_discarded()) jobBody = nullptr;
        }

        connected_ = true;
        ingest(PrusaLinkStatusParser::parseLegacy(printerBody, jobBody));
        return true;
    }

    Result PrusaLinkAdapter::jobCommand(const std::string &method, const std::string &suffix) {
        if (!connected_) {
            return Result::notConnected();
        }
        std::string jobId = getStatus().deviceJobId;
        if (jobId.empty()) {
            return Result::error("No active job on the printer");
        }

        auto response = request(method, "/api/v1/job/" + jobId + suffix);
        if (response.transportFailed()) {
            return Result::error("Request failed: " + response.error);
        }
        if (response.status == 409) {
            return Result::error("Printer is not in a state that allows this command");
        }
        if (!response.ok()) {
            return Result::error("HTTP " + std::to_string(response.status));
        }
        return Result::success();
    }

    Result PrusaLinkAdapter::pause() {
        return jobCommand("PUT", "/pause");
    }

    Result PrusaLinkAdapter::resume() {
        return jobCommand("PUT", "/resume");
    }

    Result PrusaLinkAdapter::cancel() {
        return jobCommand("DELETE", "");
    }

    Result PrusaLinkAdapter::setTemperature(core::printer::Heater, double) {
        return Result::unsupported("PrusaLink does not expose heater control");
    }

} // namespace connector::adapters::prusalink
