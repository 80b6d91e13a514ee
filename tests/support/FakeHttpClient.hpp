#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "connector/client/HttpClient.hpp"

namespace fakes {

    /**
     * @brief Records every request and answers from a scripted list, 200 "{}" once it runs out
     */
    class FakeHttpClient : public connector::HttpClient {
    public:
        connector::HttpResponse perform(const connector::HttpRequest &request) override {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            if (responses_.empty()) {
                connector::HttpResponse ok;
                ok.status = 200;
                ok.body = "{}";
                return ok;
            }
            auto response = responses_.front();
            responses_.pop_front();
            return response;
        }

        void respond(long status, const std::string &body) {
            std::lock_guard lock(mutex_);
            connector::HttpResponse response;
            response.status = status;
            response.body = body;
            responses_.push_back(response);
        }

        void failTransport(const std::string &error) {
            std::lock_guard lock(mutex_);
            connector::HttpResponse response;
            response.error = error;
            responses_.push_back(response);
        }

        std::vector<connector::HttpRequest> requests() const {
            std::lock_guard lock(mutex_);
            return requests_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<connector::HttpRequest> requests_;
        std::deque<connector::HttpResponse> responses_;
    };

} // namespace fakes
