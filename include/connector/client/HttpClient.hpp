#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace connector {

    struct HttpRequest {
        std::string method = "GET";
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        long timeoutMs = 5000;

        // HTTP Digest credentials, used when digestUser is set
        std::string digestUser;
        std::string digestPassword;
    };

    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string error; // transport failure, empty when a response arrived

        bool transportFailed() const { return !error.empty(); }

        bool ok() const { return error.empty() && status >= 200 && status < 300; }
    };

    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        virtual HttpResponse perform(const HttpRequest &request) = 0;
    };

    std::shared_ptr<HttpClient> createHttpClient();
}
