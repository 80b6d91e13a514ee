#include "connector/client/HttpClient.hpp"
#include "logger/Logger.hpp"
#include <curl/curl.h>

namespace connector {

    class HttpClientCurl : public HttpClient {
    public:
        HttpResponse perform(const HttpRequest &request) override {
            HttpResponse response;

            CURL *curl = curl_easy_init();
            if (!curl) {
                response.error = "Failed to initialize CURL";
                Logger::logError("[HttpClient] " + response.error);
                return response;
            }

            struct curl_slist *headerList = nullptr;
            for (const auto &[name, value]: request.headers) {
                std::string line = name + ": " + value;
                headerList = curl_slist_append(headerList, line.c_str());
            }

            curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.timeoutMs);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
            curl_easy_setopt(curl, CURLOPT_USERAGENT, "PrintFleet/1.0");
            if (headerList) {
                curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
            }

            if (request.method == "POST") {
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            } else if (request.method != "GET") {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
                if (!request.body.empty()) {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
                }
            }

            if (!request.digestUser.empty()) {
                curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_DIGEST);
                curl_easy_setopt(curl, CURLOPT_USERNAME, request.digestUser.c_str());
                curl_easy_setopt(curl, CURLOPT_PASSWORD, request.digestPassword.c_str());
            }

            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                response.error = curl_easy_strerror(res);
                Logger::logDebug("[HttpClient] " + request.method + " " + request.url + " failed: " + response.error);
            } else {
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
            }

            if (headerList) {
                curl_slist_free_all(headerList);
            }
            curl_easy_cleanup(curl);
            return response;
        }

    private:
        static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
            auto *body = static_cast<std::string *>(userp);
            size_t totalSize = size * nmemb;
            body->append(static_cast<char *>(contents), totalSize);
            return totalSize;
        }
    };

    std::shared_ptr<HttpClient> createHttpClient() {
        return std::make_shared<HttpClientCurl>();
    }

} // namespace connector
