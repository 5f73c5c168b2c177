#pragma once
#include <string>
#include <utility>
#include <vector>

namespace status {

    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    struct HttpResponse {
        int statusCode{0};
        std::string body;
    };

    class HttpClient {
    public:
        HttpClient() = default;
        HttpClient(const HttpClient &) = delete;
        HttpClient(HttpClient &&) = delete;
        HttpClient &operator=(const HttpClient &) = delete;
        HttpClient &operator=(HttpClient &&) = delete;
        virtual ~HttpClient() = default;

        /**
         * Blocking POST.
         * @throws errors::StatusReportError if the request could not be completed
         */
        virtual HttpResponse post(
            const std::string &url, const HttpHeaders &headers, const std::string &body) = 0;
    };

    /**
     * HTTP(S) client on the AWS common runtime. Requires a live Aws::Crt::ApiHandle.
     */
    class CrtHttpClient : public HttpClient {
    public:
        HttpResponse post(
            const std::string &url, const HttpHeaders &headers, const std::string &body) override;
    };
} // namespace status
