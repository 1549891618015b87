/**
 * @file http_client.hpp
 * @brief Minimal HTTP GET transport used by the data sources.
 *
 * Sources only talk to HttpClient, so tests can substitute canned
 * responses. CurlHttpClient is the production transport.
 */

#ifndef FUNDSCOPE_SOURCES_HTTP_CLIENT_HPP
#define FUNDSCOPE_SOURCES_HTTP_CLIENT_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace fundscope
{
    namespace sources
    {

        /**
         * @class HttpError
         * @brief Transport failure (DNS, TLS, timeout, ...).
         */
        class HttpError : public std::runtime_error
        {
        public:
            explicit HttpError(const std::string &msg)
                : std::runtime_error(msg)
            {
            }
        };

        /**
         * @struct HttpResponse
         * @brief Status code and body of a completed request.
         */
        struct HttpResponse
        {
            long status = 0;
            std::string body;

            bool ok() const { return status >= 200 && status < 300; }
        };

        /**
         * @class HttpClient
         * @brief Abstract GET transport.
         */
        class HttpClient
        {
        public:
            virtual ~HttpClient() = default;

            /**
             * @brief Perform a GET request.
             * @param url Fully encoded URL.
             * @param headers Extra request headers.
             * @return The response, whatever its status code.
             * @throws HttpError if no response was received.
             */
            virtual HttpResponse get(const std::string &url,
                                     const std::map<std::string, std::string> &headers = {}) = 0;
        };

        /**
         * @class CurlHttpClient
         * @brief libcurl easy-interface transport.
         *
         * curl_global_init() is called once per process on first construction.
         */
        class CurlHttpClient : public HttpClient
        {
        public:
            /**
             * @param timeout_seconds Whole-request timeout.
             * @param user_agent User-Agent header value.
             */
            explicit CurlHttpClient(long timeout_seconds = 15,
                                    std::string user_agent = "Mozilla/5.0 (X11; Linux x86_64) fundscope/1.0");

            HttpResponse get(const std::string &url,
                             const std::map<std::string, std::string> &headers = {}) override;

        private:
            long timeout_seconds_;
            std::string user_agent_;
        };

        /**
         * @brief Percent-encode a query parameter value (RFC 3986 unreserved set kept).
         */
        std::string url_encode(const std::string &value);

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_HTTP_CLIENT_HPP
