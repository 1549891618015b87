/**
 * @file http_client.cpp
 * @brief libcurl implementation of HttpClient.
 */

#include "sources/http_client.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdio>
#include <memory>
#include <mutex>
#include <utility>

namespace fundscope
{
    namespace sources
    {

        namespace
        {

            size_t write_callback(void *ptr, size_t size, size_t nmemb, std::string *data)
            {
                data->append(static_cast<char *>(ptr), size * nmemb);
                return size * nmemb;
            }

            void ensure_global_init()
            {
                static std::once_flag flag;
                std::call_once(flag, []
                               {
                                   CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
                                   if (rc != CURLE_OK)
                                   {
                                       throw HttpError(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
                                   } });
            }

            struct CurlDeleter
            {
                void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
            };

            struct SlistDeleter
            {
                void operator()(curl_slist *list) const { curl_slist_free_all(list); }
            };

        } // anonymous namespace

        CurlHttpClient::CurlHttpClient(long timeout_seconds, std::string user_agent)
            : timeout_seconds_(timeout_seconds), user_agent_(std::move(user_agent))
        {
            ensure_global_init();
        }

        HttpResponse CurlHttpClient::get(const std::string &url,
                                         const std::map<std::string, std::string> &headers)
        {
            std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
            if (!curl)
            {
                throw HttpError("curl_easy_init failed");
            }

            std::unique_ptr<curl_slist, SlistDeleter> header_list;
            for (const auto &[name, value] : headers)
            {
                std::string line = name + ": " + value;
                curl_slist *appended = curl_slist_append(header_list.get(), line.c_str());
                if (appended == nullptr)
                {
                    throw HttpError("Could not build request headers");
                }
                header_list.release();
                header_list.reset(appended);
            }

            HttpResponse response;
            curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
            if (header_list)
            {
                curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
            }

            CURLcode rc = curl_easy_perform(curl.get());
            if (rc != CURLE_OK)
            {
                throw HttpError("GET " + url + " failed: " + curl_easy_strerror(rc));
            }

            rc = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
            if (rc != CURLE_OK)
            {
                throw HttpError("GET " + url + ": no response code: " + curl_easy_strerror(rc));
            }
            return response;
        }

        std::string url_encode(const std::string &value)
        {
            std::string out;
            out.reserve(value.size() * 3);
            for (unsigned char c : value)
            {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                {
                    out.push_back(static_cast<char>(c));
                }
                else
                {
                    char buf[4];
                    std::snprintf(buf, sizeof(buf), "%%%02X", c);
                    out += buf;
                }
            }
            return out;
        }

    } // namespace sources
} // namespace fundscope
