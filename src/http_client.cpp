#include "http_client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <curl/curl.h>
#include <memory>
#include <stdexcept>

namespace Depfetch {

namespace {

    /**
     * @brief libcurl write callback. Appends received bytes to a std::string
     *        without interpreting them.
     */
    size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
    {
        size_t totalSize      = size * nmemb;
        std::string* response = static_cast<std::string*>(userp);

        try {
            response->append(static_cast<char*>(contents), totalSize);
        } catch (const std::exception& e) {
            log_error(std::string("Error appending data to response: ") + e.what());
            return 0; // Signal failure to libcurl
        }

        return totalSize;
    }

    using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using HeaderList = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>;

} // end anonymous namespace

CurlHttpClient::CurlHttpClient(const Config& config)
    : userAgent_(config.userAgent),
      connectTimeout_(config.connectTimeout),
      timeout_(config.timeout)
{
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("Failed to initialize libcurl: ")
                                 + curl_easy_strerror(rc));
    }
}

CurlHttpClient::~CurlHttpClient()
{
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const HttpRequest& request)
{
    const std::string target = stripScheme(request.url);

    EasyHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw FetchError(target, "failed to initialize curl handle");
    }

    HeaderList headers(nullptr, &curl_slist_free_all);
    for (const auto& header : request.headers) {
        struct curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (!appended) {
            throw FetchError(target, "failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connectTimeout_);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw FetchError(target, curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace Depfetch
