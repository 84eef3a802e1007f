#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <vector>

namespace Depfetch {

class Config;

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value" lines
};

/**
 * @brief A completed HTTP exchange. The body is the raw, still-encoded
 *        payload exactly as received.
 */
struct HttpResponse {
    long        status = 0;
    std::string body;
};

/**
 * @class HttpClient
 * @brief Issues blocking GET requests.
 *
 * Implementations must allow concurrent calls from several threads.
 */
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Performs a GET request and returns the response, whatever its
     *        status.
     *
     * @throws FetchError if no response could be obtained at all.
     */
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

/**
 * @class CurlHttpClient
 * @brief HttpClient backed by libcurl's easy interface, one handle per
 *        request.
 */
class CurlHttpClient : public HttpClient
{
public:
    explicit CurlHttpClient(const Config& config);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const HttpRequest& request) override;

private:
    std::string userAgent_;
    long        connectTimeout_;
    long        timeout_;
};

} // namespace Depfetch

#endif // HTTP_CLIENT_HPP
