#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace edi {
namespace net {

struct HttpResponse {
    long status = 0;
    std::string reason; // Reason phrase of the final status line
    std::string body;
};

// Raised when no complete HTTP response could be obtained (DNS, TLS,
// connection refused or reset, ...).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Seam between the completion client and the network. The production
 * implementation is CurlHttpTransport; tests substitute a scripted one.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Issues one blocking POST and returns the full response.
    // Throws TransportError on any transport-level failure; HTTP error
    // statuses are returned, not thrown.
    virtual HttpResponse post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body) = 0;
};

// libcurl-backed transport. Each call uses a fresh easy handle.
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport() = default;

    HttpResponse post(const std::string& url,
                      const std::vector<std::string>& headers,
                      const std::string& body) override;
};

// Standard reason phrase for `status`, or an empty string when unknown.
std::string standardReasonPhrase(long status);

} // namespace net
} // namespace edi
