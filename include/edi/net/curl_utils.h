#pragma once

#include <curl/curl.h>
#include <cstddef> // For size_t
#include <stdexcept>
#include <string>

namespace edi {
namespace net {

// Standard CURL write callback function to append data to a std::string
inline size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Process-wide libcurl initialization. Construct once in main before any
// easy handle is created; cleanup runs when it goes out of scope.
class CurlGlobalGuard {
public:
    CurlGlobalGuard() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }
    ~CurlGlobalGuard() { curl_global_cleanup(); }

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

} // namespace net
} // namespace edi
