#include <edi/net/http_transport.h>
#include <edi/net/curl_utils.h>
#include <curl/curl.h>
#include <memory>

namespace edi {
namespace net {

namespace {

// Keeps the reason phrase of the last status line seen. Interim responses
// (100 Continue) and redirects reset it, so the final one wins.
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, std::string* reason) {
    size_t total_size = size * nitems;
    std::string line(buffer, total_size);
    if (line.rfind("HTTP/", 0) == 0) {
        // "HTTP/1.1 401 Unauthorized\r\n" -> "Unauthorized"
        size_t code_start = line.find(' ');
        size_t reason_start = (code_start == std::string::npos) ? std::string::npos : line.find(' ', code_start + 1);
        reason->clear();
        if (reason_start != std::string::npos) {
            *reason = line.substr(reason_start + 1);
            while (!reason->empty() && (reason->back() == '\r' || reason->back() == '\n' || reason->back() == ' ')) {
                reason->pop_back();
            }
        }
    }
    return total_size;
}

} // namespace

HttpResponse CurlHttpTransport::post(const std::string& url,
                                     const std::vector<std::string>& headers,
                                     const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize CURL");
    }
    auto curl_guard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>{curl, curl_easy_cleanup};

    struct curl_slist* header_list = nullptr;
    auto headers_guard = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>{nullptr, curl_slist_free_all};
    for (const auto& header : headers) {
        struct curl_slist* appended = curl_slist_append(header_list, header.c_str());
        if (!appended) {
            curl_slist_free_all(header_list);
            throw TransportError("Failed to build request headers");
        }
        header_list = appended;
    }
    headers_guard.reset(header_list);

    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.reason);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::string message = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(res));
        throw TransportError("Request to " + url + " failed: " + message);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    if (response.reason.empty()) {
        response.reason = standardReasonPhrase(response.status);
    }
    return response;
}

std::string standardReasonPhrase(long status) {
    switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 402: return "Payment Required";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "";
    }
}

} // namespace net
} // namespace edi
