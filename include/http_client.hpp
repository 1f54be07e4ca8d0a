#pragma once

#include <functional>
#include <string>
#include <vector>

#include "turn_token.hpp"

struct HttpResponse {
    long status = 0;
    std::string content_type;
    std::string body; // collected for non-success responses and for non-streaming calls

    bool ok() const { return status >= 200 && status < 300; }
};

// Called with each slice of a success response body; returning false aborts the transfer.
using HttpBodySink = std::function<bool(const char* data, std::size_t len, const HttpResponse& head)>;

// Thin libcurl easy-handle wrapper. One instance per thread.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Streams a POST. Transport failures throw BackendError; a token that
    // fires mid-transfer throws CancellationError.
    HttpResponse post(const std::string& url,
                      const std::vector<std::string>& headers,
                      const std::string& body,
                      const TurnToken* token,
                      const HttpBodySink& on_data);

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers);

    static void global_init();
    static void global_cleanup();

private:
    struct Impl;
    Impl* impl_;
};
