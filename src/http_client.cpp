#include "http_client.hpp"

#include <curl/curl.h>

#include "errors.hpp"

namespace {

struct Transfer {
    CURL* curl{nullptr};
    const TurnToken* token{nullptr};
    const HttpBodySink* sink{nullptr};
    HttpResponse response;
    bool head_read{false};
};

void read_head(Transfer& t) {
    if (t.head_read) return;
    t.head_read = true;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &t.response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(t.curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        t.response.content_type = content_type;
    }
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t total = size * nmemb;
    if (t->token && t->token->cancelled()) return 0;

    read_head(*t);
    if (!t->sink || !t->response.ok()) {
        t->response.body.append(ptr, total);
        return total;
    }
    return (*t->sink)(ptr, total, t->response) ? total : 0;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userdata);
    return (t->token && t->token->cancelled()) ? 1 : 0;
}

} // namespace

struct HttpClient::Impl {
    CURL* curl{nullptr};
};

HttpClient::HttpClient() : impl_(new Impl) {
    impl_->curl = curl_easy_init();
    if (!impl_->curl) {
        delete impl_;
        throw BackendError("curl_easy_init failed");
    }
}

HttpClient::~HttpClient() {
    curl_easy_cleanup(impl_->curl);
    delete impl_;
}

void HttpClient::global_init() { curl_global_init(CURL_GLOBAL_DEFAULT); }

void HttpClient::global_cleanup() { curl_global_cleanup(); }

HttpResponse HttpClient::post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body,
                              const TurnToken* token,
                              const HttpBodySink& on_data) {
    CURL* curl = impl_->curl;
    curl_easy_reset(curl);

    Transfer t;
    t.curl = curl;
    t.token = token;
    t.sink = on_data ? &on_data : nullptr;

    struct curl_slist* list = nullptr;
    for (const auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    // Timeouts from several worker threads: no SIGALRM-based resolver timeouts.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "parley/1.0");

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(list);

    if (token && token->cancelled()) {
        throw CancellationError();
    }
    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && t.head_read)) {
        throw BackendError(std::string("curl request failed: ") + curl_easy_strerror(res));
    }
    read_head(t);
    return t.response;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) {
    CURL* curl = impl_->curl;
    curl_easy_reset(curl);

    Transfer t;
    t.curl = curl;

    struct curl_slist* list = nullptr;
    for (const auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "parley/1.0");

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(list);

    if (res != CURLE_OK) {
        throw BackendError(std::string("curl request failed: ") + curl_easy_strerror(res));
    }
    read_head(t);
    return t.response;
}
