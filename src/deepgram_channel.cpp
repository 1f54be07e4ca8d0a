#include "deepgram_channel.hpp"

#include <libwebsockets.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "http_client.hpp"
#include "utils.hpp"

using json = nlohmann::json;

std::optional<TranscriptEvent> decode_deepgram_message(const std::string& msg) {
    auto j = json::parse(msg, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        log_error("Deepgram", "Bad JSON: " + preview(msg));
        return std::nullopt;
    }

    const std::string type = j.value("type", std::string());
    if (type == "UtteranceEnd") {
        return TranscriptEvent{TranscriptEvent::Kind::UtteranceEnd, {}};
    }
    if (type == "Error") {
        return TranscriptEvent{TranscriptEvent::Kind::Error, j.value("description", j.dump())};
    }

    // Results: channel.alternatives[0].transcript
    auto channel = j.find("channel");
    if (channel == j.end() || !channel->is_object()) return std::nullopt;
    auto alternatives = channel->find("alternatives");
    if (alternatives == channel->end() || !alternatives->is_array() || alternatives->empty()) {
        return std::nullopt;
    }
    std::string transcript = (*alternatives)[0].value("transcript", std::string());
    if (transcript.empty()) return std::nullopt;

    const bool is_final = j.value("is_final", false);
    return TranscriptEvent{is_final ? TranscriptEvent::Kind::Final : TranscriptEvent::Kind::Interim,
                           transcript};
}

std::string fetch_transcription_token(const DeepgramConfig& cfg) {
    if (cfg.token_url.empty()) {
        if (cfg.api_key.empty()) {
            throw ConnectionError("No transcription API key configured");
        }
        return cfg.api_key;
    }

    HttpResponse res;
    try {
        HttpClient http;
        res = http.get(cfg.token_url, {});
    } catch (const BackendError& e) {
        throw ConnectionError(std::string("Token request failed: ") + e.what());
    }
    if (!res.ok()) {
        throw ConnectionError("Token request failed: " + std::to_string(res.status));
    }
    auto j = json::parse(res.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("token") || !j["token"].is_string()) {
        throw ConnectionError("Token response without a token");
    }
    return j["token"].get<std::string>();
}

struct DeepgramChannel::Impl {
    explicit Impl(DeepgramConfig c) : cfg(std::move(c)) {}

    static int callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len);
    static struct lws_protocols protocols[];

    void service_loop();
    void deliver(const TranscriptEvent& event);
    void add_auth_header(struct lws* wsi, void* in, size_t len);
    int write_next(struct lws* wsi);

    DeepgramConfig cfg;
    std::string token;
    std::string path;
    TranscriptHandler handler;

    struct lws_context* context{nullptr};
    struct lws* wsi{nullptr};
    std::thread service_thread;
    std::atomic<bool> stop{false};
    std::atomic<bool> silenced{false};

    std::mutex mutex;
    std::condition_variable cv;
    bool connected{false};
    bool failed{false};
    bool closing{false};
    std::string failure;

    struct Frame {
        std::vector<unsigned char> payload; // LWS_PRE bytes of headroom, then data
        bool binary;
    };
    std::deque<Frame> outbox;
    std::string rx;
};

struct lws_protocols DeepgramChannel::Impl::protocols[] = {
    {
        "deepgram",
        DeepgramChannel::Impl::callback,
        0,         // per-session data size
        64 * 1024, // receive buffer size
    },
    {nullptr, nullptr, 0, 0}
};

int DeepgramChannel::Impl::callback(struct lws* wsi, enum lws_callback_reasons reason, void*, void* in, size_t len) {
    struct lws_context* ctx = lws_get_context(wsi);
    auto* self = ctx ? static_cast<DeepgramChannel::Impl*>(lws_context_user(ctx)) : nullptr;
    if (!self) return 0;

    switch (reason) {
    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER:
        self->add_auth_header(wsi, in, len);
        break;

    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->connected = true;
        self->cv.notify_all();
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE:
        if (in && len > 0) {
            self->rx.append(static_cast<const char*>(in), len);
        }
        if (lws_is_final_fragment(wsi)) {
            std::string msg;
            msg.swap(self->rx);
            if (auto event = decode_deepgram_message(msg)) {
                self->deliver(*event);
            }
        }
        break;

    case LWS_CALLBACK_CLIENT_WRITEABLE:
        return self->write_next(wsi);

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        // Another thread queued a frame or asked to close.
        if (self->wsi) lws_callback_on_writable(self->wsi);
        break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        std::string reason_text = (in && len > 0) ? std::string(static_cast<const char*>(in), len)
                                                  : std::string("connection error");
        bool was_connected = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            was_connected = self->connected;
            self->failed = true;
            self->failure = reason_text;
            self->connected = false;
            self->wsi = nullptr;
            self->cv.notify_all();
        }
        if (was_connected) {
            self->deliver({TranscriptEvent::Kind::Error, reason_text});
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED: {
        bool local = false;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            local = self->closing;
            self->connected = false;
            self->wsi = nullptr;
            self->cv.notify_all();
        }
        if (!local) {
            self->deliver({TranscriptEvent::Kind::Closed, {}});
        }
        break;
    }

    default:
        break;
    }
    return 0;
}

void DeepgramChannel::Impl::add_auth_header(struct lws* wsi, void* in, size_t len) {
    auto** p = static_cast<unsigned char**>(in);
    unsigned char* end = (*p) + len;

    const std::string value = "Token " + token;
    if (lws_add_http_header_by_name(wsi,
                                    reinterpret_cast<const unsigned char*>("Authorization:"),
                                    reinterpret_cast<const unsigned char*>(value.c_str()),
                                    static_cast<int>(value.size()),
                                    p, end)) {
        log_error("Deepgram", "Failed to add Authorization header");
    }
}

int DeepgramChannel::Impl::write_next(struct lws* socket) {
    Frame frame;
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (outbox.empty()) {
            // Everything flushed: a local close can go ahead now.
            return closing ? -1 : 0;
        }
        frame = std::move(outbox.front());
        outbox.pop_front();
        more = !outbox.empty() || closing;
    }

    const size_t size = frame.payload.size() - LWS_PRE;
    int n = lws_write(socket, frame.payload.data() + LWS_PRE, size,
                      frame.binary ? LWS_WRITE_BINARY : LWS_WRITE_TEXT);
    if (n < static_cast<int>(size)) {
        log_error("Deepgram", "Short write on transcription socket");
        return -1;
    }
    if (more) lws_callback_on_writable(socket);
    return 0;
}

void DeepgramChannel::Impl::deliver(const TranscriptEvent& event) {
    if (silenced) return;
    if (handler) handler(event);
}

void DeepgramChannel::Impl::service_loop() {
    while (!stop) {
        lws_service(context, 50);
    }
}

DeepgramChannel::DeepgramChannel(DeepgramConfig cfg) : impl_(new Impl(std::move(cfg))) {}

DeepgramChannel::~DeepgramChannel() {
    close();
    delete impl_;
}

void DeepgramChannel::open(TranscriptHandler handler) {
    if (impl_->context) {
        throw ConnectionError("Transcription channel already open");
    }

    impl_->token = fetch_transcription_token(impl_->cfg);
    impl_->handler = std::move(handler);
    impl_->stop = false;
    impl_->silenced = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->connected = false;
        impl_->failed = false;
        impl_->closing = false;
        impl_->failure.clear();
        impl_->outbox.clear();
        impl_->rx.clear();
    }

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof info);
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = Impl::protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.client_ssl_ca_filepath = impl_->cfg.ca_path.c_str();
    info.user = impl_;

    impl_->context = lws_create_context(&info);
    if (!impl_->context) {
        throw ConnectionError("Failed to create lws context");
    }

    impl_->path = impl_->cfg.path;
    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof ccinfo);
    ccinfo.context = impl_->context;
    ccinfo.address = impl_->cfg.host.c_str();
    ccinfo.host = ccinfo.address;
    ccinfo.origin = ccinfo.address;
    ccinfo.port = impl_->cfg.port;
    ccinfo.path = impl_->path.c_str();
    ccinfo.protocol = Impl::protocols[0].name;
    ccinfo.ssl_connection = LCCSCF_USE_SSL;
    ccinfo.pwsi = &impl_->wsi;

    if (!lws_client_connect_via_info(&ccinfo)) {
        lws_context_destroy(impl_->context);
        impl_->context = nullptr;
        throw ConnectionError("Failed to connect to " + impl_->cfg.host);
    }

    impl_->service_thread = std::thread(&Impl::service_loop, impl_);

    std::unique_lock<std::mutex> lock(impl_->mutex);
    bool settled = impl_->cv.wait_for(lock, impl_->cfg.connect_timeout,
                                      [this] { return impl_->connected || impl_->failed; });
    const bool ok = settled && impl_->connected;
    const std::string failure = settled ? impl_->failure : std::string("connect timeout");
    lock.unlock();

    if (!ok) {
        close();
        throw ConnectionError("Transcription channel unavailable: " + failure);
    }
    log_info("Deepgram", "Connected to " + impl_->cfg.host);
}

void DeepgramChannel::send_audio(const int16_t* samples, std::size_t count) {
    const std::size_t bytes = count * sizeof(int16_t);
    Impl::Frame frame{std::vector<unsigned char>(LWS_PRE + bytes), true};
    std::memcpy(frame.payload.data() + LWS_PRE, samples, bytes);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->connected || impl_->closing) return;
        impl_->outbox.push_back(std::move(frame));
    }
    lws_cancel_service(impl_->context);
}

void DeepgramChannel::close() {
    if (!impl_->context) return;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->connected && !impl_->closing) {
            // Ask the service to flush its final results before the socket goes away.
            const std::string msg = R"({"type":"CloseStream"})";
            Impl::Frame frame{std::vector<unsigned char>(LWS_PRE + msg.size()), false};
            std::memcpy(frame.payload.data() + LWS_PRE, msg.data(), msg.size());
            impl_->outbox.push_back(std::move(frame));
        }
        impl_->closing = true;
    }
    // Handlers must not fire once close() returns.
    impl_->silenced = true;
    lws_cancel_service(impl_->context);

    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        impl_->cv.wait_for(lock, std::chrono::seconds(1), [this] { return impl_->wsi == nullptr; });
    }
    impl_->stop = true;
    lws_cancel_service(impl_->context);

    if (impl_->service_thread.joinable()) {
        impl_->service_thread.join();
    }
    lws_context_destroy(impl_->context);
    impl_->context = nullptr;
    impl_->wsi = nullptr;
    impl_->handler = nullptr;
    log_info("Deepgram", "Channel closed");
}
