#include "audio_capture.hpp"
#include "audio_playback.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "deepgram_channel.hpp"
#include "elevenlabs_synthesis.hpp"
#include "errors.hpp"
#include "http_chat_backend.hpp"
#include "http_client.hpp"
#include "utils.hpp"
#include "vosk_channel.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace {
volatile std::sig_atomic_t g_running = 1;

void handle_sigint(int) {
    g_running = 0;
}

// Prints the conversation log as it grows, streaming assistant text.
class TranscriptPrinter {
public:
    void update(const std::vector<Message>& messages) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages.size() < count_) {
            count_ = 0;
            chars_ = 0;
            std::cout << "\n--- conversation reset ---\n";
        }
        // Finish the message being streamed, then print any new ones.
        if (count_ > 0 && count_ <= messages.size()) {
            const auto& last = messages[count_ - 1];
            if (last.content.size() > chars_) {
                std::cout << last.content.substr(chars_) << std::flush;
                chars_ = last.content.size();
            }
        }
        while (count_ < messages.size()) {
            if (count_ > 0) std::cout << "\n";
            const auto& m = messages[count_];
            std::cout << (m.role == Role::User ? "[You] " : "[Tutor] ") << m.content << std::flush;
            chars_ = m.content.size();
            count_++;
        }
    }

private:
    std::mutex mutex_;
    std::size_t count_{0};
    std::size_t chars_{0};
};

void print_profile(const LearnerProfile& p) {
    std::cout << "\n=== Learner profile ===\n"
              << "Subject:        " << p.subject << "\n"
              << "Reason:         " << p.reason << "\n"
              << "Starting level: " << p.starting_level << "\n"
              << "Depth:          " << p.depth << "\n"
              << "Focus areas:    " << join(p.focus_areas, ", ") << "\n"
              << "Skip areas:     " << join(p.skip_areas, ", ") << "\n"
              << "Context:        " << p.learner_context << "\n"
              << "Notes:          " << p.notes << "\n"
              << "Summary:        " << p.summary << "\n";
}

void save_profile(const LearnerProfile& p, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        log_error("Profile", "Cannot write " + path + ": " + std::strerror(errno));
        return;
    }
    out << encode_learner_profile(p) << "\n";
    log_info("Profile", "Saved to " + path);
}

std::unique_ptr<TranscriptionChannel> make_channel(const AppConfig& cfg) {
    if (cfg.transcriber == TranscriberKind::Vosk) {
        return std::make_unique<VoskChannel>(cfg.vosk);
    }
    return std::make_unique<DeepgramChannel>(cfg.deepgram);
}

void start(Conversation& conversation) {
    try {
        conversation.start_listening();
    } catch (const ConnectionError& e) {
        std::cerr << "Failed to start listening: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
    }
}

void print_help() {
    std::cout << "Commands: start, stop, mute, unmute, reset, quit\n";
}

// Returns false when the user asked to quit.
bool handle_command(const std::string& line, Conversation& conversation) {
    const std::string cmd = trim(line);
    if (cmd.empty()) return true;
    if (cmd == "quit" || cmd == "exit") return false;

    if (cmd == "start") {
        start(conversation);
    } else if (cmd == "stop") {
        conversation.stop_listening();
    } else if (cmd == "mute") {
        conversation.set_muted(true);
    } else if (cmd == "unmute") {
        conversation.set_muted(false);
    } else if (cmd == "reset") {
        conversation.reset();
    } else {
        print_help();
    }
    return true;
}
} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--list-devices") == 0) {
            std::cout << "Listing input devices...\n";
            AudioCapture::list_devices();
            return 0;
        }
        std::cerr << "Usage: " << argv[0] << " [--list-devices]\n";
        return 2;
    }

    std::signal(SIGINT, handle_sigint);

    AppConfig cfg;
    try {
        cfg = AppConfig::from_env();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    HttpClient::global_init();

    AudioPlayback speaker(cfg.playback_device);
    try {
        speaker.open();
    } catch (const std::exception& e) {
        std::cerr << "Failed to open audio playback: " << e.what() << "\n";
        HttpClient::global_cleanup();
        return 1;
    }

    AudioCapture microphone(cfg.capture);
    std::unique_ptr<TranscriptionChannel> channel = make_channel(cfg);
    HttpChatBackend chat(cfg.chat_url);
    ElevenLabsSynthesis synthesis(cfg.synthesis);

    {
        Conversation conversation(speaker, synthesis, chat, *channel, microphone, cfg.conversation);

        TranscriptPrinter printer;
        conversation.set_transcript_listener([&printer](const std::vector<Message>& messages) {
            printer.update(messages);
        });
        conversation.set_status_listener([](const std::string& text) {
            log_info("Status", text);
        });
        conversation.set_preview_listener([](const std::string& text) {
            if (!text.empty()) log_info("Hearing", text);
        });
        const std::string profile_path = cfg.profile_path;
        conversation.set_completion_listener([profile_path](const std::optional<LearnerProfile>& profile) {
            if (!profile) return;
            print_profile(*profile);
            if (!profile_path.empty()) save_profile(*profile, profile_path);
        });

        print_help();
        start(conversation);

        std::cout << "\nRunning... Press Ctrl+C to quit.\n";
        std::string line;
        while (g_running) {
            struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 200);
            if (ready < 0) {
                if (errno == EINTR) continue;
                log_error("Main", std::string("poll: ") + std::strerror(errno));
                break;
            }
            if (ready == 0) continue;
            if (!std::getline(std::cin, line)) break;
            if (!handle_command(line, conversation)) break;
        }

        conversation.shutdown();
    }

    speaker.close();
    HttpClient::global_cleanup();
    std::cout << "Exiting.\n";
    return 0;
}
