#include "config/config_loader.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"
#include "security/encryption_manager.hpp"
#include "stream/stream_decoder.hpp"
#include "stream/stream_encoder.hpp"
#include "stream/stream_key.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace vaultstream;

namespace {

constexpr const char* kSecretEnv = "VAULTSTREAM_STREAM_SECRET";

void print_usage() {
    std::cerr <<
        "Usage: vaultstream [-c config.toml] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  encrypt-file <path>          write <path>.enc\n"
        "  decrypt-file <path>          strip .enc (or append .dec)\n"
        "  rotate                       add a new primary key, re-encrypt configured dirs\n"
        "  reencrypt <dir> [pattern]    re-seal matching files under the primary key\n"
        "  stream <conversation-id>     stdin lines -> encrypted NDJSON on stdout\n"
        "  decode-stream <conversation-id>  encrypted NDJSON on stdin -> plaintext\n"
        "\n"
        "The stream commands read a base64 shared secret from " << kSecretEnv << ".\n";
}

std::optional<VaultConfig> load_config(const std::string& path, bool explicit_path) {
    std::error_code ec;
    if (!explicit_path && !std::filesystem::exists(path, ec)) {
        utils::log::debug(std::format("No config at {}, using defaults", path));
        return VaultConfig{};
    }

    auto result = ConfigLoader::load_from_file(path);
    if (!result.success) {
        utils::log::error(result.error_message);
        return std::nullopt;
    }
    return result.config;
}

std::optional<std::vector<uint8_t>> stream_secret() {
    const char* value = std::getenv(kSecretEnv);
    if (!value || !*value) {
        utils::log::error(std::format("{} is not set", kSecretEnv));
        return std::nullopt;
    }
    auto secret = base64::decode(utils::trim(value));
    if (!secret || secret->empty()) {
        utils::log::error(std::format("{} is not valid base64", kSecretEnv));
        return std::nullopt;
    }
    return secret;
}

/**
 * Line reader over a raw descriptor. Reading with poll(2) instead of
 * std::getline lets the stream wake up for its flush timer while stdin
 * is quiet.
 */
class StdinLines {
public:
    explicit StdinLines(int fd) : fd_(fd) {}

    /// Next line with its newline kept; IDLE when nothing completes within wait
    stream::SourceEvent next(std::optional<std::chrono::milliseconds> wait) {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (wait) deadline = std::chrono::steady_clock::now() + *wait;
        for (;;) {
            if (const auto nl = pending_.find('\n'); nl != std::string::npos) {
                std::string line = pending_.substr(0, nl + 1);
                pending_.erase(0, nl + 1);
                return stream::SourceEvent::fragment(std::move(line));
            }
            if (eof_) {
                if (pending_.empty()) return stream::SourceEvent::end();
                return stream::SourceEvent::fragment(std::exchange(pending_, {}));
            }

            int timeout_ms = -1;
            if (deadline) {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    *deadline - std::chrono::steady_clock::now());
                timeout_ms = static_cast<int>(std::max<int64_t>(0, left.count()));
            }
            pollfd pfd{fd_, POLLIN, 0};
            const int ready = ::poll(&pfd, 1, timeout_ms);
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::format("poll on stdin failed: {}",
                    std::error_code(errno, std::generic_category()).message()));
            }
            if (ready == 0) {
                return stream::SourceEvent::idle();
            }

            char chunk[4096];
            const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw std::runtime_error(std::format("read from stdin failed: {}",
                    std::error_code(errno, std::generic_category()).message()));
            }
            if (n == 0) {
                eof_ = true;
            } else {
                pending_.append(chunk, static_cast<size_t>(n));
            }
        }
    }

private:
    int fd_;
    std::string pending_;
    bool eof_ = false;
};

int run_stream(const std::string& conversation_id, const VaultConfig& config) {
    auto secret = stream_secret();
    if (!secret) return 1;

    stream::StreamEncoder encoder(conversation_id,
                                  stream::derive_stream_key(*secret, conversation_id),
                                  to_batching_config(config.stream));

    // Each stdin line is one fragment; the newline is kept unless input ended without one
    StdinLines input(STDIN_FILENO);
    stream::EncryptedStream packets(encoder, [&input](std::optional<std::chrono::milliseconds> wait) {
        return input.next(wait);
    });

    while (auto line = packets.next()) {
        std::cout << *line << std::flush;
    }
    utils::log::info(std::format("Stream {} finished after {} packets",
                                 conversation_id, encoder.last_seq()));
    return 0;
}

int run_decode_stream(const std::string& conversation_id) {
    auto secret = stream_secret();
    if (!secret) return 1;

    stream::StreamDecoder decoder(conversation_id,
                                  stream::derive_stream_key(*secret, conversation_id));
    int status = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        auto decoded = decoder.decode_line(line);
        if (decoded.is_error()) {
            utils::log::warn(decoded.error_message());
            status = 1;
            continue;
        }
        if (decoded.value().kind == stream::DecodedLine::Kind::TEXT) {
            std::cout << decoded.value().text << std::flush;
        }
    }
    return status;
}

template<typename T>
int report(const Result<T>& result) {
    if (result.is_error()) {
        utils::log::error(std::format("{} error: {}",
            error_category_name(result.error_category()), result.error_message()));
        return 1;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = ConfigLoader::kDefaultPath;
        bool explicit_config = false;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
                explicit_config = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else {
                args.push_back(arg);
            }
        }
        if (args.empty()) {
            print_usage();
            return 1;
        }

        auto config = load_config(config_file, explicit_config);
        if (!config) return 1;
        if (auto level = utils::log::parse_level(config->logging.level)) {
            utils::log::set_level(*level);
        }

        const std::string& command = args[0];

        if (command == "stream" || command == "decode-stream") {
            if (args.size() != 2) {
                print_usage();
                return 1;
            }
            return command == "stream" ? run_stream(args[1], *config)
                                       : run_decode_stream(args[1]);
        }

        EncryptionManager manager(to_manager_config(config->encryption));

        if (command == "encrypt-file" && args.size() == 2) {
            auto out = manager.encrypt_file(args[1]);
            if (out.is_ok()) std::cout << out.value().string() << "\n";
            return report(out);
        }
        if (command == "decrypt-file" && args.size() == 2) {
            auto out = manager.decrypt_file(args[1]);
            if (out.is_ok()) std::cout << out.value().string() << "\n";
            return report(out);
        }
        if (command == "rotate" && args.size() == 1) {
            auto rotated = manager.rotate_keys(static_cast<size_t>(config->encryption.max_keys));
            if (rotated.is_ok()) std::cout << std::format("{} keys\n", rotated.value());
            return report(rotated);
        }
        if (command == "reencrypt" && (args.size() == 2 || args.size() == 3)) {
            const std::string pattern =
                args.size() == 3 ? args[2] : config->encryption.reencrypt_pattern;
            const auto [success, total] = manager.reencrypt_directory(args[1], pattern);
            std::cout << std::format("{}/{}\n", success, total);
            return success == total ? 0 : 1;
        }

        print_usage();
        return 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
