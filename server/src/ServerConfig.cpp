#include "ServerConfig.h"
#include "Sanitizer.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <thread>

namespace Qalla {

    namespace {

        constexpr unsigned kMaxThreads = 16u;

        bool ParseLong(const char* text, long minValue, long maxValue, long& out) {
            if (!text || !*text) return false;
            errno = 0;
            char* end = nullptr;
            const long v = std::strtol(text, &end, 10);
            if (errno != 0 || end == text || *end != '\0') return false;
            if (v < minValue || v > maxValue) return false;
            out = v;
            return true;
        }

        void ApplyPort(const char* text, const char* source, uint16_t& port) {
            long v = 0;
            if (ParseLong(text, 1, 65535, v)) port = static_cast<uint16_t>(v);
            else std::fprintf(stderr, "[Qalla Server] Invalid port '%s' from %s, using %u\n",
                text, source, static_cast<unsigned>(port));
        }

        void ApplyIdleTimeout(const char* text, const char* source, int& seconds) {
            long v = 0;
            if (ParseLong(text, 0, INT_MAX, v)) seconds = static_cast<int>(v);
            else std::fprintf(stderr, "[Qalla Server] Invalid idle timeout '%s' from %s, using %d\n",
                text, source, seconds);
        }

    } // namespace

    void ServerConfig::LoadFromEnv() {
        if (const char* e = std::getenv("PORT"))
            ApplyPort(e, "PORT", port);
        if (const char* e = std::getenv("INVITE_CODE"))
            inviteCode = ClampString(std::string(e), SIZE_MAX);
        if (const char* e = std::getenv("STICKER_DIR")) {
            if (*e) stickerDir = e;
        }
        if (const char* e = std::getenv("IDLE_TIMEOUT_SEC"))
            ApplyIdleTimeout(e, "IDLE_TIMEOUT_SEC", idleTimeoutSec);
    }

    ServerConfig::ParseResult ServerConfig::ParseCommandLine(int argc, char* argv[]) {
        static struct option long_options[] = {
            {"help",         no_argument,       0, 'h'},
            {"port",         required_argument, 0, 'p'},
            {"invite",       required_argument, 0, 'i'},
            {"sticker-dir",  required_argument, 0, 's'},
            {"idle-timeout", required_argument, 0, 't'},
            {"threads",      required_argument, 0, 'j'},
            {0, 0, 0, 0}
        };

        // Reset getopt so the parser can run more than once per process.
        optind = 0;
        opterr = 1;

        int option_index = 0;
        int c;
        while ((c = getopt_long(argc, argv, "hp:i:s:t:j:", long_options, &option_index)) != -1) {
            switch (c) {
            case 'h':
                return ParseResult::Help;
            case 'p':
                ApplyPort(optarg, "--port", port);
                break;
            case 'i':
                inviteCode = ClampString(std::string(optarg), SIZE_MAX);
                break;
            case 's':
                if (*optarg) stickerDir = optarg;
                break;
            case 't':
                ApplyIdleTimeout(optarg, "--idle-timeout", idleTimeoutSec);
                break;
            case 'j': {
                long v = 0;
                if (ParseLong(optarg, 1, kMaxThreads, v)) threads = static_cast<unsigned>(v);
                else std::fprintf(stderr, "[Qalla Server] Invalid thread count '%s', ignoring\n", optarg);
                break;
            }
            default:
                // getopt_long already printed the reason.
                return ParseResult::Error;
            }
        }
        return ParseResult::Run;
    }

    unsigned ServerConfig::EffectiveThreads() const {
        unsigned n = threads;
        if (n == 0) n = std::thread::hardware_concurrency();
        if (n == 0) n = 4;
        return std::min(n, kMaxThreads);
    }

    bool ServerConfig::IsIdleExpired(int64_t idleMs) const {
        if (idleTimeoutSec <= 0) return false;
        return idleMs / 1000 > idleTimeoutSec;
    }

    std::string ServerConfig::Usage(const char* program) {
        std::string out = "Usage: ";
        out += program ? program : "qalla_server";
        out += " [options]\n"
            "  -p, --port N            TCP port (env PORT, default 3000)\n"
            "  -i, --invite CODE       require this invite code (env INVITE_CODE)\n"
            "  -s, --sticker-dir DIR   sticker upload directory (env STICKER_DIR)\n"
            "  -t, --idle-timeout SEC  close idle connections, default 0 = off (env IDLE_TIMEOUT_SEC)\n"
            "  -j, --threads N         I/O threads, 1-16\n"
            "  -h, --help              show this help\n";
        return out;
    }

    void ServerConfig::PrintSummary() const {
        std::fprintf(stderr, "\n=== Qalla Relay Server ===\n");
        std::fprintf(stderr, "Port:          %u\n", static_cast<unsigned>(port));
        std::fprintf(stderr, "Invite-only:   %s\n", inviteCode.empty() ? "no" : "yes");
        std::fprintf(stderr, "Stickers:      %s (max %zu bytes)\n", stickerDir.c_str(), maxStickerBytes);
        if (idleTimeoutSec > 0) std::fprintf(stderr, "Idle timeout:  %d s\n", idleTimeoutSec);
        else std::fprintf(stderr, "Idle timeout:  off\n");
        std::fprintf(stderr, "I/O threads:   %u\n\n", EffectiveThreads());
    }

} // namespace Qalla
