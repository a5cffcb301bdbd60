#pragma once
#include "Protocol.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace Qalla {

    // ---------------------------------------------------------------------------
    // Startup parameters. Defaults, then environment, then command line.
    // ---------------------------------------------------------------------------
    struct ServerConfig {
        enum class ParseResult {
            Run,
            Help,
            Error
        };

        uint16_t    port = SERVER_PORT;
        std::string inviteCode;                       // empty: no invite required
        std::string stickerDir = "uploads/stickers";
        size_t      maxStickerBytes = 2 * 1024 * 1024;
        int         idleTimeoutSec = 0;               // 0: no idle eviction
        unsigned    threads = 0;                      // 0: hardware_concurrency, capped at 16

        // PORT, INVITE_CODE, STICKER_DIR, IDLE_TIMEOUT_SEC.
        void LoadFromEnv();

        // --port, --invite, --sticker-dir, --idle-timeout, --threads, --help.
        ParseResult ParseCommandLine(int argc, char* argv[]);

        unsigned EffectiveThreads() const;

        // True when a connection silent for idleMs should be evicted.
        bool IsIdleExpired(int64_t idleMs) const;

        static std::string Usage(const char* program);
        void PrintSummary() const;
    };

} // namespace Qalla
