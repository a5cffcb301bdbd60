#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace Qalla {

    // Env-gated trace file (QALLA_TRACE=1). Lines are "HH:MM:SS [TRACE] step=...";
    // events tied to one connection carry its id: "HH:MM:SS [TRACE] [<id>] step=...".
    struct RelayTrace {
        static void init(const std::string& path = "relay_trace.log");
        static void log(const std::string& msg);
        static void log(const std::string& connectionId, const std::string& msg);

        static std::string FormatLine(const std::string& clock, const std::string& connectionId,
            const std::string& msg);

    private:
        static void Write(const std::string& connectionId, const std::string& msg);

        static std::ofstream s_file;
        static std::mutex s_mutex;
        static bool s_enabled;
    };

} // namespace Qalla
