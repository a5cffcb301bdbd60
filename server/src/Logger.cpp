#include "Logger.h"
#include <chrono>
#include <cstdlib>
#include <ctime>

namespace Qalla {

    std::ofstream RelayTrace::s_file;
    std::mutex    RelayTrace::s_mutex;
    bool          RelayTrace::s_enabled = false;

    namespace {
        constexpr size_t kMaxLineLength = 4096;
    }

    void RelayTrace::init(const std::string& path) {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (const char* e = std::getenv("QALLA_TRACE"))
            s_enabled = (e[0] == '1' || e[0] == 'y' || e[0] == 'Y');
        if (s_enabled && !s_file.is_open())
            s_file.open(path, std::ios::out | std::ios::trunc);
    }

    std::string RelayTrace::FormatLine(const std::string& clock, const std::string& connectionId,
        const std::string& msg)
    {
        std::string line = clock + " [TRACE] ";
        if (!connectionId.empty()) line += "[" + connectionId + "] ";
        line += msg;
        // Long lines (a huge SDP in a step) are cut, never split across entries.
        if (line.size() > kMaxLineLength - 1) line.resize(kMaxLineLength - 1);
        line += '\n';
        return line;
    }

    void RelayTrace::log(const std::string& msg) {
        Write(std::string(), msg);
    }

    void RelayTrace::log(const std::string& connectionId, const std::string& msg) {
        Write(connectionId, msg);
    }

    void RelayTrace::Write(const std::string& connectionId, const std::string& msg) {
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            if (!s_enabled || !s_file.is_open()) return;
        }

        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        struct tm tm_buf {};
        if (localtime_r(&t, &tm_buf) == nullptr) return;

        char timeBuf[32];
        if (std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &tm_buf) == 0) return;

        const std::string line = FormatLine(timeBuf, connectionId, msg);

        std::lock_guard<std::mutex> lock(s_mutex);
        if (!s_file.is_open()) return;
        s_file.write(line.data(), static_cast<std::streamsize>(line.size()));
        s_file.flush();
    }

} // namespace Qalla
