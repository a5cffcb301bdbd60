#include "Identifiers.h"
#include <chrono>
#include <random>

namespace Qalla {

    namespace {
        std::mt19937_64& ThreadRng() {
            thread_local std::mt19937_64 rng(std::random_device{}());
            return rng;
        }
    }

    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string RandomHex(size_t digits) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::uniform_int_distribution<int> dist(0, 15);
        std::string out;
        out.reserve(digits);
        for (size_t i = 0; i < digits; ++i) out.push_back(kHex[dist(ThreadRng())]);
        return out;
    }

    std::string GenerateConnectionId() {
        return RandomHex(20);
    }

    std::string GenerateMessageId(int64_t nowMs) {
        return std::to_string(nowMs) + "-" + RandomHex(12);
    }

} // namespace Qalla
