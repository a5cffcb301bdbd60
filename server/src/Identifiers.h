#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace Qalla {

    int64_t NowMs();

    // Lowercase hex from a per-thread generator.
    std::string RandomHex(size_t digits);

    // Opaque id for a live connection.
    std::string GenerateConnectionId();

    // "<epoch-ms>-<random hex>": sorts by creation time without a central counter.
    std::string GenerateMessageId(int64_t nowMs);

} // namespace Qalla
