#pragma once
#include "Protocol.h"
#include <string>
#include <vector>

namespace Qalla {

    // Delivery seam between the relay core and the transport. Implementations
    // must only enqueue: the core calls these while holding its own locks.
    class Outbox {
    public:
        virtual ~Outbox() = default;

        // Returns false when no live connection has this id.
        virtual bool SendTo(const std::string& connectionId, PacketType type, const std::string& payload) = 0;
        virtual void SendToMany(const std::vector<std::string>& connectionIds, PacketType type, const std::string& payload) = 0;
        virtual void SendToAll(PacketType type, const std::string& payload) = 0;

        // Closes the connection once packets already queued for it are written.
        virtual void Disconnect(const std::string& connectionId) = 0;
    };

} // namespace Qalla
