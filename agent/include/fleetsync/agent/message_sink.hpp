#pragma once

#include "fleetsync/messages.hpp"

namespace fleetsync::agent
{

    // The single outbound path. send() never blocks on the network.
    class MessageSink
    {
    public:
        virtual ~MessageSink() = default;

        virtual void send(const protocol::OutboundMessage &message) = 0;
    };

} // namespace fleetsync::agent
