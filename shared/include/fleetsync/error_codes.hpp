/**
 * fleetsync - Error codes shared by the agent and its coordinator protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace fleetsync
{

    enum class ErrorCode : std::uint8_t
    {
        Ok = 0,
        InvalidCommand,
        InvalidPayload,
        NotFound,
        AlreadyExists,
        UnknownCommand,
        NotParticipant,
        Conflict,
        Unsupported,
        InternalError,
        EngineUnavailable
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace fleetsync
