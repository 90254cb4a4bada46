/**
 * fleetsync - Length-prefixed JSON framing used on the coordinator link.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace fleetsync::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    constexpr std::uint32_t kMaxFramePayload = 16u * 1024u * 1024u;

    // Throws std::length_error when the serialized message exceeds kMaxFramePayload.
    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

} // namespace fleetsync::protocol
