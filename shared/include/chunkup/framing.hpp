/**
 * ChunkUp - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkup::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Upper bound on a single frame; a base64 chunk of the default chunk size fits comfortably.
    constexpr std::uint32_t kMaxFrameSize = 256u * 1024u * 1024u;

    // Room left in a chunk frame for the envelope around the encoded data.
    constexpr std::uint32_t kEnvelopeHeadroom = 1024u * 1024u;

    // Largest chunk whose base64 form still fits in one frame.
    constexpr std::uint64_t kMaxChunkSize = (kMaxFrameSize - kEnvelopeHeadroom) / 4u * 3u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    // Throws std::length_error for frames above kMaxFrameSize.
    std::uint32_t decode_frame_length(const std::array<std::uint8_t, kFrameHeaderSize> &header);

} // namespace chunkup::protocol
