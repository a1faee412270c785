/**
 * ChunkUp - Error codes shared by the upload engine, the wire protocol and the client.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkup
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        InvalidState = 4,
        OffsetMismatch = 5,
        ChunkCorrupted = 6,
        StorageWriteFailed = 7,
        StorageFailure = 8,
        FileTooLarge = 9,
        SizeOverrun = 10,
        FinalHashMismatch = 11,
        RetriesExhausted = 12,
        Expired = 13,
        Unsupported = 14,
        InternalError = 15,
        BlobLost = 16
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Errors after which the session is FAILED and must be restarted under a new id.
    bool is_terminal(ErrorCode code) noexcept;

} // namespace chunkup
