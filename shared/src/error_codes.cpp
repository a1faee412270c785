#include "chunkup/error_codes.hpp"

#include <array>

namespace chunkup
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 17> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::InvalidState, "invalid_state"},
            {ErrorCode::OffsetMismatch, "offset_mismatch"},
            {ErrorCode::ChunkCorrupted, "chunk_corrupted"},
            {ErrorCode::StorageWriteFailed, "storage_write_failed"},
            {ErrorCode::StorageFailure, "storage_failure"},
            {ErrorCode::FileTooLarge, "file_too_large"},
            {ErrorCode::SizeOverrun, "size_overrun"},
            {ErrorCode::FinalHashMismatch, "final_hash_mismatch"},
            {ErrorCode::RetriesExhausted, "retries_exhausted"},
            {ErrorCode::Expired, "expired"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
            {ErrorCode::BlobLost, "blob_lost"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    bool is_terminal(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::FileTooLarge:
        case ErrorCode::SizeOverrun:
        case ErrorCode::FinalHashMismatch:
        case ErrorCode::RetriesExhausted:
        case ErrorCode::Expired:
        case ErrorCode::BlobLost:
            return true;
        default:
            return false;
        }
    }

} // namespace chunkup
