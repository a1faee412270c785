/**
 * ChunkUp - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkup/error_codes.hpp"

namespace chunkup::protocol
{

    enum class Command : std::uint8_t
    {
        UploadStart,
        UploadChunk,
        UploadStatus,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    // Without session_id this starts a new upload, with it the named upload is resumed.
    struct UploadStartRequest
    {
        std::optional<std::string> session_id{};
        std::optional<std::uint64_t> offset{};
        std::optional<std::string> file_name{};
        std::optional<std::uint64_t> file_size{};
        std::optional<std::string> hash_function{};
        // Caller identity; scopes resume lookups and the stored blob path.
        std::optional<std::string> owner{};
    };

    void to_json(nlohmann::json &json, const UploadStartRequest &request);
    void from_json(const nlohmann::json &json, UploadStartRequest &request);

    struct UploadChunkRequest
    {
        std::string session_id;
        std::uint64_t offset{};
        std::string data_base64;
        std::string chunk_hash;
        std::optional<std::string> final_hash{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadStatusRequest
    {
        std::string session_id;
    };

    void to_json(nlohmann::json &json, const UploadStatusRequest &request);
    void from_json(const nlohmann::json &json, UploadStatusRequest &request);

    struct SessionSnapshot
    {
        std::string session_id;
        std::string status;
        std::string hash_function;
        std::uint64_t offset{};
        std::uint64_t chunk_size{};
        std::uint64_t original_file_size{};
        std::uint64_t current_file_size{};
        std::string hr_original_file_size;
        std::string hr_current_file_size;
        std::optional<std::string> running_digest{};
        std::uint32_t retry_budget{};
        std::optional<std::string> error_message{};

        bool operator==(const SessionSnapshot &) const = default;
    };

    void to_json(nlohmann::json &json, const SessionSnapshot &snapshot);
    void from_json(const nlohmann::json &json, SessionSnapshot &snapshot);

    struct ErrorDetails
    {
        std::optional<std::uint32_t> remaining_retries{};
    };

    void to_json(nlohmann::json &json, const ErrorDetails &details);
    void from_json(const nlohmann::json &json, ErrorDetails &details);

} // namespace chunkup::protocol
