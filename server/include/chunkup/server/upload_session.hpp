#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkup/crypto.hpp"
#include "chunkup/protocol.hpp"

namespace chunkup::server
{

    enum class SessionStatus : std::uint8_t
    {
        Initial,
        Uploading,
        Successful,
        Failed
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(SessionStatus status) noexcept
    {
        return status == SessionStatus::Successful || status == SessionStatus::Failed;
    }

    using Clock = std::chrono::system_clock;

    struct UploadSession
    {
        std::string id;
        SessionStatus status{SessionStatus::Initial};
        std::optional<std::string> owner;
        std::optional<std::string> blob_path;
        std::string original_file_name;
        std::uint64_t original_file_size{};
        std::optional<std::uint64_t> max_file_size;
        std::uint64_t chunk_size{};
        std::uint64_t offset{};
        std::uint64_t current_file_size{};
        crypto::HashFunction hash_function{crypto::HashFunction::Md5};
        std::optional<std::string> running_digest;
        std::uint32_t retry_budget{};
        std::optional<std::string> error_message;
        Clock::time_point created_at{};
        Clock::time_point updated_at{};
        std::optional<Clock::time_point> completed_at;
    };

    void to_json(nlohmann::json &json, const UploadSession &session);
    void from_json(const nlohmann::json &json, UploadSession &session);

    protocol::SessionSnapshot make_snapshot(const UploadSession &session);

} // namespace chunkup::server
