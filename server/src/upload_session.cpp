#include "chunkup/server/upload_session.hpp"

#include <array>
#include <stdexcept>

#include "chunkup/size_format.hpp"

namespace chunkup::server
{

    namespace
    {

        struct StatusMapping
        {
            SessionStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 4> kStatusMappings{{
            {SessionStatus::Initial, "INITIAL"},
            {SessionStatus::Uploading, "UPLOADING"},
            {SessionStatus::Successful, "SUCCESSFUL"},
            {SessionStatus::Failed, "FAILED"},
        }};

        // Millisecond precision keeps idle-expiry comparisons stable across reloads.
        std::int64_t to_millis(Clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        Clock::time_point from_millis(std::int64_t millis)
        {
            return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
        }

    } // namespace

    std::string_view to_string(SessionStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        json = {
            {"id", session.id},
            {"status", to_string(session.status)},
            {"original_file_name", session.original_file_name},
            {"original_file_size", session.original_file_size},
            {"chunk_size", session.chunk_size},
            {"offset", session.offset},
            {"current_file_size", session.current_file_size},
            {"hash_function", crypto::to_string(session.hash_function)},
            {"retry_budget", session.retry_budget},
            {"created_at", to_millis(session.created_at)},
            {"updated_at", to_millis(session.updated_at)},
        };
        json["owner"] = session.owner ? nlohmann::json(*session.owner) : nlohmann::json(nullptr);
        json["blob_path"] = session.blob_path ? nlohmann::json(*session.blob_path) : nlohmann::json(nullptr);
        json["max_file_size"] = session.max_file_size ? nlohmann::json(*session.max_file_size) : nlohmann::json(nullptr);
        json["running_digest"] =
            session.running_digest ? nlohmann::json(*session.running_digest) : nlohmann::json(nullptr);
        json["error_message"] = session.error_message ? nlohmann::json(*session.error_message) : nlohmann::json(nullptr);
        json["completed_at"] =
            session.completed_at ? nlohmann::json(to_millis(*session.completed_at)) : nlohmann::json(nullptr);
    }

    void from_json(const nlohmann::json &json, UploadSession &session)
    {
        const auto optional_string = [&json](const char *key) -> std::optional<std::string>
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        };

        session.id = json.at("id").get<std::string>();

        const auto status_label = json.at("status").get<std::string>();
        const auto status = session_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown session status: " + status_label);
        }
        session.status = *status;

        const auto hash_label = json.at("hash_function").get<std::string>();
        const auto function = crypto::hash_function_from_string(hash_label);
        if (!function)
        {
            throw std::runtime_error("Unknown hash function: " + hash_label);
        }
        session.hash_function = *function;

        session.owner = optional_string("owner");
        session.blob_path = optional_string("blob_path");
        session.original_file_name = json.value("original_file_name", std::string{});
        session.original_file_size = json.value("original_file_size", 0ULL);
        if (auto it = json.find("max_file_size"); it != json.end() && !it->is_null())
        {
            session.max_file_size = it->get<std::uint64_t>();
        }
        else
        {
            session.max_file_size.reset();
        }
        session.chunk_size = json.value("chunk_size", 0ULL);
        session.offset = json.value("offset", 0ULL);
        session.current_file_size = json.value("current_file_size", 0ULL);
        session.running_digest = optional_string("running_digest");
        session.retry_budget = json.value("retry_budget", 0u);
        session.error_message = optional_string("error_message");
        session.created_at = from_millis(json.value("created_at", 0LL));
        session.updated_at = from_millis(json.value("updated_at", 0LL));
        if (auto it = json.find("completed_at"); it != json.end() && !it->is_null())
        {
            session.completed_at = from_millis(it->get<std::int64_t>());
        }
        else
        {
            session.completed_at.reset();
        }
    }

    protocol::SessionSnapshot make_snapshot(const UploadSession &session)
    {
        return protocol::SessionSnapshot{
            .session_id = session.id,
            .status = std::string(to_string(session.status)),
            .hash_function = std::string(crypto::to_string(session.hash_function)),
            .offset = session.offset,
            .chunk_size = session.chunk_size,
            .original_file_size = session.original_file_size,
            .current_file_size = session.current_file_size,
            .hr_original_file_size = human_readable_size(session.original_file_size),
            .hr_current_file_size = human_readable_size(session.current_file_size),
            .running_digest = session.running_digest,
            .retry_budget = session.retry_budget,
            .error_message = session.error_message,
        };
    }

} // namespace chunkup::server
