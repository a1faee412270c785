#include "chunkup/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkup::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 4> kCommandMappings{{
            {Command::UploadStart, "UPLOAD_START"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> get_optional(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = get_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        put_optional(json, "id", envelope.request_id);
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = get_optional<std::string>(json, "id");
    }

    void to_json(nlohmann::json &json, const UploadStartRequest &request)
    {
        json = nlohmann::json::object();
        put_optional(json, "session_id", request.session_id);
        put_optional(json, "offset", request.offset);
        put_optional(json, "file_name", request.file_name);
        put_optional(json, "file_size", request.file_size);
        put_optional(json, "hash_function", request.hash_function);
        put_optional(json, "owner", request.owner);
    }

    void from_json(const nlohmann::json &json, UploadStartRequest &request)
    {
        request.session_id = get_optional<std::string>(json, "session_id");
        request.offset = get_optional<std::uint64_t>(json, "offset");
        request.file_name = get_optional<std::string>(json, "file_name");
        request.file_size = get_optional<std::uint64_t>(json, "file_size");
        request.hash_function = get_optional<std::string>(json, "hash_function");
        request.owner = get_optional<std::string>(json, "owner");
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"offset", request.offset},
            {"data", request.data_base64},
            {"chunk_hash", request.chunk_hash},
        };
        put_optional(json, "final_hash", request.final_hash);
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.offset = json.at("offset").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
        request.chunk_hash = json.at("chunk_hash").get<std::string>();
        request.final_hash = get_optional<std::string>(json, "final_hash");
    }

    void to_json(nlohmann::json &json, const UploadStatusRequest &request)
    {
        json = {{"session_id", request.session_id}};
    }

    void from_json(const nlohmann::json &json, UploadStatusRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const SessionSnapshot &snapshot)
    {
        json = {
            {"session_id", snapshot.session_id},
            {"status", snapshot.status},
            {"hash_function", snapshot.hash_function},
            {"offset", snapshot.offset},
            {"chunk_size", snapshot.chunk_size},
            {"original_file_size", snapshot.original_file_size},
            {"current_file_size", snapshot.current_file_size},
            {"hr_original_file_size", snapshot.hr_original_file_size},
            {"hr_current_file_size", snapshot.hr_current_file_size},
            {"retry_budget", snapshot.retry_budget},
        };
        put_optional(json, "running_digest", snapshot.running_digest);
        put_optional(json, "error_message", snapshot.error_message);
    }

    void from_json(const nlohmann::json &json, SessionSnapshot &snapshot)
    {
        snapshot.session_id = json.at("session_id").get<std::string>();
        snapshot.status = json.at("status").get<std::string>();
        snapshot.hash_function = json.value("hash_function", std::string{});
        snapshot.offset = json.value("offset", 0ULL);
        snapshot.chunk_size = json.value("chunk_size", 0ULL);
        snapshot.original_file_size = json.value("original_file_size", 0ULL);
        snapshot.current_file_size = json.value("current_file_size", 0ULL);
        snapshot.hr_original_file_size = json.value("hr_original_file_size", std::string{});
        snapshot.hr_current_file_size = json.value("hr_current_file_size", std::string{});
        snapshot.running_digest = get_optional<std::string>(json, "running_digest");
        snapshot.retry_budget = json.value("retry_budget", 0u);
        snapshot.error_message = get_optional<std::string>(json, "error_message");
    }

    void to_json(nlohmann::json &json, const ErrorDetails &details)
    {
        json = nlohmann::json::object();
        put_optional(json, "remaining_retries", details.remaining_retries);
    }

    void from_json(const nlohmann::json &json, ErrorDetails &details)
    {
        details.remaining_retries = get_optional<std::uint32_t>(json, "remaining_retries");
    }

} // namespace chunkup::protocol
