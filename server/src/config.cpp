#include "chunkup/server/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "chunkup/framing.hpp"

namespace chunkup::server
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error("Missing value for " + flag);
            }
            ++index;
            return std::string(argv[index]);
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid numeric value for " + flag + ": " + value);
            }
        }

    } // namespace

    UploadConfig upload_config_from_json(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Upload configuration must be a JSON object");
        }
        UploadConfig config;
        config.chunk_size = json.value("chunk_size", config.chunk_size);
        if (auto it = json.find("max_file_size"); it != json.end() && !it->is_null())
        {
            config.max_file_size = it->get<std::uint64_t>();
        }
        if (auto it = json.find("hash_function"); it != json.end())
        {
            const auto name = it->get<std::string>();
            const auto function = crypto::hash_function_from_string(name);
            if (!function)
            {
                throw std::runtime_error("Unknown hash function in configuration: " + name);
            }
            config.hash_function = *function;
        }
        config.retry_budget = json.value("retry_budget", config.retry_budget);
        config.preserve_file_name = json.value("preserve_file_name", config.preserve_file_name);
        config.preserve_failed_uploads = json.value("preserve_failed_uploads", config.preserve_failed_uploads);
        if (config.chunk_size == 0)
        {
            throw std::runtime_error("chunk_size must be positive");
        }
        if (config.chunk_size > protocol::kMaxChunkSize)
        {
            throw std::runtime_error("chunk_size must not exceed " + std::to_string(protocol::kMaxChunkSize) +
                                     " bytes");
        }
        return config;
    }

    UploadConfig load_upload_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open configuration file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Malformed configuration file " + path.string() + ": " + ex.what());
        }
        return upload_config_from_json(json);
    }

    ServerConfig parse_arguments(int argc, char *argv[])
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                const auto value = parse_unsigned(require_value(i, argc, argv, arg), arg);
                if (value == 0 || value > 65535)
                {
                    throw std::runtime_error("Port out of range: " + std::to_string(value));
                }
                config.port = static_cast<std::uint16_t>(value);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_unsigned(require_value(i, argc, argv, arg), arg));
            }
            else if (arg == "--idle-timeout")
            {
                config.idle_timeout =
                    std::chrono::seconds(static_cast<std::int64_t>(parse_unsigned(require_value(i, argc, argv, arg), arg)));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--config")
            {
                config.upload = load_upload_config(require_value(i, argc, argv, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.port == 0 || config.root.empty())
        {
            throw std::runtime_error("Both --port and --root are required");
        }
        return config;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name
            << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--idle-timeout <seconds>]"
               " [--log <FILE>] [--config <FILE.json>]\n";
        return oss.str();
    }

} // namespace chunkup::server
