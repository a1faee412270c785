#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkup/crypto.hpp"

namespace chunkup::server
{

    // Settings that shape every upload session. Built once at startup and shared by reference.
    struct UploadConfig
    {
        std::uint64_t chunk_size{64'000'000};
        std::optional<std::uint64_t> max_file_size;
        crypto::HashFunction hash_function{crypto::HashFunction::Md5};
        std::uint32_t retry_budget{2};
        bool preserve_file_name{true};
        bool preserve_failed_uploads{false};
    };

    // Missing keys keep their defaults; unknown hash names throw.
    UploadConfig upload_config_from_json(const nlohmann::json &json);

    UploadConfig load_upload_config(const std::filesystem::path &path);

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::hours{24}};
        std::optional<std::filesystem::path> log_file;
        UploadConfig upload;
    };

    // Throws std::runtime_error with a user-facing message on malformed arguments.
    ServerConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace chunkup::server
