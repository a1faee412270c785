#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkup/crypto.hpp"

namespace chunkup::client
{

    struct ClientConfig
    {
        std::optional<std::string> owner;
        std::string host;
        std::uint16_t port{};
        std::filesystem::path file;
        std::optional<std::uint64_t> chunk_size;
        std::optional<crypto::HashFunction> hash_function;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> state_path;
        bool fresh{false};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace chunkup::client
