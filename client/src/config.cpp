#include "chunkup/client/config.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

#include "chunkup/framing.hpp"

namespace chunkup::client
{

    namespace
    {

        std::uint64_t parse_unsigned(const std::string &value, const std::string &flag)
        {
            std::size_t consumed = 0;
            unsigned long long parsed = 0;
            try
            {
                parsed = std::stoull(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
            }
            if (consumed != value.size() || value.front() == '-')
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
            }
            return static_cast<std::uint64_t>(parsed);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error("Expected an endpoint and a file to upload");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto at_pos = endpoint.find('@');
        std::string host_part = endpoint;
        if (at_pos != std::string::npos)
        {
            config.owner = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port = parse_unsigned(host_part.substr(colon_pos + 1), "port");
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range: " + std::to_string(port));
        }
        config.port = static_cast<std::uint16_t>(port);

        config.file = std::filesystem::path(argv[index++]);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--fresh")
            {
                config.fresh = true;
                continue;
            }
            if (index >= argc)
            {
                throw std::runtime_error(arg + " requires a value");
            }
            const std::string value = argv[index++];
            if (arg == "--chunk-size")
            {
                config.chunk_size = parse_unsigned(value, arg);
                if (*config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                if (*config.chunk_size > protocol::kMaxChunkSize)
                {
                    throw std::runtime_error("--chunk-size must not exceed " +
                                             std::to_string(protocol::kMaxChunkSize));
                }
            }
            else if (arg == "--hash")
            {
                config.hash_function = crypto::hash_function_from_string(value);
                if (!config.hash_function)
                {
                    throw std::runtime_error("Unknown hash function: " + value);
                }
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(value);
            }
            else if (arg == "--state")
            {
                config.state_path = std::filesystem::path(value);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " [owner@]<host>:<port> <file>"
            << " [--chunk-size <bytes>] [--hash <MD5|SHA1|SHA256|SHA512|BLAKE2B>]"
            << " [--log <file>] [--state <file>] [--fresh]\n";
        return oss.str();
    }

} // namespace chunkup::client
