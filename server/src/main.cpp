#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "chunkup/server/config.hpp"
#include "chunkup/server/server.hpp"
#include "chunkup/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using chunkup::server::Server;
    using chunkup::server::ServerConfig;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            std::cout << "ChunkUp server " << chunkup::version() << "\n"
                      << chunkup::server::usage(argv[0]);
            return EXIT_SUCCESS;
        }
    }

    ServerConfig config;
    try
    {
        config = chunkup::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << chunkup::server::usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ChunkUp server {} on {}:{}", chunkup::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
