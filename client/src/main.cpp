#include <cstdlib>
#include <iostream>
#include <string>

#include "chunkup/client/config.hpp"
#include "chunkup/client/logger.hpp"
#include "chunkup/client/uploader.hpp"
#include "chunkup/version.hpp"

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            std::cout << "ChunkUp client " << chunkup::version() << "\n"
                      << chunkup::client::usage(argv[0]);
            return EXIT_SUCCESS;
        }
    }

    try
    {
        auto config = chunkup::client::parse_arguments(argc, argv);
        chunkup::client::Logger logger(config.log_path);
        chunkup::client::Uploader uploader(std::move(config), std::move(logger));
        return uploader.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << chunkup::client::usage(argv[0]);
        return EXIT_FAILURE;
    }
}
