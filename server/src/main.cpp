#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include "chunkdrop/crypto.hpp"
#include "chunkdrop/server/config.hpp"
#include "chunkdrop/server/server.hpp"
#include "chunkdrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using chunkdrop::server::Server;
    using chunkdrop::server::ServerConfig;

    ServerConfig config;
    try
    {
        config = chunkdrop::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << chunkdrop::server::usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.show_help)
    {
        std::cout << "chunkdrop server " << chunkdrop::version() << "\n"
                  << chunkdrop::server::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting chunkdrop server {} on {}:{}", chunkdrop::version(), config.address, config.port);

        chunkdrop::crypto::ensure_sodium_init();
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
