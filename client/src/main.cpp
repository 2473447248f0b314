#include <cstdlib>
#include <exception>
#include <iostream>

#include "chunkdrop/client/config.hpp"
#include "chunkdrop/client/logger.hpp"
#include "chunkdrop/client/uploader.hpp"
#include "chunkdrop/version.hpp"

int main(int argc, char *argv[])
{
    using chunkdrop::client::ClientConfig;

    ClientConfig config;
    try
    {
        config = chunkdrop::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << "chunkdrop client " << chunkdrop::version() << "\n"
                  << chunkdrop::client::usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        chunkdrop::client::Logger logger(config.log_path);
        logger.event("start", "chunkdrop client {} targeting {}:{}", chunkdrop::version(), config.host, config.port);

        chunkdrop::client::Uploader uploader(std::move(config), logger);
        const auto report = uploader.run();
        std::cout << report.uploaded << " uploaded, " << report.skipped << " already present, " << report.failed
                  << " failed" << std::endl;
        return report.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Client error: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
