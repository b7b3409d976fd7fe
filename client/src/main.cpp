#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

#include "fshare/asio_transport.hpp"
#include "fshare/client/commands.hpp"
#include "fshare/client/config.hpp"
#include "fshare/client/logger.hpp"
#include "fshare/error_codes.hpp"
#include "fshare/version.hpp"

namespace
{

    void print_usage()
    {
        std::cout << "fshare " << fshare::version() << "\n"
                  << fshare::client::usage();
    }

} // namespace

int main(int argc, char *argv[])
{
    fshare::client::ClientConfig config;
    try
    {
        config = fshare::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage();
        return EXIT_FAILURE;
    }
    if (config.show_help)
    {
        print_usage();
        return EXIT_SUCCESS;
    }

    try
    {
        fshare::client::configure_logging(config.log_path, config.verbose);
        spdlog::debug("fshare {} using {}", fshare::version(), config.api_url);
        fshare::AsioHttpTransport transport;
        return fshare::client::run_command(config, transport, std::cout, std::cerr);
    }
    catch (const fshare::Error &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        spdlog::error("{}: {}", fshare::to_string(ex.code()), ex.what());
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
    }
    return EXIT_FAILURE;
}
