#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

#include "dropdeck/client/config.hpp"
#include "dropdeck/client/logger.hpp"
#include "dropdeck/client/session.hpp"
#include "dropdeck/version.hpp"

int main(int argc, char *argv[])
{
    using dropdeck::client::ClientSession;
    using dropdeck::client::Logger;

    if (argc == 2 && (std::string_view(argv[1]) == "--version"))
    {
        std::cout << "dropdeck_client " << dropdeck::version() << std::endl;
        return 0;
    }

    try
    {
        const auto config = dropdeck::client::parse_arguments(argc, argv);
        Logger logger(config.log_path);
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
