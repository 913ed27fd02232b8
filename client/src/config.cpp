#include "dropdeck/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace dropdeck::client
{

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Usage: dropdeck_client [username@]<server>:<port> [--log <file>] [--chunk-size <bytes>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto at_pos = endpoint.find('@');
        std::string host_part = endpoint;
        if (at_pos != std::string::npos)
        {
            config.username = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port = std::stoul(host_part.substr(colon_pos + 1));
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range");
        }
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                config.chunk_size = std::stoull(argv[index++]);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace dropdeck::client
