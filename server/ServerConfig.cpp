#include "ServerConfig.hpp"

#include <sstream>
#include <stdexcept>

namespace lan_sentry::server
{
    namespace
    {
        long ParseNumber(const std::string &flag, const std::string &value, long min, long max)
        {
            size_t consumed = 0;
            long parsed = 0;
            try
            {
                parsed = std::stol(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            }

            if (consumed != value.size())
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            if (parsed < min || parsed > max)
                throw std::invalid_argument(flag + " must be between " + std::to_string(min) + " and " + std::to_string(max));
            return parsed;
        }
    }

    ServerConfig ParseServerArgs(int argc, const char *const argv[])
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            std::string flag = argv[i];

            if (flag == "--help" || flag == "-h")
            {
                config.show_help = true;
                continue;
            }

            if (i + 1 >= argc)
                throw std::invalid_argument("Missing value for " + flag);
            std::string value = argv[++i];

            if (flag == "--port")
                config.port = static_cast<int>(ParseNumber(flag, value, 1, 65535));
            else if (flag == "--cert")
                config.cert_path = value;
            else if (flag == "--key")
                config.key_path = value;
            else if (flag == "--interval")
                config.recheck_interval = std::chrono::seconds(ParseNumber(flag, value, 1, 86400));
            else if (flag == "--probe-timeout")
                config.probe_timeout = std::chrono::milliseconds(ParseNumber(flag, value, 10, 60000));
            else if (flag == "--name-timeout")
                config.name_timeout = std::chrono::milliseconds(ParseNumber(flag, value, 10, 60000));
            else if (flag == "--recheck-timeout")
                config.recheck_timeout = std::chrono::milliseconds(ParseNumber(flag, value, 10, 60000));
            else if (flag == "--ping-count")
                config.ping_count = static_cast<unsigned>(ParseNumber(flag, value, 1, 100));
            else if (flag == "--ping-timeout")
                config.ping_timeout = std::chrono::milliseconds(ParseNumber(flag, value, 10, 60000));
            else if (flag == "--workers")
                config.worker_threads = static_cast<unsigned>(ParseNumber(flag, value, 1, 64));
            else
                throw std::invalid_argument("Unknown option " + flag);
        }

        return config;
    }

    std::string ServerUsage(const std::string &program)
    {
        std::stringstream ss;
        ss << "Usage: " << program << " [options]\n"
           << "  --port N              listen port (8080)\n"
           << "  --cert PATH           TLS certificate (certs/server.crt)\n"
           << "  --key PATH            TLS private key (certs/server.key)\n"
           << "  --interval SECONDS    liveness re-check interval (30)\n"
           << "  --probe-timeout MS    sweep reachability timeout (1000)\n"
           << "  --name-timeout MS     reverse lookup timeout (500)\n"
           << "  --recheck-timeout MS  re-check reachability timeout (1000)\n"
           << "  --ping-count N        echo requests per ping (4)\n"
           << "  --ping-timeout MS     timeout per echo request (2000)\n"
           << "  --workers N           request worker threads (4)\n";
        return ss.str();
    }
}
