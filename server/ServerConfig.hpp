#pragma once

#include <chrono>
#include <string>

namespace lan_sentry::server
{
    struct ServerConfig
    {
        int port = 8080;
        std::string cert_path = "certs/server.crt";
        std::string key_path = "certs/server.key";

        std::chrono::milliseconds recheck_interval{30000};
        std::chrono::milliseconds probe_timeout{1000};
        std::chrono::milliseconds name_timeout{500};
        std::chrono::milliseconds recheck_timeout{1000};

        unsigned ping_count = 4;
        std::chrono::milliseconds ping_timeout{2000};

        unsigned worker_threads = 4;

        bool show_help = false;
    };

    // Throws std::invalid_argument on unknown flags or bad values.
    ServerConfig ParseServerArgs(int argc, const char *const argv[]);

    std::string ServerUsage(const std::string &program);
}
