#include "ApiHandler.hpp"
#include "ChangeNotifier.hpp"
#include "DeviceStore.hpp"
#include "Errors.hpp"
#include "HostProbe.hpp"
#include "LivenessReconciler.hpp"
#include "MetricsStub.hpp"
#include "NetworkCore.hpp"
#include "PingService.hpp"
#include "ServerConfig.hpp"
#include "SweepCoordinator.hpp"
#include "TinsProbe.hpp"
#include "TopologyResolver.hpp"
#include "Worker.hpp"

#include <csignal>
#include <iostream>

namespace
{
    lan_sentry::server::NetworkCore *g_server = nullptr;

    void HandleSignal(int)
    {
        if (g_server)
            g_server->Stop();
    }

    void LogTopology(lan_sentry::server::TopologyResolver &resolver)
    {
        using namespace lan_sentry::server;

        try
        {
            NetworkTopology topology = resolver.Resolve();
            std::cout << "[Server] Interface " << topology.interface_name << " "
                      << topology.address << " / " << topology.netmask << std::endl;

            SweepRange range = TopologyResolver::DeriveSweepRange(topology);
            std::cout << "[Server] Sweep range " << range.cidr << std::endl;
        }
        catch (const NoNetworkError &e)
        {
            std::cerr << "[Server] WARNING: " << e.what() << ". Scans will fail until a network is up." << std::endl;
        }
        catch (const UnsupportedRangeError &e)
        {
            std::cerr << "[Server] WARNING: " << e.what() << ". Scans will be refused." << std::endl;
        }
    }
}

int main(int argc, char *argv[])
{
    using namespace lan_sentry::server;

    ServerConfig config;
    try
    {
        config = ParseServerArgs(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n\n" << ServerUsage(argv[0]);
        return 1;
    }

    if (config.show_help)
    {
        std::cout << ServerUsage(argv[0]);
        return 0;
    }

    try
    {
        TinsNetworkProbe probe;
        TopologyResolver resolver(probe);

        ProbeSettings settings;
        settings.reach_timeout = config.probe_timeout;
        settings.name_timeout = config.name_timeout;
        HostProbe host_probe(probe, settings);

        DeviceStore store;
        ChangeNotifier notifier(store);
        SweepCoordinator sweeper(resolver, host_probe, store, notifier);
        LivenessReconciler reconciler(probe, store, notifier, config.recheck_interval, config.recheck_timeout);
        PingService pinger(probe, config.ping_count, config.ping_timeout);
        MetricsStub metrics;

        ApiHandler handler(resolver, sweeper, store, pinger, metrics);
        Worker worker(handler, config.worker_threads);
        NetworkCore server(config, worker, notifier);
        worker.SetResponseSink(&server);

        LogTopology(resolver);

        server.Init();

        g_server = &server;
        std::signal(SIGPIPE, SIG_IGN);
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        reconciler.Start();
        worker.Start();

        try
        {
            server.Run();
        }
        catch (...)
        {
            // workers hold a pointer to server, stop them before it goes away
            g_server = nullptr;
            reconciler.Stop();
            worker.Stop();
            throw;
        }

        g_server = nullptr;
        reconciler.Stop();
        worker.Stop();
    }
    catch (const std::exception &e)
    {
        g_server = nullptr;
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        return -1;
    }

    std::cout << "[Server] Shutdown complete." << std::endl;
    return 0;
}
