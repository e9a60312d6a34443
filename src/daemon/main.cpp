#include <pthread.h>
#include <signal.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include "net/server.hpp"
#include "net/socket.hpp"
#include "pairing/registry.hpp"
#include "relay/disk_store.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "util/retry.hpp"

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  ferryd [--server <path|tcp:host:port>] [--relay-dir <dir>]\n"
                         "\n"
                         "Serves pairing, rendezvous and the relay chunk store on one endpoint.\n");
}

int main(int argc, char **argv)
{
    // log level from env var
    if (const char *log_level = std::getenv("FERRY_LOG_LEVEL"))
        ferry::set_log_level_by_name(log_level);

    ferry::Config cfg = ferry::Config::from_env();
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--server" && i + 1 < argc)
        {
            cfg.server = argv[++i];
            continue;
        }
        if (a == "--relay-dir" && i + 1 < argc)
        {
            cfg.relay_dir = argv[++i];
            continue;
        }
        std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
        print_usage();
        return exitc::bad_args;
    }

    auto ep = net::parse_endpoint(cfg.server);
    if (!ep)
    {
        std::fprintf(stderr, "error: invalid server endpoint '%s'\n", cfg.server.c_str());
        return exitc::bad_args;
    }
    const std::string relay_dir = net::expand_user(cfg.relay_dir);
    LOG_SYSTEM("Config: server=%s relay_dir=%s ttl=%llds retention=%lldh sweep=%llds",
               net::to_string(*ep).c_str(), relay_dir.c_str(), (long long)cfg.pair_ttl.count(),
               (long long)cfg.retention.count(), (long long)cfg.sweep_every.count());

    // Block the stop signals before any thread starts so only sigwait sees them.
    sigset_t stop_set;
    sigemptyset(&stop_set);
    sigaddset(&stop_set, SIGINT);
    sigaddset(&stop_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_set, nullptr);

    pairing::PairingRegistry registry(ferry::system_clock(), cfg.pair_ttl);
    relay::DiskRelayStore    store(relay_dir, ferry::system_clock(), cfg.retention);
    if (!store.open())
        return exitc::failed;
    net::RelayServer server(registry, store);
    if (!server.start(*ep))
    {
        LOG_ERROR("cannot listen on %s", net::to_string(*ep).c_str());
        return exitc::failed;
    }

    ferry::CancelToken sweeper_stop;
    std::thread        sweeper([&] {
        while (sweeper_stop.wait_for(cfg.sweep_every))
        {
            std::size_t pairs     = registry.sweep();
            std::size_t transfers = store.sweep();
            if (pairs || transfers)
                LOG_INFO("sweep: %zu pair codes, %zu transfers expired", pairs, transfers);
        }
    });

    int sig = 0;
    sigwait(&stop_set, &sig);
    LOG_SYSTEM("Received signal %d, shutting down", sig);

    sweeper_stop.cancel();
    sweeper.join();
    server.stop();
    return exitc::ok;
}
