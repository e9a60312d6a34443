#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "engine/session.hpp"
#include "engine/storage.hpp"
#include "model/manifest_builder.hpp"
#include "net/remote.hpp"
#include "transport/tcp_connector.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "util/retry.hpp"

namespace
{

std::atomic<bool> g_interrupted{false};

void on_interrupt(int)
{
    g_interrupted.store(true);
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  ferryctl [--server <path|tcp:host:port>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  send <path...>\n"
                         "  receive <code> <dest-dir>\n"
                         "  info <code>\n"
                         "  status <transfer-id>\n"
                         "  delete <transfer-id>\n"
                         "  cleanup\n");
}

static int exit_for(ferry::Errc e)
{
    switch (e)
    {
        case ferry::Errc::ok:
            return exitc::ok;
        case ferry::Errc::unreachable:
            return exitc::no_server;
        case ferry::Errc::pair_not_found:
        case ferry::Errc::pair_expired:
        case ferry::Errc::transfer_not_found:
            return exitc::not_found;
        case ferry::Errc::cancelled:
            return exitc::cancelled;
        default:
            return exitc::failed;
    }
}

static int exit_for(const engine::Outcome &o)
{
    if (o.ok())
        return exitc::ok;
    if (o.mode == engine::Mode::cancelled)
        return exitc::cancelled;
    if (o.code == ferry::Errc::unreachable)
        return exitc::no_server;
    return exitc::failed;
}

static void report_error(const char *what, ferry::Errc e, const std::string &server)
{
    if (e == ferry::Errc::unreachable)
        std::fprintf(stderr, "error: cannot reach ferryd at %s\n", server.c_str());
    else
        std::fprintf(stderr, "error: %s: %s\n", what, ferry::errc_name(e));
}

// Runs `body` while a watcher turns Ctrl-C into session.cancel().
static engine::Outcome run_cancellable(engine::Session &s, const std::function<engine::Outcome()> &body)
{
    ferry::CancelToken finished;
    std::thread        watcher([&] {
        while (finished.wait_for(std::chrono::milliseconds(100)))
        {
            if (g_interrupted.exchange(false))
            {
                LOG_SYSTEM("interrupted, cancelling transfer");
                s.cancel();
            }
        }
    });
    engine::Outcome out = body();
    finished.cancel();
    watcher.join();
    return out;
}

static void print_manifest(const model::Manifest &m)
{
    std::printf("label:   %s\n", m.label.c_str());
    std::printf("kind:    %s\n", model::kind_name(m.kind));
    std::printf("size:    %s (%llu bytes)\n", model::format_size(m.total_size).c_str(),
                (unsigned long long)m.total_size);
    std::printf("entries: %zu\n", m.entry_count());
    for (const auto &e : m.entries)
        std::printf("  %s  %s\n", e.relative_path.c_str(), model::format_size(e.size).c_str());
}

struct Services
{
    std::shared_ptr<net::Client>   client;
    net::RemotePairing             pairing;
    net::RemoteRelayStore          relay;
    engine::EngineOptions          opt;
    engine::ConnectorFactory       connectors;

    Services(const ferry::Config &cfg, const net::Endpoint &ep)
        : client(std::make_shared<net::Client>(ep, cfg.max_parallel + 2)),
          pairing(client),
          relay(client),
          opt(cfg.engine_options())
    {
        transport::TcpConnectorOptions copt = cfg.connector_options();
        connectors                          = [copt] { return std::make_unique<transport::TcpPeerConnector>(copt); };
    }
};

static int cmd_send(const ferry::Config &cfg, Services &svc, const std::vector<std::string> &paths)
{
    auto built = model::build_manifest(paths, cfg.chunk_size);
    if (!built)
    {
        std::fprintf(stderr, "error: cannot build a manifest from the given paths\n");
        return exitc::bad_args;
    }

    engine::FileSource  src(built->sources);
    engine::SendSession session(svc.pairing, svc.relay, svc.opt, svc.connectors);
    pairing::PairInfo   info;
    ferry::Errc         rc = session.publish(built->manifest, src, info);
    if (rc != ferry::Errc::ok)
    {
        report_error("publish", rc, cfg.server);
        return exit_for(rc);
    }
    std::printf("code: %s\n", info.code.c_str());
    std::printf("transfer: %s\n", info.transfer_id.c_str());
    std::fflush(stdout);

    engine::Outcome out = run_cancellable(session, [&] { return session.run(); });
    if (!out.ok())
        std::fprintf(stderr, "error: transfer %s: %s\n", engine::mode_name(out.mode), out.summary().c_str());
    return exit_for(out);
}

static int cmd_receive(const ferry::Config &cfg, Services &svc, const std::string &code, const std::string &dest)
{
    engine::ReceiveSession session(svc.pairing, svc.relay, svc.opt, svc.connectors);
    pairing::PairInfo      info;
    ferry::Errc            rc = session.join(code, info);
    if (rc != ferry::Errc::ok)
    {
        report_error(code.c_str(), rc, cfg.server);
        return exit_for(rc);
    }
    print_manifest(info.manifest);
    std::fflush(stdout);

    engine::FileSink sink(dest);
    engine::Outcome  out = run_cancellable(session, [&] { return session.run(sink); });
    if (out.ok())
        std::printf("received into %s\n", dest.c_str());
    else
        std::fprintf(stderr, "error: transfer %s: %s\n", engine::mode_name(out.mode), out.summary().c_str());
    return exit_for(out);
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, const ferry::Config &cfg,
                   Services &svc)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"send",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_send(cfg, svc, std::vector<std::string>(args.begin() + 1, args.end()));
         }},
        {"receive",
         [&]() -> int {
             if (args.size() != 3)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return cmd_receive(cfg, svc, args[1], args[2]);
         }},
        {"info",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             pairing::PairInfo info;
             ferry::Errc       rc = svc.pairing.lookup(args[1], info);
             if (rc != ferry::Errc::ok)
             {
                 report_error(args[1].c_str(), rc, cfg.server);
                 return exit_for(rc);
             }
             std::printf("code:     %s\n", info.code.c_str());
             std::printf("transfer: %s\n", info.transfer_id.c_str());
             std::printf("matched:  %s\n", info.matched ? "yes" : "no");
             std::printf("expires:  %llds\n", (long long)info.expires_in.count());
             print_manifest(info.manifest);
             return exitc::ok;
         }},
        {"status",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             relay::Status st;
             ferry::Errc   rc = svc.relay.status(args[1], st);
             if (rc != ferry::Errc::ok)
             {
                 report_error(args[1].c_str(), rc, cfg.server);
                 return exit_for(rc);
             }
             std::printf("transfer: %s\n", st.transfer_id.c_str());
             std::printf("chunks:   %u/%u (%.1f%%)\n", st.uploaded_chunks, st.total_chunks, st.progress());
             std::printf("complete: %s\n", st.complete ? "yes" : "no");
             return exitc::ok;
         }},
        {"delete",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             ferry::Errc rc = svc.relay.delete_transfer(args[1]);
             if (rc != ferry::Errc::ok)
             {
                 report_error(args[1].c_str(), rc, cfg.server);
                 return exit_for(rc);
             }
             std::printf("deleted %s\n", args[1].c_str());
             return exitc::ok;
         }},
        {"cleanup",
         [&]() -> int {
             if (args.size() != 1)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::size_t purged = 0;
             ferry::Errc rc     = svc.relay.cleanup(purged);
             if (rc != ferry::Errc::ok)
             {
                 report_error("cleanup", rc, cfg.server);
                 return exit_for(rc);
             }
             std::printf("purged %zu transfers\n", purged);
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *log_level = std::getenv("FERRY_LOG_LEVEL"))
        ferry::set_log_level_by_name(log_level);

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // env first, then --server overrides it
    ferry::Config cfg = ferry::Config::from_env();

    std::vector<std::string> args;
    args.reserve(argc - 1);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--server" && i + 1 < argc)
            cfg.server = argv[++i];
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    auto ep = net::parse_endpoint(cfg.server);
    if (!ep)
    {
        std::fprintf(stderr, "error: invalid server endpoint '%s'\n", cfg.server.c_str());
        return exitc::bad_args;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    Services svc(cfg, *ep);
    return run_cmd(args[0], args, cfg, svc);
}
