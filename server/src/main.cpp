#include "Logger.h"
#include "RelayServer.h"
#include "ServerConfig.h"
#include "Version.h"
#include <asio.hpp>
#include <cstdio>
#include <iostream>
#include <thread>
#include <vector>
#include <csignal>

// Re-register the signal handler after each delivery so that a second Ctrl+C
// is still handled instead of reverting to the default handler mid-cleanup.
static void ArmSignals(asio::signal_set& signals, asio::io_context& io_context,
    Qalla::RelayServer& server) {
    signals.async_wait([&signals, &io_context, &server](const std::error_code& ec, int signo) {
        if (ec) return;
        Qalla::RelayTrace::log("step=server_shutdown status=graceful signal="
            + std::to_string(signo));
        server.Shutdown();
        io_context.stop();
        ArmSignals(signals, io_context, server);
        });
}

int main(int argc, char* argv[]) {
    Qalla::ServerConfig config;
    config.LoadFromEnv();
    switch (config.ParseCommandLine(argc, argv)) {
    case Qalla::ServerConfig::ParseResult::Help:
        std::cout << Qalla::ServerConfig::Usage(argv[0]);
        return 0;
    case Qalla::ServerConfig::ParseResult::Error:
        std::cerr << Qalla::ServerConfig::Usage(argv[0]);
        return 2;
    case Qalla::ServerConfig::ParseResult::Run:
        break;
    }

    try {
        Qalla::RelayTrace::init();
        asio::io_context io_context;
        Qalla::RelayServer server(io_context, config);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        ArmSignals(signals, io_context, server);

        const unsigned int thread_count = config.EffectiveThreads();
        config.PrintSummary();
        std::cout << "Qalla server " << QALLA_VERSION_STRING << " running on port "
            << config.port << " with " << thread_count << " threads...\n";
        if (!config.inviteCode.empty())
            std::cout << "Invite-only enabled (INVITE_CODE set).\n";

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (unsigned int i = 0; i < thread_count; ++i)
            threads.emplace_back([&io_context] { io_context.run(); });
        for (auto& t : threads) t.join();
    }
    catch (const std::exception& e) {
        std::cerr << "[Qalla Server] Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
