#include "dxfer/app/config.hpp"
#include "dxfer/core/context.hpp"
#include "dxfer/events/components.hpp"
#include "dxfer/events/event_bus.hpp"
#include "dxfer/session/orchestrator.hpp"
#include "dxfer/transfer/file_io.hpp"
#include "dxfer/transport/tcp.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using dxfer::Context;
using dxfer::Result;
using dxfer::app::Config;
using dxfer::session::SessionReport;
using dxfer::transport::TcpEndpoints;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

using Outcome = std::optional<Result<SessionReport>>;

void run_sender(const Context& ctx, const Config& config, Outcome& outcome) {
    spdlog::info("Connecting to {}:{}", config.host, config.port);

    TcpEndpoints::async_connect(ctx.io, config.host, config.port,
        [ctx, &config, &outcome](Result<std::shared_ptr<TcpEndpoints>> endpoints) {
            if (endpoints.is_error()) {
                outcome = dxfer::Err<SessionReport>(endpoints.error());
                return;
            }
            auto session = std::make_shared<dxfer::session::SendingSession>(
                ctx, endpoints.value(), config.files, config.chunk_size);
            session->done()->on_complete([&outcome](const Result<SessionReport>& result) {
                outcome = result;
            });
            session->start();
        });
}

void run_receiver(const Context& ctx,
                  const Config& config,
                  dxfer::transfer::DownloadDirectory& downloads,
                  Outcome& outcome) {
    TcpEndpoints::async_listen(ctx.io, config.port,
        [](std::uint16_t port) {
            spdlog::info("Listening on port {}", port);
        },
        [ctx, &downloads, &outcome](Result<std::shared_ptr<TcpEndpoints>> endpoints) {
            if (endpoints.is_error()) {
                outcome = dxfer::Err<SessionReport>(endpoints.error());
                return;
            }
            auto session = std::make_shared<dxfer::session::ReceivingSession>(
                ctx, endpoints.value(), downloads);
            session->done()->on_complete([&outcome](const Result<SessionReport>& result) {
                outcome = result;
            });
            session->start();
        });
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = dxfer::app::parse_args(args, dxfer::app::process_environment());
    if (parsed.is_error()) {
        std::cerr << "dxfer: " << parsed.error().message << "\n\n" << dxfer::app::usage();
        return kExitUsage;
    }
    const Config& config = parsed.value();
    spdlog::set_level(config.log_level);

    asio::io_context io;
    dxfer::events::EventBus event_bus;
    dxfer::events::LoggerComponent logger(event_bus, spdlog::default_logger());
    dxfer::events::MetricsComponent metrics(event_bus);
    Context ctx(io, spdlog::default_logger(), &event_bus);

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::warn("Interrupted by signal {}", signal_number);
            io.stop();
        }
    });

    Outcome outcome;
    std::optional<dxfer::transfer::DownloadDirectory> downloads;

    if (config.mode == dxfer::app::Mode::Send) {
        run_sender(ctx, config, outcome);
    } else {
        std::error_code ec;
        fs::create_directories(config.downloads, ec);
        if (ec) {
            spdlog::error("Cannot create download directory {}: {}", config.downloads.string(), ec.message());
            return kExitFailure;
        }
        downloads.emplace(config.downloads);
        spdlog::info("Saving files to {}", config.downloads.string());
        run_receiver(ctx, config, *downloads, outcome);
    }

    // The pending signal wait keeps run() alive, so drive until the session settled
    while (!outcome && io.run_one() > 0) {
    }
    signals.cancel();
    io.run();

    if (!outcome) {
        spdlog::error("Session did not finish");
        return kExitFailure;
    }
    if (outcome->is_error()) {
        spdlog::error("Transfer failed: {}", outcome->error().describe());
        return kExitFailure;
    }

    const auto& stats = metrics.get_stats();
    if (config.mode == dxfer::app::Mode::Send) {
        spdlog::info("Sent {} file(s), {} bytes", stats.files_sent, stats.bytes_sent);
    } else {
        const auto& report = outcome->value();
        spdlog::info("Received {} file(s), {} bytes", stats.files_received, stats.bytes_received);
        if (!report.failed.empty()) {
            spdlog::warn("{} inbound stream(s) failed", report.failed.size());
            for (const auto& failed : report.failed) {
                spdlog::warn("  {}: {}", failed.name.empty() ? "(no header)" : failed.name, failed.last_error);
            }
            return kExitFailure;
        }
    }
    return kExitOk;
}
