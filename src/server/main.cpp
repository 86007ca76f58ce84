#include "ixcp/core/config.hpp"
#include "ixcp/core/logging.hpp"
#include "ixcp/crypto/key_pair.hpp"
#include "ixcp/events/components.hpp"
#include "ixcp/events/event_bus.hpp"
#include "ixcp/events/events.hpp"
#include "ixcp/network/http_router.hpp"
#include "ixcp/network/http_server_asio.hpp"
#include "ixcp/server/key_ring.hpp"
#include "ixcp/server/upload_service.hpp"
#include "ixcp/storage/store_factory.hpp"

#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
namespace asio = boost::asio;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [-p PORT] [-o OUTPUT_DIR]\n"
              << "\n"
              << "Receives encrypted chunk uploads. Settings come from IXCP_CONFIG\n"
              << "(JSON file) and IXCP_* environment variables; flags override both.\n";
}

bool ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create directory {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config_result = ixcp::load_server_config();
    if (config_result.is_error()) {
        std::cerr << "Configuration error: " << config_result.error().message << "\n";
        return 2;
    }
    ixcp::ServerConfig config = config_result.value();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            const std::string value = argv[++i];
            const auto digits = value.find_first_not_of("0123456789");
            if (value.empty() || digits != std::string::npos || value.size() > 5 || std::stoul(value) > 65535) {
                std::cerr << "Invalid port: " << value << "\n";
                return 2;
            }
            config.port = static_cast<uint16_t>(std::stoul(value));
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output_dir = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (auto logging = ixcp::configure_logging(config.log_level); logging.is_error()) {
        std::cerr << logging.error().message << "\n";
        return 2;
    }

    if (!ensure_directory(config.data_dir) || !ensure_directory(config.output_dir)) {
        return 1;
    }

    // ──────────────────────────────────────────────────────
    // Keys and storage
    // ──────────────────────────────────────────────────────

    auto key_pair = ixcp::crypto::KeyPair::load_or_generate(config.key_file, config.rsa_bits);
    if (key_pair.is_error()) {
        spdlog::error("Receiver key: {}", key_pair.error().describe());
        return 1;
    }
    ixcp::server::KeyRing keys(std::move(key_pair.value()));
    spdlog::info("Receiver key {} ({})", keys.current().key_id(), config.key_file.string());

    auto store = ixcp::storage::open_store(config.storage_mode, config.data_dir, "receiver");
    if (store.is_error()) {
        spdlog::error("Opening {} store: {}", ixcp::storage::to_string(config.storage_mode),
                      store.error().describe());
        return 1;
    }

    if (config.api_key_generated) {
        spdlog::warn("No API key configured; generated one for this run: {}", config.api_key);
    }

    // ──────────────────────────────────────────────────────
    // Events, routes, server
    // ──────────────────────────────────────────────────────

    ixcp::events::EventBus event_bus;
    ixcp::events::LoggerComponent logger(event_bus);
    ixcp::events::MetricsComponent metrics(event_bus);

    ixcp::server::UploadService service(*store.value(), keys, config.output_dir,
                                        config.api_key, &event_bus);

    ixcp::network::HttpRouter router;
    router.use([](const ixcp::network::HttpContext& ctx, ixcp::network::HttpResponse&) {
        spdlog::debug("{} {}", ixcp::network::HttpMethodUtils::to_string(ctx.request.method),
                      ctx.request.url);
        return true;
    });
    service.register_routes(router);

    for (const auto& route : router.list_routes()) {
        spdlog::debug("  {}", route);
    }

    try {
        asio::io_context io_context;
        ixcp::network::HttpServerAsio server(io_context, config.port);
        server.set_handler([&router](const ixcp::network::HttpRequest& request) {
            return router.handle_request(request);
        });

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(ixcp::events::ServerShuttingDownEvent(
                signal_number == SIGINT ? "SIGINT" : "SIGTERM"));
            server.stop();
            io_context.stop();
        });

        event_bus.emit(ixcp::events::ServerStartedEvent(server.get_port()));
        spdlog::info("Storing chunks in {} ({} backend), assembled files in {}",
                     config.data_dir.string(), store.value()->backend_name(),
                     config.output_dir.string());

        io_context.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }

    metrics.print_stats();
    return 0;
}
