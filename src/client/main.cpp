#include "ixcp/core/config.hpp"
#include "ixcp/core/logging.hpp"
#include "ixcp/crypto/key_cache.hpp"
#include "ixcp/network/http_client.hpp"
#include "ixcp/storage/store_factory.hpp"
#include "ixcp/transfer/chunk_buffer.hpp"
#include "ixcp/transfer/http_upload_transport.hpp"
#include "ixcp/transfer/upload_orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using ixcp::transfer::ChunkBuffer;
using ixcp::transfer::UploadReport;

namespace {

std::shared_ptr<ixcp::transfer::CancellationToken> g_cancel;

void on_signal(int) {
    if (g_cancel) {
        g_cancel->cancel();
    }
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  add <file>...   split files into the local buffer\n"
              << "  upload          upload every buffered file\n"
              << "  send <file>     add, then upload that file\n"
              << "  list            show buffered files\n"
              << "  clear           empty the buffer\n"
              << "\n"
              << "The receiver API key is read from IXCP_API_KEY.\n";
}

void print_report(const UploadReport& report) {
    std::cout << report.file_id << " -> " << report.stored_name << ": "
              << report.total_chunks << " chunk(s), "
              << report.uploaded << " uploaded, "
              << report.skipped << " already on receiver, "
              << report.attempts << " attempt(s)";
    if (!report.sha256.empty()) {
        std::cout << ", sha256 " << report.sha256;
    }
    std::cout << "\n";
}

/// Wiring shared by every command.
struct ClientContext {
    ixcp::ClientConfig config;
    std::unique_ptr<ixcp::storage::KeyValueStore> store;
    std::unique_ptr<ChunkBuffer> buffer;
};

ixcp::Result<ClientContext> open_context(ixcp::ClientConfig config) {
    std::error_code ec;
    fs::create_directories(config.data_dir, ec);
    if (ec) {
        return ixcp::Err<ClientContext>(ixcp::ErrorCode::IoFailure,
            "Cannot create " + config.data_dir.string() + ": " + ec.message());
    }

    auto store = ixcp::storage::open_store(config.storage_mode, config.data_dir, "client");
    if (store.is_error()) {
        return ixcp::Err<ClientContext>(store.error());
    }

    ClientContext ctx;
    ctx.config = std::move(config);
    ctx.store = std::move(store.value());
    ctx.buffer = std::make_unique<ChunkBuffer>(*ctx.store);
    return ixcp::Ok(std::move(ctx));
}

int cmd_add(ClientContext& ctx, const std::vector<std::string>& files) {
    if (files.empty()) {
        std::cerr << "add: no files given\n";
        return 2;
    }
    int status = 0;
    for (const auto& file : files) {
        auto added = ctx.buffer->add_file(file, ctx.config.chunk_size);
        if (added.is_error()) {
            spdlog::error("add {}: {}", file, added.error().describe());
            status = 1;
            continue;
        }
        std::cout << "Buffered " << fs::path(file).filename().string() << ": "
                  << added.value() << " chunk(s)\n";
    }
    return status;
}

int run_uploads(ClientContext& ctx, const std::vector<std::string>& only) {
    if (ctx.config.api_key.empty()) {
        spdlog::error("IXCP_API_KEY is not set");
        return 2;
    }

    auto client = ixcp::network::HttpClient::create(ctx.config.server_url, ctx.config.request_timeout);
    if (client.is_error()) {
        spdlog::error("{}", client.error().describe());
        return 2;
    }

    ixcp::transfer::HttpUploadTransport transport(std::move(client.value()), ctx.config.api_key);
    ixcp::crypto::PublicKeyCache key_cache(ctx.config.key_cache_ttl, ctx.store.get());

    ixcp::transfer::OrchestratorOptions options;
    options.retry.max_attempts = ctx.config.max_attempts;
    options.retry.initial_delay = ctx.config.initial_retry_delay;
    options.max_in_flight = ctx.config.max_in_flight;
    options.cancellation = g_cancel;

    ixcp::transfer::UploadOrchestrator orchestrator(*ctx.buffer, transport, key_cache, options);

    int status = 0;
    if (!only.empty()) {
        for (const auto& file_id : only) {
            auto report = orchestrator.upload_file(file_id);
            if (report.is_error()) {
                spdlog::error("{}: {} (buffer kept, rerun to resume)", file_id, report.error().describe());
                status = 1;
                continue;
            }
            print_report(report.value());
        }
        return status;
    }

    auto results = orchestrator.upload_all();
    if (results.is_error()) {
        spdlog::error("Listing buffer: {}", results.error().describe());
        return 1;
    }
    if (results.value().empty()) {
        std::cout << "Nothing buffered\n";
    }
    for (const auto& [file_id, report] : results.value()) {
        if (report.is_error()) {
            spdlog::error("{}: {} (buffer kept, rerun to resume)", file_id, report.error().describe());
            status = 1;
            continue;
        }
        print_report(report.value());
    }
    return status;
}

int cmd_list(ClientContext& ctx) {
    auto files = ctx.buffer->buffered_files();
    if (files.is_error()) {
        spdlog::error("list: {}", files.error().describe());
        return 1;
    }
    if (files.value().empty()) {
        std::cout << "Buffer is empty\n";
        return 0;
    }
    for (const auto& manifest : files.value()) {
        auto pending = ctx.buffer->list_pending(manifest.file_id);
        std::cout << manifest.file_id << ": " << manifest.total_chunks << " chunk(s), "
                  << manifest.total_bytes << " bytes";
        if (pending.is_ok()) {
            std::cout << ", " << pending.value().size() << " pending";
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_clear(ClientContext& ctx) {
    if (auto cleared = ctx.buffer->clear(); cleared.is_error()) {
        spdlog::error("clear: {}", cleared.error().describe());
        return 1;
    }
    std::cout << "Buffer cleared\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    auto config = ixcp::load_client_config();
    if (config.is_error()) {
        std::cerr << "Configuration error: " << config.error().message << "\n";
        return 2;
    }
    if (auto logging = ixcp::configure_logging(config.value().log_level); logging.is_error()) {
        std::cerr << logging.error().message << "\n";
        return 2;
    }

    auto ctx = open_context(std::move(config.value()));
    if (ctx.is_error()) {
        spdlog::error("{}", ctx.error().describe());
        return 1;
    }

    g_cancel = std::make_shared<ixcp::transfer::CancellationToken>();
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (command == "add") {
        return cmd_add(ctx.value(), args);
    }
    if (command == "upload") {
        return run_uploads(ctx.value(), {});
    }
    if (command == "send") {
        if (args.size() != 1) {
            std::cerr << "send: exactly one file expected\n";
            return 2;
        }
        auto added = ctx.value().buffer->add_file(args.front(), ctx.value().config.chunk_size);
        if (added.is_error()) {
            if (added.error().code != ixcp::ErrorCode::DuplicateChunk) {
                spdlog::error("send {}: {}", args.front(), added.error().describe());
                return 1;
            }
            spdlog::info("{} is already buffered; resuming", args.front());
        }
        return run_uploads(ctx.value(), {fs::path(args.front()).filename().string()});
    }
    if (command == "list") {
        return cmd_list(ctx.value());
    }
    if (command == "clear") {
        return cmd_clear(ctx.value());
    }

    print_usage(argv[0]);
    return 2;
}
