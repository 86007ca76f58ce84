/**
 * Interrupted upload, receiver restart, resumed upload; all in one process.
 *
 * 1. A 10-chunk file is buffered on the client.
 * 2. The link drops after chunk 4; the upload fails with retries exhausted.
 * 3. The receiver is torn down and reopened from its SQLite store.
 * 4. The client re-runs the same upload: only chunks 5..9 travel, and the
 *    assembled file matches the source.
 */

#include "ixcp/core/encoding.hpp"
#include "ixcp/core/logging.hpp"
#include "ixcp/crypto/key_cache.hpp"
#include "ixcp/crypto/key_pair.hpp"
#include "ixcp/events/components.hpp"
#include "ixcp/events/event_bus.hpp"
#include "ixcp/network/http_router.hpp"
#include "ixcp/network/upload_protocol.hpp"
#include "ixcp/server/key_ring.hpp"
#include "ixcp/server/upload_service.hpp"
#include "ixcp/storage/store_factory.hpp"
#include "ixcp/transfer/chunk_buffer.hpp"
#include "ixcp/transfer/http_upload_transport.hpp"
#include "ixcp/transfer/upload_orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using namespace ixcp;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::uint32_t kChunkCount = 10;
constexpr std::uint32_t kOutageFrom = 5;
constexpr const char* kApiKey = "demo-key";

/// Receiver stack that can be dropped and rebuilt over the same directory.
struct Receiver {
    std::unique_ptr<storage::KeyValueStore> store;
    std::unique_ptr<events::EventBus> bus;
    std::unique_ptr<events::MetricsComponent> metrics;
    std::unique_ptr<server::UploadService> service;
    std::unique_ptr<network::HttpRouter> router;
};

Result<Receiver> start_receiver(const fs::path& root, const server::KeyRing& keys) {
    auto store = storage::open_store(storage::StorageMode::Sqlite, root / "receiver", "receiver");
    if (store.is_error()) {
        return Err<Receiver>(store.error());
    }

    Receiver r;
    r.store = std::move(store.value());
    r.bus = std::make_unique<events::EventBus>();
    r.metrics = std::make_unique<events::MetricsComponent>(*r.bus);
    r.service = std::make_unique<server::UploadService>(*r.store, keys, root / "output", kApiKey, r.bus.get());
    r.router = std::make_unique<network::HttpRouter>();
    r.service->register_routes(*r.router);
    return Ok(std::move(r));
}

Result<Bytes> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<Bytes>(ErrorCode::IoFailure, "cannot open " + path.string());
    }
    return Ok(Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()));
}

int fail(const std::string& what, const Error& error) {
    spdlog::error("{}: {}", what, error.describe());
    return 1;
}

} // namespace

int main() {
    if (auto logging = configure_logging("info"); logging.is_error()) {
        std::cerr << logging.error().message << "\n";
        return 1;
    }

    const fs::path root = fs::temp_directory_path() / "ixcp-resume-demo";
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "receiver", ec);
    fs::create_directories(root / "client", ec);
    if (ec) {
        spdlog::error("Cannot prepare {}: {}", root.string(), ec.message());
        return 1;
    }

    // ── Source file ─────────────────────────────────────────
    const fs::path source = root / "telemetry.bin";
    auto content = random_bytes(kChunkSize * kChunkCount - 123);
    if (content.is_error()) {
        return fail("random bytes", content.error());
    }
    {
        std::ofstream out(source, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.value().data()),
                  static_cast<std::streamsize>(content.value().size()));
        if (!out) {
            spdlog::error("Cannot write {}", source.string());
            return 1;
        }
    }
    auto source_digest = sha256_hex(content.value());
    if (source_digest.is_error()) {
        return fail("hash", source_digest.error());
    }

    // ── Receiver ────────────────────────────────────────────
    auto key_pair = crypto::KeyPair::generate(2048);
    if (key_pair.is_error()) {
        return fail("key generation", key_pair.error());
    }
    server::KeyRing keys(std::move(key_pair.value()));

    auto receiver = start_receiver(root, keys);
    if (receiver.is_error()) {
        return fail("receiver", receiver.error());
    }

    // ── Client ──────────────────────────────────────────────
    auto client_store = storage::open_store(storage::StorageMode::Sqlite, root / "client", "client");
    if (client_store.is_error()) {
        return fail("client store", client_store.error());
    }
    transfer::ChunkBuffer buffer(*client_store.value());
    auto added = buffer.add_file(source, kChunkSize);
    if (added.is_error()) {
        return fail("add_file", added.error());
    }
    spdlog::info("Buffered {} chunk(s) of {}", added.value(), source.filename().string());

    crypto::PublicKeyCache key_cache(std::chrono::seconds(3600), client_store.value().get());

    transfer::OrchestratorOptions options;
    options.retry.max_attempts = 3;
    options.retry.initial_delay = std::chrono::milliseconds(10);

    // ── Run 1: link drops after chunk 4 ─────────────────────
    {
        transfer::LoopbackTransport link(*receiver.value().router, kApiKey);
        link.set_fault_injector([](const network::HttpRequest& request) -> std::optional<Error> {
            const auto index = request.get_header(network::protocol::kHeaderChunkIndex);
            if (!index.empty() && std::stoul(index) >= kOutageFrom) {
                return Error(ErrorCode::TransientTransport, "simulated outage");
            }
            return std::nullopt;
        });

        transfer::UploadOrchestrator orchestrator(buffer, link, key_cache, options);
        auto first = orchestrator.upload_file(source.filename().string());
        if (first.is_ok()) {
            spdlog::error("First run was expected to fail");
            return 1;
        }
        spdlog::info("Run 1 stopped: {}", first.error().describe());
    }

    auto received = receiver.value().service->ledger().status_of(source.filename().string());
    if (received.is_error()) {
        return fail("status", received.error());
    }
    spdlog::info("Receiver holds {} chunk(s) before restart", received.value().size());

    // ── Receiver restart ────────────────────────────────────
    receiver = start_receiver(root, keys);
    if (receiver.is_error()) {
        return fail("receiver restart", receiver.error());
    }

    // ── Run 2: resume ───────────────────────────────────────
    transfer::LoopbackTransport link(*receiver.value().router, kApiKey);
    transfer::UploadOrchestrator orchestrator(buffer, link, key_cache, options);
    auto second = orchestrator.upload_file(source.filename().string());
    if (second.is_error()) {
        return fail("resumed upload", second.error());
    }

    const auto& report = second.value();
    spdlog::info("Run 2: {} uploaded, {} skipped, {} attempt(s)",
                 report.uploaded, report.skipped, report.attempts);

    auto assembled = read_file(root / "output" / report.stored_name);
    if (assembled.is_error()) {
        return fail("read output", assembled.error());
    }
    auto assembled_digest = sha256_hex(assembled.value());
    if (assembled_digest.is_error()) {
        return fail("hash", assembled_digest.error());
    }

    const bool match = assembled_digest.value() == source_digest.value();
    spdlog::info("Source   sha256 {}", source_digest.value());
    spdlog::info("Received sha256 {} ({})", assembled_digest.value(), match ? "match" : "MISMATCH");

    receiver.value().metrics->print_stats();
    return match && report.uploaded == kChunkCount - kOutageFrom ? 0 : 1;
}
