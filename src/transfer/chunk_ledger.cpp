#include "ixcp/transfer/chunk_ledger.hpp"

#include "ixcp/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace ixcp::transfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string encode_completion(const FinalizedFile& file) {
    return json{
        {"fileKey", file.file_key},
        {"chunkCount", file.chunk_count},
        {"totalBytes", file.total_bytes},
        {"sha256", file.sha256},
    }.dump();
}

Result<FinalizedFile> decode_completion(const std::string& text) {
    try {
        const auto doc = json::parse(text);
        FinalizedFile file;
        file.file_key = doc.at("fileKey").get<std::string>();
        file.chunk_count = doc.at("chunkCount").get<std::uint32_t>();
        file.total_bytes = doc.at("totalBytes").get<std::uint64_t>();
        file.sha256 = doc.at("sha256").get<std::string>();
        return Ok(std::move(file));
    } catch (const json::exception& e) {
        return Err<FinalizedFile>(ErrorCode::StorageFailure, std::string("Corrupt completion record: ") + e.what());
    }
}

Result<void> validate_file_key(const std::string& file_key) {
    if (file_key.empty() || !storage::is_valid_key_component(file_key)) {
        return Err<void>(ErrorCode::InvalidArgument, "Invalid file key: '" + file_key + "'");
    }
    return Ok();
}

} // namespace

ChunkLedger::ChunkLedger(storage::KeyValueStore& store, fs::path output_dir, events::EventBus* bus)
    : store_(store), output_dir_(std::move(output_dir)), bus_(bus) {}

Result<std::string> ChunkLedger::file_key_for(const std::string& client_name) {
    const auto slash = client_name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? client_name : client_name.substr(slash + 1);

    if (base.empty() || base == "." || base == "..") {
        return Err<std::string>(ErrorCode::InvalidArgument, "Unusable file name: '" + client_name + "'");
    }
    if (!storage::is_valid_key_component(base) || base.find('\0') != std::string::npos) {
        return Err<std::string>(ErrorCode::InvalidArgument, "File name contains a reserved character");
    }
    return Ok(std::move(base));
}

Result<AcceptOutcome> ChunkLedger::accept(const std::string& file_key,
                                          std::uint32_t chunk_index,
                                          const Bytes& payload) {
    if (auto valid = validate_file_key(file_key); valid.is_error()) {
        return Err<AcceptOutcome>(valid.error());
    }

    std::lock_guard lock(mutex_);
    const std::string key = storage::composite_key(file_key, chunk_index);

    auto existing = store_.get(kLedgerTable, key);
    if (existing.is_error()) {
        return Err<AcceptOutcome>(existing.error());
    }
    if (existing.value()) {
        if (bus_) {
            bus_->emit(events::ChunkDuplicateEvent{file_key, chunk_index});
        }
        return Ok(AcceptOutcome::Duplicate);
    }

    storage::WriteBatch batch;
    batch.put(kLedgerTable, key, json{{"size", payload.size()}, {"receivedAt", now_millis()}}.dump());
    batch.put(kPayloadsTable, key, ixcp::to_string(payload));
    if (auto res = store_.apply(batch); res.is_error()) {
        return Err<AcceptOutcome>(res.error());
    }

    if (bus_) {
        bus_->emit(events::ChunkAcceptedEvent{file_key, chunk_index, payload.size()});
    }
    return Ok(AcceptOutcome::Accepted);
}

Result<std::vector<std::uint32_t>> ChunkLedger::indices_unlocked(const std::string& file_key) const {
    using IndexList = std::vector<std::uint32_t>;

    auto entries = store_.scan(kLedgerTable, storage::key_prefix(file_key));
    if (entries.is_error()) {
        return Err<IndexList>(entries.error());
    }

    IndexList indices;
    indices.reserve(entries.value().size());
    for (const auto& [key, value] : entries.value()) {
        auto parts = storage::split_composite_key(key);
        if (parts.is_error()) {
            return Err<IndexList>(ErrorCode::StorageFailure, "Corrupt ledger key: " + parts.error().message);
        }
        indices.push_back(parts.value().second);
    }
    return Ok(std::move(indices));
}

Result<std::vector<std::uint32_t>> ChunkLedger::status_of(const std::string& file_key) const {
    std::lock_guard lock(mutex_);
    return indices_unlocked(file_key);
}

Result<std::vector<std::uint32_t>> ChunkLedger::missing_chunks(const std::string& file_key,
                                                               std::uint32_t expected_count) const {
    auto received = status_of(file_key);
    if (received.is_error()) {
        return received;
    }

    std::vector<std::uint32_t> missing;
    std::size_t next = 0;
    const auto& have = received.value();
    for (std::uint32_t index = 0; index < expected_count; ++index) {
        while (next < have.size() && have[next] < index) {
            ++next;
        }
        if (next == have.size() || have[next] != index) {
            missing.push_back(index);
        }
    }
    return Ok(std::move(missing));
}

Result<std::optional<FinalizedFile>> ChunkLedger::completion_unlocked(const std::string& file_key) const {
    auto stored = store_.get(kCompletedTable, file_key);
    if (stored.is_error()) {
        return Err<std::optional<FinalizedFile>>(stored.error());
    }
    if (!stored.value()) {
        return Ok(std::optional<FinalizedFile>{});
    }
    auto file = decode_completion(*stored.value());
    if (file.is_error()) {
        return Err<std::optional<FinalizedFile>>(file.error());
    }
    return Ok(std::optional<FinalizedFile>(std::move(file.value())));
}

Result<std::optional<FinalizedFile>> ChunkLedger::completion(const std::string& file_key) const {
    std::lock_guard lock(mutex_);
    return completion_unlocked(file_key);
}

Result<FinalizedFile> ChunkLedger::finalize(const std::string& file_key, std::uint32_t expected_count) {
    if (auto valid = validate_file_key(file_key); valid.is_error()) {
        return Err<FinalizedFile>(valid.error());
    }

    std::lock_guard lock(mutex_);

    auto done = completion_unlocked(file_key);
    if (done.is_error()) {
        return Err<FinalizedFile>(done.error());
    }
    if (done.value() && done.value()->chunk_count == expected_count) {
        spdlog::debug("{} already finalized with {} chunk(s)", file_key, expected_count);
        return Ok(*done.value());
    }

    auto indices = indices_unlocked(file_key);
    if (indices.is_error()) {
        return Err<FinalizedFile>(indices.error());
    }

    // Keys are ordered, so the set is {0..N-1} iff it has N entries and the last is N-1.
    const auto& have = indices.value();
    const bool complete = have.size() == expected_count
        && (expected_count == 0 || have.back() == expected_count - 1);
    if (!complete) {
        return Err<FinalizedFile>(ErrorCode::IncompleteTransfer,
            file_key + ": received " + std::to_string(have.size()) + " of "
            + std::to_string(expected_count) + " chunk(s)");
    }

    auto file = assemble(file_key, expected_count);
    if (file.is_error()) {
        return file;
    }

    if (auto res = store_.put(kCompletedTable, file_key, encode_completion(file.value())); res.is_error()) {
        return Err<FinalizedFile>(res.error());
    }

    if (bus_) {
        const auto& f = file.value();
        bus_->emit(events::TransferFinalizedEvent{f.file_key, f.chunk_count, f.total_bytes, f.sha256});
    }
    return file;
}

Result<FinalizedFile> ChunkLedger::assemble(const std::string& file_key, std::uint32_t count) {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec && !fs::exists(output_dir_)) {
        return Err<FinalizedFile>(ErrorCode::IoFailure, "Failed to create directory: " + output_dir_.string());
    }

    const fs::path destination = output_dir_ / file_key;
    const fs::path staging = output_dir_ / ("." + file_key + ".partial");

    FinalizedFile file{file_key, count, 0, {}};
    Sha256 hasher;
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<FinalizedFile>(ErrorCode::IoFailure, "Failed to open staging file: " + staging.string());
        }

        for (std::uint32_t index = 0; index < count; ++index) {
            auto payload = store_.get(kPayloadsTable, storage::composite_key(file_key, index));
            if (payload.is_error()) {
                return Err<FinalizedFile>(payload.error());
            }
            if (!payload.value()) {
                return Err<FinalizedFile>(ErrorCode::StorageFailure,
                    "Payload missing for chunk " + std::to_string(index) + " of " + file_key);
            }

            const std::string& data = *payload.value();
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            hasher.update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
            file.total_bytes += data.size();
        }

        out.flush();
        if (!out) {
            return Err<FinalizedFile>(ErrorCode::IoFailure, "Failed to write staging file: " + staging.string());
        }
    }

    auto digest = hasher.finish_hex();
    if (digest.is_error()) {
        return Err<FinalizedFile>(digest.error());
    }
    file.sha256 = digest.value();

    fs::rename(staging, destination, ec);
    if (ec) {
        return Err<FinalizedFile>(ErrorCode::IoFailure,
            "Failed to move staging file to " + destination.string() + ": " + ec.message());
    }

    spdlog::info("Assembled {} ({} chunk(s), {} bytes)", destination.string(), count, file.total_bytes);
    return Ok(std::move(file));
}

Result<void> ChunkLedger::cleanup(const std::string& file_key) {
    std::lock_guard lock(mutex_);

    auto indices = indices_unlocked(file_key);
    if (indices.is_error()) {
        return Err<void>(indices.error());
    }

    storage::WriteBatch batch;
    for (const auto index : indices.value()) {
        const std::string key = storage::composite_key(file_key, index);
        batch.remove(kLedgerTable, key);
        batch.remove(kPayloadsTable, key);
    }
    batch.remove(kCompletedTable, file_key);
    if (auto res = store_.apply(batch); res.is_error()) {
        return res;
    }

    spdlog::info("Cleaned up ledger for {} ({} chunk(s))", file_key, indices.value().size());
    return Ok();
}

} // namespace ixcp::transfer
