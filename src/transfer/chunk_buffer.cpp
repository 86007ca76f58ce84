#include "ixcp/transfer/chunk_buffer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>

namespace ixcp::transfer {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> validate_file_id(const std::string& file_id) {
    if (file_id.empty() || !storage::is_valid_key_component(file_id)) {
        return Err<void>(ErrorCode::InvalidArgument, "Invalid file id: '" + file_id + "'");
    }
    return Ok();
}

std::string encode_meta(ChunkStatus status, std::uint64_t size) {
    return json{{"status", to_string(status)}, {"size", size}}.dump();
}

std::string encode_manifest(const FileManifest& manifest) {
    return json{
        {"fileId", manifest.file_id},
        {"totalChunks", manifest.total_chunks},
        {"totalBytes", manifest.total_bytes},
    }.dump();
}

Result<FileManifest> decode_manifest(const std::string& text) {
    try {
        const auto doc = json::parse(text);
        FileManifest manifest;
        manifest.file_id = doc.at("fileId").get<std::string>();
        manifest.total_chunks = doc.at("totalChunks").get<std::uint32_t>();
        manifest.total_bytes = doc.at("totalBytes").get<std::uint64_t>();
        return Ok(std::move(manifest));
    } catch (const json::exception& e) {
        return Err<FileManifest>(ErrorCode::StorageFailure, std::string("Corrupt manifest: ") + e.what());
    }
}

} // namespace

ChunkBuffer::ChunkBuffer(storage::KeyValueStore& store) : store_(store) {}

Result<std::vector<std::pair<std::uint32_t, ChunkBuffer::ChunkMeta>>>
ChunkBuffer::scan_meta(const std::string& file_id) const {
    using MetaList = std::vector<std::pair<std::uint32_t, ChunkMeta>>;

    auto entries = store_.scan(kChunksTable, storage::key_prefix(file_id));
    if (entries.is_error()) {
        return Err<MetaList>(entries.error());
    }

    MetaList result;
    result.reserve(entries.value().size());
    for (const auto& [key, value] : entries.value()) {
        auto parts = storage::split_composite_key(key);
        if (parts.is_error()) {
            return Err<MetaList>(ErrorCode::StorageFailure, "Corrupt chunk key: " + parts.error().message);
        }
        try {
            const auto doc = json::parse(value);
            ChunkMeta meta;
            meta.status = doc.at("status").get<std::string>() == "uploaded" ? ChunkStatus::Uploaded
                                                                           : ChunkStatus::Pending;
            meta.size = doc.at("size").get<std::uint64_t>();
            result.emplace_back(parts.value().second, meta);
        } catch (const json::exception& e) {
            return Err<MetaList>(ErrorCode::StorageFailure, std::string("Corrupt chunk record: ") + e.what());
        }
    }
    return Ok(std::move(result));
}

Result<std::optional<FileManifest>> ChunkBuffer::manifest_unlocked(const std::string& file_id) const {
    auto stored = store_.get(kManifestsTable, file_id);
    if (stored.is_error()) {
        return Err<std::optional<FileManifest>>(stored.error());
    }
    if (!stored.value()) {
        return Ok(std::optional<FileManifest>{});
    }
    auto manifest = decode_manifest(*stored.value());
    if (manifest.is_error()) {
        return Err<std::optional<FileManifest>>(manifest.error());
    }
    return Ok(std::optional<FileManifest>(std::move(manifest.value())));
}

Result<ChunkId> ChunkBuffer::enqueue(const std::string& file_id,
                                     std::uint32_t sequence_index,
                                     Bytes payload,
                                     bool overwrite) {
    if (auto valid = validate_file_id(file_id); valid.is_error()) {
        return Err<ChunkId>(valid.error());
    }

    std::lock_guard lock(mutex_);
    ChunkId id{file_id, sequence_index};
    const std::string key = id.key();

    auto existing = store_.get(kChunksTable, key);
    if (existing.is_error()) {
        return Err<ChunkId>(existing.error());
    }
    if (existing.value() && !overwrite) {
        return Err<ChunkId>(ErrorCode::DuplicateChunk,
            "Chunk " + std::to_string(sequence_index) + " of " + file_id + " is already buffered");
    }

    auto current = manifest_unlocked(file_id);
    if (current.is_error()) {
        return Err<ChunkId>(current.error());
    }
    FileManifest manifest = current.value().value_or(FileManifest{file_id, 0, 0});
    if (sequence_index >= manifest.total_chunks) {
        manifest.total_chunks = sequence_index + 1;
    }
    if (!existing.value()) {
        manifest.total_bytes += payload.size();
    }

    storage::WriteBatch batch;
    batch.put(kChunksTable, key, encode_meta(ChunkStatus::Pending, payload.size()));
    batch.put(kPayloadsTable, key, ixcp::to_string(payload));
    batch.put(kManifestsTable, file_id, encode_manifest(manifest));
    if (auto res = store_.apply(batch); res.is_error()) {
        return Err<ChunkId>(res.error());
    }
    return Ok(std::move(id));
}

Result<std::uint32_t> ChunkBuffer::add_file(const fs::path& path, std::size_t chunk_size, bool overwrite) {
    if (chunk_size == 0) {
        return Err<std::uint32_t>(ErrorCode::InvalidArgument, "chunk_size must be > 0");
    }

    const std::string file_id = path.filename().string();
    if (auto valid = validate_file_id(file_id); valid.is_error()) {
        return Err<std::uint32_t>(valid.error());
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::uint32_t>(ErrorCode::NotFound, "Not a regular file: " + path.string());
    }
    const auto file_size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::uint32_t>(ErrorCode::IoFailure, "Cannot stat " + path.string() + ": " + ec.message());
    }
    const std::uint64_t total = (file_size + chunk_size - 1) / chunk_size;
    if (total > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::uint32_t>(ErrorCode::InvalidArgument, "Too many chunks for " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::uint32_t>(ErrorCode::IoFailure, "Failed to open source file: " + path.string());
    }

    std::lock_guard lock(mutex_);

    auto existing = scan_meta(file_id);
    if (existing.is_error()) {
        return Err<std::uint32_t>(existing.error());
    }
    if (!existing.value().empty() && !overwrite) {
        return Err<std::uint32_t>(ErrorCode::DuplicateChunk, file_id + " already has buffered chunks");
    }

    storage::WriteBatch batch;
    for (const auto& [index, meta] : existing.value()) {
        const std::string key = storage::composite_key(file_id, index);
        batch.remove(kChunksTable, key);
        batch.remove(kPayloadsTable, key);
    }

    FileManifest manifest{file_id, 0, 0};
    Bytes buffer(chunk_size);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }

        const std::string key = storage::composite_key(file_id, manifest.total_chunks);
        batch.put(kChunksTable, key, encode_meta(ChunkStatus::Pending, bytes_read));
        batch.put(kPayloadsTable, key, std::string(reinterpret_cast<const char*>(buffer.data()), bytes_read));
        manifest.total_chunks++;
        manifest.total_bytes += bytes_read;
    }
    if (input.bad()) {
        return Err<std::uint32_t>(ErrorCode::IoFailure, "Read error on " + path.string());
    }
    batch.put(kManifestsTable, file_id, encode_manifest(manifest));

    if (auto res = store_.apply(batch); res.is_error()) {
        return Err<std::uint32_t>(res.error());
    }

    spdlog::info("Buffered {} ({} bytes) as {} chunk(s)", file_id, manifest.total_bytes, manifest.total_chunks);
    return Ok(manifest.total_chunks);
}

Result<std::vector<Chunk>> ChunkBuffer::list_pending(const std::string& file_id) const {
    std::lock_guard lock(mutex_);

    auto metas = scan_meta(file_id);
    if (metas.is_error()) {
        return Err<std::vector<Chunk>>(metas.error());
    }

    std::vector<Chunk> pending;
    for (const auto& [index, meta] : metas.value()) {
        if (meta.status != ChunkStatus::Pending) {
            continue;
        }
        const std::string key = storage::composite_key(file_id, index);
        auto payload = store_.get(kPayloadsTable, key);
        if (payload.is_error()) {
            return Err<std::vector<Chunk>>(payload.error());
        }
        if (!payload.value() || payload.value()->size() != meta.size) {
            return Err<std::vector<Chunk>>(ErrorCode::StorageFailure,
                "Payload missing or truncated for chunk " + std::to_string(index) + " of " + file_id);
        }

        Chunk chunk;
        chunk.id = ChunkId{file_id, index};
        chunk.payload = to_bytes(*payload.value());
        chunk.status = ChunkStatus::Pending;
        pending.push_back(std::move(chunk));
    }
    return Ok(std::move(pending));
}

Result<std::optional<Chunk>> ChunkBuffer::get_chunk(const ChunkId& id) const {
    using MaybeChunk = std::optional<Chunk>;

    std::lock_guard lock(mutex_);
    const std::string key = id.key();

    auto meta = store_.get(kChunksTable, key);
    if (meta.is_error()) {
        return Err<MaybeChunk>(meta.error());
    }
    if (!meta.value()) {
        return Ok(MaybeChunk{});
    }
    auto payload = store_.get(kPayloadsTable, key);
    if (payload.is_error()) {
        return Err<MaybeChunk>(payload.error());
    }
    if (!payload.value()) {
        return Err<MaybeChunk>(ErrorCode::StorageFailure,
            "Payload missing for chunk " + std::to_string(id.sequence_index) + " of " + id.file_id);
    }

    Chunk chunk;
    chunk.id = id;
    chunk.payload = to_bytes(*payload.value());
    try {
        chunk.status = json::parse(*meta.value()).at("status").get<std::string>() == "uploaded"
            ? ChunkStatus::Uploaded : ChunkStatus::Pending;
    } catch (const json::exception& e) {
        return Err<MaybeChunk>(ErrorCode::StorageFailure, std::string("Corrupt chunk record: ") + e.what());
    }
    return Ok(MaybeChunk(std::move(chunk)));
}

Result<void> ChunkBuffer::mark_uploaded(const ChunkId& id) {
    std::lock_guard lock(mutex_);
    const std::string key = id.key();

    auto stored = store_.get(kChunksTable, key);
    if (stored.is_error()) {
        return Err<void>(stored.error());
    }
    if (!stored.value()) {
        return Err<void>(ErrorCode::NotFound,
            "Chunk " + std::to_string(id.sequence_index) + " of " + id.file_id + " is not buffered");
    }

    try {
        const auto doc = json::parse(*stored.value());
        if (doc.at("status").get<std::string>() == "uploaded") {
            return Ok();
        }
        return store_.put(kChunksTable, key, encode_meta(ChunkStatus::Uploaded, doc.at("size").get<std::uint64_t>()));
    } catch (const json::exception& e) {
        return Err<void>(ErrorCode::StorageFailure, std::string("Corrupt chunk record: ") + e.what());
    }
}

Result<std::size_t> ChunkBuffer::purge_uploaded(const std::string& file_id) {
    std::lock_guard lock(mutex_);

    auto metas = scan_meta(file_id);
    if (metas.is_error()) {
        return Err<std::size_t>(metas.error());
    }

    storage::WriteBatch batch;
    for (const auto& [index, meta] : metas.value()) {
        if (meta.status == ChunkStatus::Uploaded) {
            const std::string key = storage::composite_key(file_id, index);
            batch.remove(kChunksTable, key);
            batch.remove(kPayloadsTable, key);
        }
    }
    const std::size_t purged = batch.size() / 2;
    if (auto res = store_.apply(batch); res.is_error()) {
        return Err<std::size_t>(res.error());
    }
    if (purged > 0) {
        spdlog::debug("Purged {} uploaded chunk(s) of {}", purged, file_id);
    }
    return Ok(purged);
}

Result<std::optional<FileManifest>> ChunkBuffer::manifest(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    return manifest_unlocked(file_id);
}

Result<std::vector<FileManifest>> ChunkBuffer::buffered_files() const {
    std::lock_guard lock(mutex_);

    auto entries = store_.scan(kManifestsTable, "");
    if (entries.is_error()) {
        return Err<std::vector<FileManifest>>(entries.error());
    }

    std::vector<FileManifest> files;
    for (const auto& [key, value] : entries.value()) {
        auto manifest = decode_manifest(value);
        if (manifest.is_error()) {
            return Err<std::vector<FileManifest>>(manifest.error());
        }
        files.push_back(std::move(manifest.value()));
    }
    return Ok(std::move(files));
}

Result<void> ChunkBuffer::reset(const std::string& file_id) {
    std::lock_guard lock(mutex_);

    auto metas = scan_meta(file_id);
    if (metas.is_error()) {
        return Err<void>(metas.error());
    }

    storage::WriteBatch batch;
    for (const auto& [index, meta] : metas.value()) {
        if (meta.status == ChunkStatus::Uploaded) {
            batch.put(kChunksTable, storage::composite_key(file_id, index),
                      encode_meta(ChunkStatus::Pending, meta.size));
        }
    }
    return store_.apply(batch);
}

Result<void> ChunkBuffer::remove_manifest(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    return store_.remove(kManifestsTable, file_id);
}

Result<void> ChunkBuffer::remove_file(const std::string& file_id) {
    std::lock_guard lock(mutex_);

    auto metas = scan_meta(file_id);
    if (metas.is_error()) {
        return Err<void>(metas.error());
    }

    storage::WriteBatch batch;
    for (const auto& [index, meta] : metas.value()) {
        const std::string key = storage::composite_key(file_id, index);
        batch.remove(kChunksTable, key);
        batch.remove(kPayloadsTable, key);
    }
    batch.remove(kManifestsTable, file_id);
    return store_.apply(batch);
}

Result<void> ChunkBuffer::clear() {
    std::lock_guard lock(mutex_);
    for (const char* table : {kChunksTable, kPayloadsTable, kManifestsTable}) {
        if (auto res = store_.clear(table); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

Result<std::size_t> ChunkBuffer::chunk_count(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    auto metas = scan_meta(file_id);
    if (metas.is_error()) {
        return Err<std::size_t>(metas.error());
    }
    return Ok(metas.value().size());
}

} // namespace ixcp::transfer
