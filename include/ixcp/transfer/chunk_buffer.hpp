#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/storage/kv_store.hpp"
#include "ixcp/transfer/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace ixcp::transfer {

/**
 * @brief Client-side queue of chunks waiting to be uploaded
 *
 * STORAGE LAYOUT:
 *   chunks          <file_id>\x1f<index>  → {"status": "...", "size": n}
 *   chunk_payloads  <file_id>\x1f<index>  → raw payload
 *   manifests       <file_id>             → {"fileId", "totalChunks", "totalBytes"}
 *
 * A chunk's metadata and payload are always written in one WriteBatch, so a
 * chunk is never visible as pending without its complete payload.
 *
 * The buffer owns its chunk records; other components go through these
 * operations instead of touching the tables.
 */
class ChunkBuffer {
public:
    static constexpr const char* kChunksTable = "chunks";
    static constexpr const char* kPayloadsTable = "chunk_payloads";
    static constexpr const char* kManifestsTable = "manifests";

    explicit ChunkBuffer(storage::KeyValueStore& store);

    /**
     * @brief Buffer one chunk
     *
     * Fails with DuplicateChunk when (file_id, sequence_index) is already
     * buffered, unless @p overwrite is set. The file's manifest grows to
     * cover the new index.
     */
    Result<ChunkId> enqueue(const std::string& file_id,
                            std::uint32_t sequence_index,
                            Bytes payload,
                            bool overwrite = false);

    /**
     * @brief Split @p path into @p chunk_size slices and buffer all of them
     *
     * The file id is the file name. Chunks and manifest go into one batch.
     * Returns the chunk count (0 for an empty file).
     */
    Result<std::uint32_t> add_file(const std::filesystem::path& path,
                                   std::size_t chunk_size,
                                   bool overwrite = false);

    /// Pending chunks of @p file_id ordered by sequence index.
    Result<std::vector<Chunk>> list_pending(const std::string& file_id) const;

    /// Any status; std::nullopt when the chunk is not buffered.
    Result<std::optional<Chunk>> get_chunk(const ChunkId& id) const;

    /// Idempotent: marking an uploaded chunk again is a no-op.
    Result<void> mark_uploaded(const ChunkId& id);

    /// Remove every uploaded chunk of @p file_id; returns how many went.
    Result<std::size_t> purge_uploaded(const std::string& file_id);

    Result<std::optional<FileManifest>> manifest(const std::string& file_id) const;
    Result<std::vector<FileManifest>> buffered_files() const;

    /// Put every chunk of @p file_id back to pending.
    Result<void> reset(const std::string& file_id);

    Result<void> remove_manifest(const std::string& file_id);
    Result<void> remove_file(const std::string& file_id);
    Result<void> clear();

    /// Number of chunks (any status) buffered for @p file_id.
    Result<std::size_t> chunk_count(const std::string& file_id) const;

private:
    struct ChunkMeta {
        ChunkStatus status = ChunkStatus::Pending;
        std::uint64_t size = 0;
    };

    Result<std::vector<std::pair<std::uint32_t, ChunkMeta>>> scan_meta(const std::string& file_id) const;
    Result<std::optional<FileManifest>> manifest_unlocked(const std::string& file_id) const;

    storage::KeyValueStore& store_;
    mutable std::mutex mutex_;
};

} // namespace ixcp::transfer
