#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/crypto/envelope_crypto.hpp"
#include "ixcp/crypto/key_cache.hpp"
#include "ixcp/transfer/chunk_buffer.hpp"
#include "ixcp/transfer/transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ixcp::transfer {

/**
 * @brief Exponential backoff: attempt k waits initial_delay * 2^(k-1) after failing
 */
struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};

    /// Delay after failed attempt @p attempt (1-based).
    std::chrono::milliseconds delay_after(std::uint32_t attempt) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for
void thread_sleep(std::chrono::milliseconds delay);

/**
 * @brief Cooperative cancellation, checked between chunks
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct OrchestratorOptions {
    RetryPolicy retry;
    Sleeper sleeper = thread_sleep;
    std::shared_ptr<CancellationToken> cancellation;
    std::size_t max_in_flight = 1;
    std::uint32_t max_finalize_rounds = 2;
};

/**
 * @brief Outcome of one upload_file() call
 *
 * Chunk counts describe the pass that produced the file; attempts count
 * every pass.
 */
struct UploadReport {
    std::string file_id;
    std::string file_key;
    std::string stored_name;         ///< name the receiver stored the file under
    std::uint32_t total_chunks = 0;
    std::uint32_t uploaded = 0;      ///< chunks transmitted and acknowledged in this run
    std::uint32_t skipped = 0;       ///< chunks the receiver already had
    std::uint32_t attempts = 0;      ///< upload_chunk() calls, retries included
    std::uint32_t finalize_rounds = 0;
    std::uint32_t passes = 0;        ///< 2 when the receiver's copy had to be discarded
    std::uint64_t total_bytes = 0;
    std::string sha256;
};

/**
 * @brief Drives one buffered file to a finalized upload
 *
 * PROTOCOL (per file):
 * 1. N comes from the buffer's manifest
 * 2. Ask the receiver which indices it holds; on failure assume none
 * 3. Encrypt and send every other index in [0, N), ascending
 * 4. Retry TransientTransport failures with backoff, fail fast on others
 * 5. Mark each acknowledged chunk uploaded in the buffer
 * 6. Finalize; on IncompleteTransfer go back to 2, up to
 *    max_finalize_rounds times
 * 7. Compare the receiver's SHA-256 with the hash of the buffered chunks;
 *    on a mismatch (stale chunks of an earlier version under the same
 *    name) discard the receiver's copy and run 2-6 once more with a new
 *    session, then fail with ContentMismatch
 * 8. Purge the file's chunks and manifest from the buffer
 *
 * A failed run leaves buffer and ledger consistent; calling upload_file()
 * again resumes where the receiver's ledger says the upload stopped.
 *
 * A fresh session key is generated per pass and only lives on the stack of
 * upload_file().
 */
class UploadOrchestrator {
public:
    UploadOrchestrator(ChunkBuffer& buffer,
                       UploadTransport& transport,
                       crypto::PublicKeyCache& key_cache,
                       OrchestratorOptions options = {});

    Result<UploadReport> upload_file(const std::string& file_id);

    using FileResults = std::vector<std::pair<std::string, Result<UploadReport>>>;

    /// Every buffered file, independently; one result per file. Fails only
    /// when the buffer cannot be listed.
    Result<FileResults> upload_all();

private:
    struct Stream;

    template<typename T, typename Fn>
    Result<T> with_retry(const char* what, Fn&& fn, std::atomic<std::uint32_t>* attempts);

    Result<Stream> open_stream(const std::string& file_id, const std::string& file_key,
                               const crypto::PublicKey& receiver_key);
    Result<FinalizedFile> deliver(Stream& stream, std::uint32_t total, UploadReport& report);

    /// SHA-256 of the buffered payloads in index order; nullopt once a chunk is no longer buffered.
    Result<std::optional<std::string>> buffered_digest(const std::string& file_id, std::uint32_t total) const;

    Result<void> send_missing(Stream& stream, const std::vector<std::uint32_t>& indices, UploadReport& report);
    Result<void> send_chunk(Stream& stream, std::uint32_t index, std::atomic<std::uint32_t>& attempts);
    std::vector<std::uint32_t> resolve_received(const std::string& file_key);
    bool cancelled() const;

    ChunkBuffer& buffer_;
    UploadTransport& transport_;
    crypto::PublicKeyCache& key_cache_;
    OrchestratorOptions options_;
};

} // namespace ixcp::transfer
