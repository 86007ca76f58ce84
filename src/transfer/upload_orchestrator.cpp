#include "ixcp/transfer/upload_orchestrator.hpp"

#include "ixcp/transfer/chunk_ledger.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>

namespace ixcp::transfer {

std::chrono::milliseconds RetryPolicy::delay_after(std::uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    const std::uint32_t shift = std::min<std::uint32_t>(attempt - 1, 30);
    return initial_delay * (std::int64_t{1} << shift);
}

void thread_sleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

/**
 * @brief Per-run encryption context
 *
 * Holds the plaintext session key; destroyed when upload_file() returns.
 */
struct UploadOrchestrator::Stream {
    std::string file_id;
    std::string file_key;
    std::string session_id;
    crypto::SessionKey key;
    crypto::WrappedSessionKey wrapped;
    Bytes associated_data;
};

UploadOrchestrator::UploadOrchestrator(ChunkBuffer& buffer,
                                       UploadTransport& transport,
                                       crypto::PublicKeyCache& key_cache,
                                       OrchestratorOptions options)
    : buffer_(buffer),
      transport_(transport),
      key_cache_(key_cache),
      options_(std::move(options)) {
    if (!options_.sleeper) {
        options_.sleeper = thread_sleep;
    }
    options_.max_in_flight = std::max<std::size_t>(1, options_.max_in_flight);
    options_.max_finalize_rounds = std::max<std::uint32_t>(1, options_.max_finalize_rounds);
    options_.retry.max_attempts = std::max<std::uint32_t>(1, options_.retry.max_attempts);
}

bool UploadOrchestrator::cancelled() const {
    return options_.cancellation && options_.cancellation->cancelled();
}

template<typename T, typename Fn>
Result<T> UploadOrchestrator::with_retry(const char* what, Fn&& fn, std::atomic<std::uint32_t>* attempts) {
    const std::uint32_t max_attempts = options_.retry.max_attempts;

    for (std::uint32_t attempt = 1;; ++attempt) {
        if (attempts) {
            attempts->fetch_add(1);
        }

        Result<T> result = fn();
        if (result.is_ok() || !is_transient(result.error().code)) {
            return result;
        }

        if (attempt >= max_attempts) {
            return Err<T>(ErrorCode::TransientTransport,
                std::string(what) + " failed after " + std::to_string(attempt) + " attempt(s): "
                + result.error().message);
        }

        const auto delay = options_.retry.delay_after(attempt);
        spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {}ms",
                     what, attempt, max_attempts, result.error().message, delay.count());
        options_.sleeper(delay);
    }
}

std::vector<std::uint32_t> UploadOrchestrator::resolve_received(const std::string& file_key) {
    auto status = transport_.query_status(file_key);
    if (status.is_error()) {
        // Fail open: uploading everything is safe, the ledger drops duplicates.
        spdlog::warn("Status query for {} failed, uploading every chunk: {}", file_key, status.error().message);
        return {};
    }
    return std::move(status.value());
}

Result<void> UploadOrchestrator::send_chunk(Stream& stream,
                                            std::uint32_t index,
                                            std::atomic<std::uint32_t>& attempts) {
    auto chunk = buffer_.get_chunk(ChunkId{stream.file_id, index});
    if (chunk.is_error()) {
        return Err<void>(chunk.error());
    }
    if (!chunk.value()) {
        return Err<void>(ErrorCode::IncompleteTransfer,
            "Chunk " + std::to_string(index) + " of " + stream.file_id + " is missing on the receiver "
            "and no longer buffered");
    }

    auto sealed = crypto::encrypt_chunk(stream.key, index, chunk.value()->payload, stream.associated_data);
    if (sealed.is_error()) {
        return Err<void>(sealed.error());
    }

    EncryptedPacket packet;
    packet.session_id = stream.session_id;
    packet.file_name = stream.file_id;
    packet.sequence_index = index;
    packet.key_id = stream.wrapped.key_id;
    packet.wrapped_key = stream.wrapped.wrapped;
    packet.nonce = std::move(sealed.value().nonce);
    packet.auth_tag = std::move(sealed.value().auth_tag);
    packet.ciphertext = std::move(sealed.value().ciphertext);
    packet.status = PacketStatus::Sent;

    const std::string what = "upload of chunk " + std::to_string(index);
    auto ack = with_retry<ChunkAck>(what.c_str(), [&] { return transport_.upload_chunk(packet); }, &attempts);
    if (ack.is_error()) {
        if (ack.error().code == ErrorCode::PayloadRejected) {
            // A rotated receiver key shows up as a rejected packet; refetch next run.
            key_cache_.invalidate();
        }
        return Err<void>(ack.error().code,
            stream.file_id + " chunk " + std::to_string(index) + ": " + ack.error().message);
    }
    packet.status = PacketStatus::Acknowledged;

    if (ack.value().already_received) {
        spdlog::debug("Chunk {} of {} was already on the receiver", index, stream.file_id);
    }

    if (auto marked = buffer_.mark_uploaded(chunk.value()->id); marked.is_error()) {
        // The receiver's ledger is authoritative; the next resume will skip this chunk anyway.
        spdlog::warn("Chunk {} of {} acknowledged but not marked uploaded: {}",
                     index, stream.file_id, marked.error().message);
    }
    return Ok();
}

Result<void> UploadOrchestrator::send_missing(Stream& stream,
                                              const std::vector<std::uint32_t>& indices,
                                              UploadReport& report) {
    std::atomic<std::uint32_t> attempts{0};
    std::atomic<std::uint32_t> uploaded{0};

    const auto settle = [&] {
        report.attempts += attempts.load();
        report.uploaded += uploaded.load();
    };

    if (options_.max_in_flight == 1 || indices.size() <= 1) {
        for (const auto index : indices) {
            if (cancelled()) {
                settle();
                return Err<void>(ErrorCode::Cancelled, "Upload of " + stream.file_id + " cancelled");
            }
            auto sent = send_chunk(stream, index, attempts);
            if (sent.is_error()) {
                settle();
                return sent;
            }
            uploaded++;
        }
        settle();
        return Ok();
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::mutex error_mutex;
    std::optional<Error> first_error;

    const auto record_error = [&](Error error) {
        std::lock_guard lock(error_mutex);
        if (!first_error) {
            first_error = std::move(error);
        }
        stop = true;
    };

    const auto worker = [&] {
        while (!stop) {
            if (cancelled()) {
                record_error(Error(ErrorCode::Cancelled, "Upload of " + stream.file_id + " cancelled"));
                return;
            }
            const std::size_t slot = next.fetch_add(1);
            if (slot >= indices.size()) {
                return;
            }
            auto sent = send_chunk(stream, indices[slot], attempts);
            if (sent.is_error()) {
                record_error(sent.error());
                return;
            }
            uploaded++;
        }
    };

    const std::size_t worker_count = std::min(options_.max_in_flight, indices.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    settle();
    if (first_error) {
        return Err<void>(*first_error);
    }
    return Ok();
}

Result<std::optional<std::string>> UploadOrchestrator::buffered_digest(const std::string& file_id,
                                                                      std::uint32_t total) const {
    using MaybeDigest = std::optional<std::string>;

    Sha256 hasher;
    for (std::uint32_t index = 0; index < total; ++index) {
        auto chunk = buffer_.get_chunk(ChunkId{file_id, index});
        if (chunk.is_error()) {
            return Err<MaybeDigest>(chunk.error());
        }
        if (!chunk.value()) {
            return Ok(MaybeDigest{});
        }
        const Bytes& payload = chunk.value()->payload;
        hasher.update(payload.data(), payload.size());
    }

    auto digest = hasher.finish_hex();
    if (digest.is_error()) {
        return Err<MaybeDigest>(digest.error());
    }
    return Ok(MaybeDigest(std::move(digest.value())));
}

Result<UploadOrchestrator::Stream> UploadOrchestrator::open_stream(const std::string& file_id,
                                                                   const std::string& file_key,
                                                                   const crypto::PublicKey& receiver_key) {
    auto fresh = crypto::wrap_new_session_key(receiver_key);
    if (fresh.is_error()) {
        return Err<Stream>(fresh.error());
    }
    auto session_bytes = random_bytes(16);
    if (session_bytes.is_error()) {
        return Err<Stream>(session_bytes.error());
    }

    const std::string session_id = hex_encode(session_bytes.value());
    return Ok(Stream{file_id,
                     file_key,
                     session_id,
                     std::move(fresh.value().key),
                     std::move(fresh.value().wrapped),
                     crypto::build_associated_data(session_id, file_key)});
}

Result<FinalizedFile> UploadOrchestrator::deliver(Stream& stream, std::uint32_t total, UploadReport& report) {
    const std::string& file_id = stream.file_id;

    // Indices uploaded or skipped earlier in this pass, so a second round does not count them twice.
    std::vector<bool> handled(total, false);

    for (std::uint32_t round = 1;; ++round) {
        report.finalize_rounds = round;

        const auto received_list = resolve_received(stream.file_key);
        const std::unordered_set<std::uint32_t> received(received_list.begin(), received_list.end());

        std::vector<std::uint32_t> missing;
        for (std::uint32_t index = 0; index < total; ++index) {
            if (received.count(index) == 0) {
                missing.push_back(index);
                continue;
            }
            if (handled[index]) {
                continue;
            }
            handled[index] = true;
            report.skipped++;
            auto marked = buffer_.mark_uploaded(ChunkId{file_id, index});
            if (marked.is_error() && marked.error().code != ErrorCode::NotFound) {
                spdlog::warn("Could not mark skipped chunk {} of {}: {}", index, file_id, marked.error().message);
            }
        }

        if (!received.empty()) {
            spdlog::info("Resuming {}: receiver holds {} of {} chunk(s)", file_id, total - missing.size(), total);
        }

        const auto uploaded_before = report.uploaded;
        if (auto sent = send_missing(stream, missing, report); sent.is_error()) {
            return Err<FinalizedFile>(sent.error());
        }
        for (const auto index : missing) {
            handled[index] = true;
        }
        spdlog::debug("Round {} sent {} chunk(s) of {}", round, report.uploaded - uploaded_before, file_id);

        auto done = with_retry<FinalizedFile>("finalize", [&] {
            return transport_.finalize(stream.file_key, total, stream.session_id);
        }, nullptr);
        if (done.is_ok()) {
            return done;
        }
        if (done.error().code != ErrorCode::IncompleteTransfer || round >= options_.max_finalize_rounds) {
            return done;
        }
        spdlog::warn("Finalize of {} reported missing chunks, re-resolving: {}", file_id, done.error().message);
    }
}

Result<UploadReport> UploadOrchestrator::upload_file(const std::string& file_id) {
    constexpr std::uint32_t kMaxPasses = 2;

    if (cancelled()) {
        return Err<UploadReport>(ErrorCode::Cancelled, "Upload of " + file_id + " cancelled");
    }

    auto manifest = buffer_.manifest(file_id);
    if (manifest.is_error()) {
        return Err<UploadReport>(manifest.error());
    }
    if (!manifest.value()) {
        return Err<UploadReport>(ErrorCode::NotFound, file_id + " is not buffered");
    }
    const std::uint32_t total = manifest.value()->total_chunks;

    auto file_key = ChunkLedger::file_key_for(file_id);
    if (file_key.is_error()) {
        return Err<UploadReport>(file_key.error());
    }

    auto expected = buffered_digest(file_id, total);
    if (expected.is_error()) {
        return Err<UploadReport>(expected.error());
    }
    if (!expected.value()) {
        spdlog::warn("{} is no longer fully buffered; the receiver's copy cannot be verified", file_id);
    }

    UploadReport report;
    report.file_id = file_id;
    report.file_key = file_key.value();
    report.total_chunks = total;

    auto receiver_key = with_retry<crypto::CachedPublicKey>("public key fetch", [this] {
        return key_cache_.get([this] { return transport_.fetch_public_key(); });
    }, nullptr);
    if (receiver_key.is_error()) {
        return Err<UploadReport>(receiver_key.error());
    }

    std::optional<FinalizedFile> finalized;
    for (std::uint32_t pass = 1; !finalized; ++pass) {
        report.passes = pass;

        auto stream = open_stream(file_id, report.file_key, receiver_key.value().public_key);
        if (stream.is_error()) {
            return Err<UploadReport>(stream.error());
        }
        spdlog::info("Uploading {} ({} chunk(s)) in session {}", file_id, total, stream.value().session_id);

        auto done = deliver(stream.value(), total, report);
        if (done.is_error()) {
            return Err<UploadReport>(done.error());
        }

        const auto& digest = expected.value();
        if (!digest || done.value().sha256 == *digest) {
            finalized = std::move(done.value());
            break;
        }

        if (pass >= kMaxPasses) {
            return Err<UploadReport>(ErrorCode::ContentMismatch,
                "Receiver assembled " + report.file_key + " with sha256 " + done.value().sha256
                + ", expected " + *digest);
        }

        spdlog::warn("Receiver's {} hashes to {} instead of {}; discarding it and uploading again",
                     report.file_key, done.value().sha256, *digest);
        auto discarded = with_retry<void>("discard", [&] {
            return transport_.discard(report.file_key);
        }, nullptr);
        if (discarded.is_error()) {
            return Err<UploadReport>(discarded.error());
        }

        // Nothing from the discarded pass survives on the receiver.
        report.uploaded = 0;
        report.skipped = 0;
        report.finalize_rounds = 0;
    }

    report.stored_name = finalized->file_key;
    report.total_bytes = finalized->total_bytes;
    report.sha256 = finalized->sha256;

    if (auto purged = buffer_.purge_uploaded(file_id); purged.is_error()) {
        spdlog::error("Upload of {} finished but purging the buffer failed: {}", file_id, purged.error().message);
    } else if (auto removed = buffer_.remove_manifest(file_id); removed.is_error()) {
        spdlog::error("Upload of {} finished but its manifest could not be removed: {}",
                      file_id, removed.error().message);
    }

    spdlog::info("Upload complete for {} as {}: {} sent, {} skipped, {} attempt(s), sha256={}",
                 file_id, report.stored_name, report.uploaded, report.skipped, report.attempts, report.sha256);
    return Ok(std::move(report));
}

Result<UploadOrchestrator::FileResults> UploadOrchestrator::upload_all() {
    auto files = buffer_.buffered_files();
    if (files.is_error()) {
        return Err<FileResults>(files.error());
    }
    if (files.value().empty()) {
        spdlog::info("No buffered files to upload");
    }

    FileResults results;
    for (const auto& manifest : files.value()) {
        if (cancelled()) {
            results.emplace_back(manifest.file_id,
                Err<UploadReport>(ErrorCode::Cancelled, "Upload of " + manifest.file_id + " cancelled"));
            continue;
        }
        auto result = upload_file(manifest.file_id);
        if (result.is_error()) {
            spdlog::error("Upload of {} failed: {}", manifest.file_id, result.error().describe());
        }
        results.emplace_back(manifest.file_id, std::move(result));
    }
    return Ok(std::move(results));
}

} // namespace ixcp::transfer
