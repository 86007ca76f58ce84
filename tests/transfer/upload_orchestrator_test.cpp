#include "ixcp/crypto/key_cache.hpp"
#include "ixcp/storage/memory_store.hpp"
#include "ixcp/transfer/chunk_buffer.hpp"
#include "ixcp/transfer/upload_orchestrator.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

using ixcp::Bytes;
using ixcp::Err;
using ixcp::Error;
using ixcp::ErrorCode;
using ixcp::Ok;
using ixcp::Result;
using namespace ixcp::transfer;

namespace {

/**
 * Receiver stand-in. Every call is counted; failures are scripted per
 * chunk index as a queue of errors returned before the call succeeds.
 * finalize() reports the digest registered for the file, or the next
 * entry of stale_digests while any are left.
 */
class FakeTransport : public UploadTransport {
public:
    Result<ixcp::crypto::PublicKeyRecord> fetch_public_key() override {
        std::lock_guard lock(mutex_);
        ++key_fetches;
        const auto& pair = ixcp::test::shared_key_pair();
        auto pem = pair.public_key().to_pem();
        if (pem.is_error()) {
            return Err<ixcp::crypto::PublicKeyRecord>(pem.error());
        }
        return Ok(ixcp::crypto::PublicKeyRecord{pair.key_id(), pem.value()});
    }

    Result<ChunkAck> upload_chunk(const EncryptedPacket& packet) override {
        std::function<void(std::uint32_t)> hook;
        {
            std::lock_guard lock(mutex_);
            ++upload_calls;
            sessions.insert(packet.session_id);
            auto& script = failures[packet.sequence_index];
            if (!script.empty()) {
                Error error = script.front();
                script.erase(script.begin());
                return Err<ChunkAck>(error);
            }
            delivered.push_back(packet.sequence_index);
            hook = after_delivery;
        }
        if (hook) {
            hook(packet.sequence_index);
        }

        ChunkAck ack;
        ack.file_key = packet.file_name;
        ack.client_file_name = packet.file_name;
        ack.chunk_index = packet.sequence_index;
        return Ok(ack);
    }

    Result<std::vector<std::uint32_t>> query_status(const std::string&) override {
        std::lock_guard lock(mutex_);
        ++status_calls;
        if (status_error) {
            return Err<std::vector<std::uint32_t>>(*status_error);
        }
        if (!status_script.empty()) {
            auto next = status_script.front();
            status_script.erase(status_script.begin());
            return Ok(next);
        }
        return Ok(already_received);
    }

    Result<FinalizedFile> finalize(const std::string& file_key,
                                   std::uint32_t total_chunks,
                                   const std::string&) override {
        std::lock_guard lock(mutex_);
        ++finalize_calls;
        finalized_total = total_chunks;
        if (!finalize_failures.empty()) {
            Error error = finalize_failures.front();
            finalize_failures.erase(finalize_failures.begin());
            return Err<FinalizedFile>(error);
        }
        std::string digest = digests[file_key];
        if (!stale_digests.empty()) {
            digest = stale_digests.front();
            stale_digests.erase(stale_digests.begin());
        }
        return Ok(FinalizedFile{file_key, total_chunks, 0, digest});
    }

    Result<void> discard(const std::string& file_key) override {
        std::lock_guard lock(mutex_);
        discarded.push_back(file_key);
        already_received.clear();
        return Ok();
    }

    std::mutex mutex_;
    int key_fetches = 0;
    int upload_calls = 0;
    int status_calls = 0;
    int finalize_calls = 0;
    std::uint32_t finalized_total = 0;
    std::vector<std::uint32_t> delivered;
    std::set<std::string> sessions;
    std::map<std::uint32_t, std::vector<Error>> failures;
    std::vector<std::uint32_t> already_received;
    std::vector<std::vector<std::uint32_t>> status_script;
    std::optional<Error> status_error;
    std::vector<Error> finalize_failures;
    std::map<std::string, std::string> digests;
    std::vector<std::string> stale_digests;
    std::vector<std::string> discarded;
    std::function<void(std::uint32_t)> after_delivery;
};

Error transient() {
    return Error(ErrorCode::TransientTransport, "connection reset");
}

std::vector<std::uint32_t> range(std::uint32_t from, std::uint32_t to) {
    std::vector<std::uint32_t> out;
    for (std::uint32_t i = from; i < to; ++i) {
        out.push_back(i);
    }
    return out;
}

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void buffer_chunks(const std::string& file_id, std::uint32_t count) {
        Bytes content;
        for (std::uint32_t index = 0; index < count; ++index) {
            const Bytes payload(64, static_cast<std::uint8_t>(index));
            ASSERT_TRUE(buffer_.enqueue(file_id, index, payload).is_ok());
            content.insert(content.end(), payload.begin(), payload.end());
        }
        transport_.digests[file_id] = ixcp::sha256_hex(content).value();
    }

    OrchestratorOptions options() {
        OrchestratorOptions opts;
        opts.retry.max_attempts = 3;
        opts.retry.initial_delay = std::chrono::milliseconds(1000);
        opts.sleeper = [this](std::chrono::milliseconds delay) { sleeps_.push_back(delay); };
        return opts;
    }

    std::vector<std::uint32_t> delivered_sorted() {
        auto out = transport_.delivered;
        std::sort(out.begin(), out.end());
        return out;
    }

    ixcp::storage::MemoryStore store_;
    ChunkBuffer buffer_{store_};
    FakeTransport transport_;
    ixcp::crypto::PublicKeyCache key_cache_{std::chrono::seconds(3600)};
    std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace

TEST(RetryPolicyTest, DelayDoublesPerAttempt) {
    RetryPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(1000);
    EXPECT_EQ(policy.delay_after(1), std::chrono::milliseconds(1000));
    EXPECT_EQ(policy.delay_after(2), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.delay_after(3), std::chrono::milliseconds(4000));
}

TEST_F(UploadOrchestratorTest, ResumeSendsOnlyMissingChunks) {
    buffer_chunks("big.bin", 15);
    transport_.already_received = range(0, 8);

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("big.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();

    EXPECT_EQ(transport_.delivered, range(8, 15));
    EXPECT_EQ(report.value().uploaded, 7u);
    EXPECT_EQ(report.value().skipped, 8u);
    EXPECT_EQ(report.value().attempts, 7u);
    EXPECT_EQ(report.value().total_chunks, 15u);
    EXPECT_EQ(transport_.finalized_total, 15u);

    EXPECT_EQ(buffer_.chunk_count("big.bin").value(), 0u);
    EXPECT_FALSE(buffer_.manifest("big.bin").value().has_value());
}

TEST_F(UploadOrchestratorTest, TransientFailuresBackOffExponentially) {
    buffer_chunks("a.bin", 3);
    transport_.failures[1] = {transient(), transient()};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();

    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{
        std::chrono::milliseconds(1000), std::chrono::milliseconds(2000)}));
    EXPECT_EQ(report.value().attempts, 5u);
    EXPECT_EQ(report.value().uploaded, 3u);
    EXPECT_EQ(transport_.delivered, range(0, 3));
}

TEST_F(UploadOrchestratorTest, ExhaustedRetriesKeepBufferForResume) {
    buffer_chunks("a.bin", 3);
    transport_.failures[1] = {transient(), transient(), transient()};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::TransientTransport);
    EXPECT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(transport_.finalize_calls, 0);

    auto pending = buffer_.list_pending("a.bin");
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 2u);
    EXPECT_EQ(pending.value().front().sequence_index(), 1u);
    EXPECT_TRUE(buffer_.manifest("a.bin").value().has_value());

    // Receiver kept chunk 0; a second run picks up from chunk 1.
    transport_.already_received = {0};
    transport_.delivered.clear();
    auto resumed = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().describe();
    EXPECT_EQ(transport_.delivered, range(1, 3));
    EXPECT_EQ(transport_.sessions.size(), 2u);
}

TEST_F(UploadOrchestratorTest, FatalErrorsAreNotRetried) {
    buffer_chunks("a.bin", 2);
    transport_.failures[0] = {Error(ErrorCode::PayloadRejected, "HTTP 422: bad tag")};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::PayloadRejected);
    EXPECT_EQ(transport_.upload_calls, 1);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_FALSE(key_cache_.peek().has_value());
}

TEST_F(UploadOrchestratorTest, RejectedApiKeyStopsTheFile) {
    buffer_chunks("a.bin", 2);
    transport_.failures[0] = {Error(ErrorCode::AuthenticationRejected, "HTTP 401")};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::AuthenticationRejected);
    EXPECT_EQ(transport_.upload_calls, 1);
    EXPECT_EQ(buffer_.list_pending("a.bin").value().size(), 2u);
}

TEST_F(UploadOrchestratorTest, StatusFailureFallsBackToFullUpload) {
    buffer_chunks("a.bin", 4);
    transport_.status_error = transient();

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(transport_.delivered, range(0, 4));
    EXPECT_EQ(report.value().skipped, 0u);
}

TEST_F(UploadOrchestratorTest, EmptyFileFinalizesWithoutUploads) {
    ixcp::test::TempDir dir("ixcp_orchestrator");
    ixcp::test::write_file(dir / "empty.bin", Bytes{});
    ASSERT_TRUE(buffer_.add_file(dir / "empty.bin", 1024).is_ok());
    transport_.digests["empty.bin"] = ixcp::sha256_hex(Bytes{}).value();

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("empty.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(transport_.upload_calls, 0);
    EXPECT_EQ(transport_.finalize_calls, 1);
    EXPECT_EQ(transport_.finalized_total, 0u);
    EXPECT_FALSE(buffer_.manifest("empty.bin").value().has_value());
}

TEST_F(UploadOrchestratorTest, IncompleteFinalizeTriggersAnotherRound) {
    buffer_chunks("a.bin", 3);
    // The receiver lost chunk 2 between the upload and the finalize.
    transport_.status_script = {{}, {0, 1}};
    transport_.finalize_failures = {Error(ErrorCode::IncompleteTransfer, "HTTP 409: missing 2")};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(report.value().finalize_rounds, 2u);
    EXPECT_EQ(transport_.delivered, (std::vector<std::uint32_t>{0, 1, 2, 2}));
    EXPECT_EQ(report.value().uploaded, 4u);
    EXPECT_EQ(report.value().skipped, 0u);
    EXPECT_EQ(transport_.finalize_calls, 2);
}

TEST_F(UploadOrchestratorTest, FinalizeGivesUpAfterConfiguredRounds) {
    buffer_chunks("a.bin", 1);
    transport_.finalize_failures = {Error(ErrorCode::IncompleteTransfer, "missing"),
                                    Error(ErrorCode::IncompleteTransfer, "missing")};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::IncompleteTransfer);
    EXPECT_EQ(transport_.finalize_calls, 2);
    EXPECT_TRUE(buffer_.manifest("a.bin").value().has_value());
}

TEST_F(UploadOrchestratorTest, CancellationStopsBetweenChunks) {
    buffer_chunks("a.bin", 5);
    auto token = std::make_shared<CancellationToken>();
    transport_.after_delivery = [token](std::uint32_t index) {
        if (index == 1) {
            token->cancel();
        }
    };

    auto opts = options();
    opts.cancellation = token;
    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, opts);
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(transport_.delivered, range(0, 2));
    EXPECT_EQ(buffer_.list_pending("a.bin").value().size(), 3u);

    auto again = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::Cancelled);
}

TEST_F(UploadOrchestratorTest, ParallelUploadsSendEachChunkOnce) {
    buffer_chunks("a.bin", 20);
    transport_.failures[7] = {transient()};

    auto opts = options();
    opts.max_in_flight = 4;
    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, opts);
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();

    EXPECT_EQ(delivered_sorted(), range(0, 20));
    EXPECT_EQ(report.value().uploaded, 20u);
    EXPECT_EQ(report.value().attempts, 21u);
    EXPECT_EQ(transport_.sessions.size(), 1u);
}

TEST_F(UploadOrchestratorTest, UnknownFileIsNotFound) {
    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("missing.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::NotFound);
    EXPECT_EQ(transport_.key_fetches, 0);
}

TEST_F(UploadOrchestratorTest, UploadAllReportsEachFileIndependently) {
    buffer_chunks("good.bin", 2);
    ASSERT_TRUE(buffer_.enqueue("bad.bin", 0, Bytes(8, 1)).is_ok());

    // bad.bin sorts first; its only chunk is refused outright.
    transport_.failures[0] = {Error(ErrorCode::PayloadRejected, "refused")};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto results = orchestrator.upload_all();
    ASSERT_TRUE(results.is_ok());
    ASSERT_EQ(results.value().size(), 2u);

    std::map<std::string, bool> ok;
    for (const auto& [file_id, result] : results.value()) {
        ok[file_id] = result.is_ok();
    }
    EXPECT_FALSE(ok["bad.bin"]);
    EXPECT_TRUE(ok["good.bin"]);
    EXPECT_EQ(transport_.key_fetches, 2);
}

TEST_F(UploadOrchestratorTest, StaleReceiverCopyIsDiscardedAndResent) {
    buffer_chunks("a.bin", 4);
    // Chunks 0..2 belong to an older a.bin the receiver still holds.
    transport_.already_received = range(0, 3);
    transport_.stale_digests = {"0ld"};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_ok()) << report.error().describe();

    EXPECT_EQ(transport_.discarded, (std::vector<std::string>{"a.bin"}));
    EXPECT_EQ(transport_.delivered, (std::vector<std::uint32_t>{3, 0, 1, 2, 3}));
    EXPECT_EQ(transport_.sessions.size(), 2u);
    EXPECT_EQ(transport_.finalize_calls, 2);

    EXPECT_EQ(report.value().passes, 2u);
    EXPECT_EQ(report.value().uploaded, 4u);
    EXPECT_EQ(report.value().skipped, 0u);
    EXPECT_EQ(report.value().attempts, 5u);
    EXPECT_EQ(report.value().sha256, transport_.digests["a.bin"]);
    EXPECT_EQ(report.value().stored_name, "a.bin");
    EXPECT_FALSE(buffer_.manifest("a.bin").value().has_value());
}

TEST_F(UploadOrchestratorTest, PersistentMismatchFailsAndKeepsBuffer) {
    buffer_chunks("a.bin", 2);
    transport_.stale_digests = {"bad", "still-bad"};

    UploadOrchestrator orchestrator(buffer_, transport_, key_cache_, options());
    auto report = orchestrator.upload_file("a.bin");
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::ContentMismatch);
    EXPECT_EQ(transport_.discarded.size(), 1u);
    EXPECT_EQ(transport_.finalize_calls, 2);
    EXPECT_TRUE(buffer_.manifest("a.bin").value().has_value());
    EXPECT_EQ(buffer_.chunk_count("a.bin").value(), 2u);
}
