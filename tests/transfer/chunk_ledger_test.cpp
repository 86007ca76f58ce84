#include "ixcp/events/components.hpp"
#include "ixcp/events/event_bus.hpp"
#include "ixcp/storage/memory_store.hpp"
#include "ixcp/transfer/chunk_ledger.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using ixcp::Bytes;
using ixcp::ErrorCode;
using ixcp::transfer::AcceptOutcome;
using ixcp::transfer::ChunkLedger;

namespace {

class ChunkLedgerTest : public ::testing::Test {
protected:
    ixcp::test::TempDir output_{"ixcp_ledger"};
    ixcp::storage::MemoryStore store_;
    ixcp::events::EventBus bus_;
    ixcp::events::MetricsComponent metrics_{bus_};
    ChunkLedger ledger_{store_, output_.path(), &bus_};
};

} // namespace

TEST(ChunkLedgerFileKeyTest, KeepsBasenameOnly) {
    EXPECT_EQ(ChunkLedger::file_key_for("report.pdf").value(), "report.pdf");
    EXPECT_EQ(ChunkLedger::file_key_for("/home/user/report.pdf").value(), "report.pdf");
    EXPECT_EQ(ChunkLedger::file_key_for("..\\..\\evil.exe").value(), "evil.exe");

    for (const char* bad : {"", ".", "..", "dir/", "../.."}) {
        auto key = ChunkLedger::file_key_for(bad);
        ASSERT_TRUE(key.is_error()) << bad;
        EXPECT_EQ(key.error().code, ErrorCode::InvalidArgument);
    }
    EXPECT_TRUE(ChunkLedger::file_key_for(std::string("a\x1f" "b")).is_error());
}

TEST_F(ChunkLedgerTest, AcceptIsIdempotent) {
    auto first = ledger_.accept("a.bin", 0, ixcp::to_bytes("payload"));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), AcceptOutcome::Accepted);

    auto second = ledger_.accept("a.bin", 0, ixcp::to_bytes("different"));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value(), AcceptOutcome::Duplicate);

    EXPECT_EQ(store_.size(ChunkLedger::kLedgerTable), 1u);
    EXPECT_EQ(*store_.get(ChunkLedger::kPayloadsTable, ixcp::storage::composite_key("a.bin", 0)).value(),
              "payload");

    const auto& stats = metrics_.get_stats();
    EXPECT_EQ(stats.chunks_accepted.load(), 1u);
    EXPECT_EQ(stats.chunks_duplicate.load(), 1u);
}

TEST_F(ChunkLedgerTest, ConcurrentDeliveriesRecordOnce) {
    std::atomic<int> accepted{0};
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto outcome = ledger_.accept("a.bin", 5, Bytes(16, 1));
            ASSERT_TRUE(outcome.is_ok());
            if (outcome.value() == AcceptOutcome::Accepted) {
                accepted++;
            } else {
                duplicates++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(duplicates.load(), 7);
}

TEST_F(ChunkLedgerTest, StatusAndMissingChunks) {
    for (std::uint32_t index : {4u, 0u, 2u}) {
        ASSERT_TRUE(ledger_.accept("a.bin", index, Bytes(1, 0)).is_ok());
    }

    auto status = ledger_.status_of("a.bin");
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value(), (std::vector<std::uint32_t>{0, 2, 4}));

    auto missing = ledger_.missing_chunks("a.bin", 6);
    ASSERT_TRUE(missing.is_ok());
    EXPECT_EQ(missing.value(), (std::vector<std::uint32_t>{1, 3, 5}));

    EXPECT_TRUE(ledger_.status_of("unknown.bin").value().empty());
}

TEST_F(ChunkLedgerTest, FinalizeRefusesIncompleteSet) {
    ASSERT_TRUE(ledger_.accept("a.bin", 0, Bytes(1, 0)).is_ok());
    ASSERT_TRUE(ledger_.accept("a.bin", 2, Bytes(1, 0)).is_ok());

    auto finalized = ledger_.finalize("a.bin", 3);
    ASSERT_TRUE(finalized.is_error());
    EXPECT_EQ(finalized.error().code, ErrorCode::IncompleteTransfer);
    EXPECT_FALSE(std::filesystem::exists(output_ / "a.bin"));

    // More indices than expected is not a match either
    ASSERT_TRUE(ledger_.accept("a.bin", 1, Bytes(1, 0)).is_ok());
    auto too_few_expected = ledger_.finalize("a.bin", 2);
    ASSERT_TRUE(too_few_expected.is_error());
    EXPECT_EQ(too_few_expected.error().code, ErrorCode::IncompleteTransfer);
}

TEST_F(ChunkLedgerTest, FinalizeAssemblesInIndexOrder) {
    const Bytes content = ixcp::test::pattern_bytes(3000, 17);
    const std::vector<std::pair<std::uint32_t, std::pair<std::size_t, std::size_t>>> slices{
        {2, {2048, 3000}}, {0, {0, 1024}}, {1, {1024, 2048}}};

    for (const auto& [index, range] : slices) {
        Bytes part(content.begin() + static_cast<std::ptrdiff_t>(range.first),
                   content.begin() + static_cast<std::ptrdiff_t>(range.second));
        ASSERT_TRUE(ledger_.accept("joined.bin", index, part).is_ok());
    }

    auto finalized = ledger_.finalize("joined.bin", 3);
    ASSERT_TRUE(finalized.is_ok()) << finalized.error().describe();

    const auto& file = finalized.value();
    EXPECT_EQ(file.file_key, "joined.bin");
    EXPECT_EQ(file.chunk_count, 3u);
    EXPECT_EQ(file.total_bytes, content.size());
    EXPECT_EQ(file.sha256, ixcp::sha256_hex(content).value());

    EXPECT_EQ(ixcp::test::read_file(output_ / "joined.bin"), content);
    EXPECT_FALSE(std::filesystem::exists(output_ / ".joined.bin.partial"));

    auto completion = ledger_.completion("joined.bin");
    ASSERT_TRUE(completion.is_ok());
    ASSERT_TRUE(completion.value().has_value());
    EXPECT_EQ(completion.value()->sha256, file.sha256);

    EXPECT_EQ(metrics_.get_stats().files_finalized.load(), 1u);
}

TEST_F(ChunkLedgerTest, FinalizeTwiceReturnsStoredRecord) {
    ASSERT_TRUE(ledger_.accept("a.bin", 0, ixcp::to_bytes("only")).is_ok());

    auto first = ledger_.finalize("a.bin", 1);
    ASSERT_TRUE(first.is_ok());
    auto second = ledger_.finalize("a.bin", 1);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().sha256, first.value().sha256);
    EXPECT_EQ(metrics_.get_stats().files_finalized.load(), 1u);
}

TEST_F(ChunkLedgerTest, FinalizeEmptyFile) {
    auto finalized = ledger_.finalize("empty.bin", 0);
    ASSERT_TRUE(finalized.is_ok());
    EXPECT_EQ(finalized.value().total_bytes, 0u);
    EXPECT_EQ(finalized.value().sha256, ixcp::sha256_hex(Bytes{}).value());
    ASSERT_TRUE(std::filesystem::exists(output_ / "empty.bin"));
    EXPECT_EQ(std::filesystem::file_size(output_ / "empty.bin"), 0u);
}

TEST_F(ChunkLedgerTest, CleanupForgetsFile) {
    ASSERT_TRUE(ledger_.accept("a.bin", 0, Bytes(1, 0)).is_ok());
    ASSERT_TRUE(ledger_.finalize("a.bin", 1).is_ok());
    ASSERT_TRUE(ledger_.accept("b.bin", 0, Bytes(1, 0)).is_ok());

    ASSERT_TRUE(ledger_.cleanup("a.bin").is_ok());

    EXPECT_TRUE(ledger_.status_of("a.bin").value().empty());
    EXPECT_FALSE(ledger_.completion("a.bin").value().has_value());
    EXPECT_EQ(ledger_.status_of("b.bin").value().size(), 1u);

    auto accepted = ledger_.accept("a.bin", 0, Bytes(1, 0));
    ASSERT_TRUE(accepted.is_ok());
    EXPECT_EQ(accepted.value(), AcceptOutcome::Accepted);
}
