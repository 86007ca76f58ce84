#include "ixcp/storage/kv_store.hpp"
#include "ixcp/storage/store_factory.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

using ixcp::storage::KeyValueStore;
using ixcp::storage::StorageMode;
using ixcp::storage::WriteBatch;
using ixcp::storage::composite_key;
using ixcp::storage::key_prefix;

namespace {

class KeyValueStoreTest : public ::testing::TestWithParam<StorageMode> {
protected:
    void SetUp() override {
        dir_ = std::make_unique<ixcp::test::TempDir>("ixcp_kv");
        store_ = open();
        ASSERT_NE(store_, nullptr);
    }

    std::unique_ptr<KeyValueStore> open() {
        auto store = ixcp::storage::open_store(GetParam(), dir_->path(), "test");
        if (store.is_error()) {
            ADD_FAILURE() << store.error().describe();
            return nullptr;
        }
        return std::move(store.value());
    }

    bool durable() const { return GetParam() != StorageMode::Memory; }

    std::unique_ptr<ixcp::test::TempDir> dir_;
    std::unique_ptr<KeyValueStore> store_;
};

} // namespace

TEST_P(KeyValueStoreTest, PutGetRemove) {
    ASSERT_TRUE(store_->put("t", "alpha", "one").is_ok());

    auto value = store_->get("t", "alpha");
    ASSERT_TRUE(value.is_ok());
    ASSERT_TRUE(value.value().has_value());
    EXPECT_EQ(*value.value(), "one");

    auto missing = store_->get("t", "beta");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().has_value());

    auto other_table = store_->get("u", "alpha");
    ASSERT_TRUE(other_table.is_ok());
    EXPECT_FALSE(other_table.value().has_value());

    ASSERT_TRUE(store_->remove("t", "alpha").is_ok());
    EXPECT_FALSE(store_->get("t", "alpha").value().has_value());
    EXPECT_TRUE(store_->remove("t", "alpha").is_ok());
}

TEST_P(KeyValueStoreTest, BinaryValuesSurvive) {
    std::string binary("\x00\x01\xff\x1f payload", 12);
    ASSERT_TRUE(store_->put("blobs", "k", binary).is_ok());
    ASSERT_TRUE(store_->put("blobs", "empty", std::string{}).is_ok());

    EXPECT_EQ(*store_->get("blobs", "k").value(), binary);

    auto empty = store_->get("blobs", "empty");
    ASSERT_TRUE(empty.is_ok());
    ASSERT_TRUE(empty.value().has_value());
    EXPECT_TRUE(empty.value()->empty());
}

TEST_P(KeyValueStoreTest, ScanReturnsPrefixInIndexOrder) {
    for (std::uint32_t index : {10u, 2u, 0u, 1u}) {
        ASSERT_TRUE(store_->put("chunks", composite_key("a.bin", index), std::to_string(index)).is_ok());
    }
    ASSERT_TRUE(store_->put("chunks", composite_key("a.bin.old", 5), "x").is_ok());
    ASSERT_TRUE(store_->put("chunks", composite_key("b.bin", 0), "y").is_ok());

    auto entries = store_->scan("chunks", key_prefix("a.bin"));
    ASSERT_TRUE(entries.is_ok());
    ASSERT_EQ(entries.value().size(), 4u);

    std::vector<std::uint32_t> indices;
    for (const auto& [key, value] : entries.value()) {
        auto parts = ixcp::storage::split_composite_key(key);
        ASSERT_TRUE(parts.is_ok());
        EXPECT_EQ(parts.value().first, "a.bin");
        indices.push_back(parts.value().second);
    }
    EXPECT_EQ(indices, (std::vector<std::uint32_t>{0, 1, 2, 10}));

    auto all = store_->scan("chunks", "");
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value().size(), 6u);
}

TEST_P(KeyValueStoreTest, BatchAppliesPutsAndDeletesTogether) {
    ASSERT_TRUE(store_->put("meta", "stale", "1").is_ok());

    WriteBatch batch;
    batch.put("meta", "a", "meta-a");
    batch.put("payload", "a", "payload-a");
    batch.remove("meta", "stale");
    ASSERT_TRUE(store_->apply(batch).is_ok());

    EXPECT_EQ(*store_->get("meta", "a").value(), "meta-a");
    EXPECT_EQ(*store_->get("payload", "a").value(), "payload-a");
    EXPECT_FALSE(store_->get("meta", "stale").value().has_value());
}

TEST_P(KeyValueStoreTest, ClearEmptiesOneTable) {
    ASSERT_TRUE(store_->put("a", "k1", "v").is_ok());
    ASSERT_TRUE(store_->put("a", "k2", "v").is_ok());
    ASSERT_TRUE(store_->put("b", "k1", "v").is_ok());

    ASSERT_TRUE(store_->clear("a").is_ok());

    EXPECT_TRUE(store_->scan("a", "").value().empty());
    EXPECT_EQ(store_->scan("b", "").value().size(), 1u);
}

TEST_P(KeyValueStoreTest, ContentsSurviveReopen) {
    if (!durable()) {
        GTEST_SKIP() << "memory store is not durable";
    }

    WriteBatch batch;
    batch.put("ledger", composite_key("f", 0), "entry");
    batch.put("ledger_payloads", composite_key("f", 0), std::string("\x00\x02", 2));
    ASSERT_TRUE(store_->apply(batch).is_ok());

    store_.reset();
    store_ = open();
    ASSERT_NE(store_, nullptr);

    EXPECT_EQ(*store_->get("ledger", composite_key("f", 0)).value(), "entry");
    EXPECT_EQ(*store_->get("ledger_payloads", composite_key("f", 0)).value(), std::string("\x00\x02", 2));
}

TEST_P(KeyValueStoreTest, ConcurrentWritersDoNotLoseUpdates) {
    std::vector<std::thread> threads;
    for (std::uint32_t t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (std::uint32_t i = 0; i < 10; ++i) {
                WriteBatch batch;
                batch.put("c", composite_key("f" + std::to_string(t), i), "m");
                batch.put("p", composite_key("f" + std::to_string(t), i), "p");
                EXPECT_TRUE(store_->apply(batch).is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store_->scan("c", "").value().size(), 40u);
    EXPECT_EQ(store_->scan("p", "").value().size(), 40u);
}

INSTANTIATE_TEST_SUITE_P(Backends, KeyValueStoreTest,
                         ::testing::Values(StorageMode::Memory, StorageMode::Json, StorageMode::Sqlite),
                         [](const ::testing::TestParamInfo<StorageMode>& info) {
                             return std::string(ixcp::storage::to_string(info.param));
                         });

TEST(CompositeKeyTest, SplitRejectsForeignKeys) {
    auto parts = ixcp::storage::split_composite_key(composite_key("report.pdf", 42));
    ASSERT_TRUE(parts.is_ok());
    EXPECT_EQ(parts.value().first, "report.pdf");
    EXPECT_EQ(parts.value().second, 42u);

    EXPECT_TRUE(ixcp::storage::split_composite_key("plain").is_error());
    EXPECT_TRUE(ixcp::storage::split_composite_key(key_prefix("f") + "12345abcde").is_error());

    EXPECT_TRUE(ixcp::storage::is_valid_key_component("report.pdf"));
    EXPECT_FALSE(ixcp::storage::is_valid_key_component(""));
    EXPECT_FALSE(ixcp::storage::is_valid_key_component(std::string("a\x1f" "b")));
}

TEST(StoreFactoryTest, ParsesModesCaseInsensitively) {
    EXPECT_EQ(ixcp::storage::parse_storage_mode("SQLite").value(), StorageMode::Sqlite);
    EXPECT_EQ(ixcp::storage::parse_storage_mode("json").value(), StorageMode::Json);
    EXPECT_EQ(ixcp::storage::parse_storage_mode("Memory").value(), StorageMode::Memory);
    EXPECT_TRUE(ixcp::storage::parse_storage_mode("redis").is_error());
}
