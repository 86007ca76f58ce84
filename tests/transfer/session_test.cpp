#include "ixcp/events/event_bus.hpp"
#include "ixcp/events/events.hpp"
#include "ixcp/storage/memory_store.hpp"
#include "ixcp/transfer/session.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <set>
#include <vector>

using ixcp::Bytes;
using ixcp::ErrorCode;
using ixcp::transfer::SessionState;
using ixcp::transfer::TransferSession;
using ixcp::transfer::TransferSessionInfo;
using ixcp::transfer::TransferSessionManager;

namespace {

TransferSession make_session() {
    auto key = ixcp::crypto::SessionKey::generate();
    EXPECT_TRUE(key.is_ok());
    TransferSessionInfo info;
    info.session_id = "session-1";
    info.key_id = "key-1";
    info.wrapped_key = Bytes(8, 1);
    return TransferSession(std::move(info), std::move(key.value()));
}

ixcp::transfer::KeyPairLookup lookup_shared_key() {
    return [](const std::string& key_id) -> const ixcp::crypto::KeyPair* {
        const auto& pair = ixcp::test::shared_key_pair();
        return key_id == pair.key_id() ? &pair : nullptr;
    };
}

ixcp::crypto::NewSessionKey wrap_for(const ixcp::crypto::KeyPair& pair) {
    auto wrapped = ixcp::crypto::wrap_new_session_key(pair.public_key());
    EXPECT_TRUE(wrapped.is_ok());
    return std::move(wrapped.value());
}

} // namespace

TEST(TransferSessionTest, ValidTransitions) {
    auto session = make_session();
    EXPECT_EQ(session.state(), SessionState::Open);

    EXPECT_TRUE(session.transition_to(SessionState::Receiving).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Receiving).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Finalized).is_ok());
    EXPECT_EQ(session.state(), SessionState::Finalized);
}

TEST(TransferSessionTest, TerminalStatesAreFinal) {
    auto session = make_session();
    ASSERT_TRUE(session.transition_to(SessionState::Finalized).is_ok());

    auto back = session.transition_to(SessionState::Receiving);
    ASSERT_TRUE(back.is_error());
    EXPECT_EQ(back.error().code, ErrorCode::ProtocolError);
    EXPECT_TRUE(session.mark_failed("late").is_error());

    auto failed = make_session();
    ASSERT_TRUE(failed.mark_failed("tag mismatch").is_ok());
    EXPECT_EQ(failed.state(), SessionState::Failed);
    EXPECT_EQ(failed.info().last_error, "tag mismatch");
    EXPECT_TRUE(failed.transition_to(SessionState::Open).is_error());
}

TEST(TransferSessionTest, MatchesRecordedWrappedKey) {
    auto session = make_session();
    EXPECT_TRUE(session.matches("key-1", Bytes(8, 1)));
    EXPECT_FALSE(session.matches("key-2", Bytes(8, 1)));
    EXPECT_FALSE(session.matches("key-1", Bytes(8, 2)));
}

TEST(TransferSessionManagerTest, OpenUnwrapsAndPersistsWrappedKeyOnly) {
    ixcp::storage::MemoryStore store;
    ixcp::events::EventBus bus;
    std::vector<bool> opened;
    bus.subscribe<ixcp::events::SessionOpenedEvent>([&](const ixcp::events::SessionOpenedEvent& e) {
        opened.push_back(e.restored);
    });

    TransferSessionManager manager(store, lookup_shared_key(), &bus);
    auto fresh = wrap_for(ixcp::test::shared_key_pair());

    auto session = manager.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();
    EXPECT_EQ(session.value()->state(), SessionState::Open);
    EXPECT_EQ(manager.active_count(), 1u);

    auto same = manager.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped);
    ASSERT_TRUE(same.is_ok());
    EXPECT_EQ(same.value(), session.value());

    auto record = store.get(TransferSessionManager::kSessionsTable, "s1");
    ASSERT_TRUE(record.is_ok());
    ASSERT_TRUE(record.value().has_value());
    const std::string plaintext(reinterpret_cast<const char*>(session.value()->key().data()),
                                session.value()->key().size());
    EXPECT_EQ(record.value()->find(plaintext), std::string::npos);

    EXPECT_EQ(opened, (std::vector<bool>{false}));
}

TEST(TransferSessionManagerTest, RestoresAfterRestart) {
    ixcp::storage::MemoryStore store;
    auto fresh = wrap_for(ixcp::test::shared_key_pair());

    {
        TransferSessionManager manager(store, lookup_shared_key());
        ASSERT_TRUE(manager.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped).is_ok());
    }

    ixcp::events::EventBus bus;
    bool restored = false;
    bus.subscribe<ixcp::events::SessionOpenedEvent>([&](const ixcp::events::SessionOpenedEvent& e) {
        restored = e.restored;
    });

    TransferSessionManager restarted(store, lookup_shared_key(), &bus);
    EXPECT_EQ(restarted.active_count(), 0u);

    auto session = restarted.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped);
    ASSERT_TRUE(session.is_ok());
    EXPECT_TRUE(restored);

    auto sealed = ixcp::crypto::encrypt_chunk(fresh.key, 0, ixcp::to_bytes("hello"),
                                              ixcp::crypto::build_associated_data("s1", "a.bin"));
    ASSERT_TRUE(sealed.is_ok());
    auto plain = ixcp::crypto::decrypt_chunk(session.value()->key(), sealed.value().nonce,
                                             sealed.value().ciphertext, sealed.value().auth_tag,
                                             ixcp::crypto::build_associated_data("s1", "a.bin"));
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(ixcp::to_string(plain.value()), "hello");
}

TEST(TransferSessionManagerTest, RejectsMismatchedOrUnknownKeys) {
    ixcp::storage::MemoryStore store;
    TransferSessionManager manager(store, lookup_shared_key());

    auto first = wrap_for(ixcp::test::shared_key_pair());
    auto second = wrap_for(ixcp::test::shared_key_pair());
    ASSERT_TRUE(manager.open_or_resume("s1", first.wrapped.key_id, first.wrapped.wrapped).is_ok());

    auto swapped = manager.open_or_resume("s1", second.wrapped.key_id, second.wrapped.wrapped);
    ASSERT_TRUE(swapped.is_error());
    EXPECT_EQ(swapped.error().code, ErrorCode::KeyUnwrapFailure);

    auto foreign = wrap_for(ixcp::test::other_key_pair());
    auto unknown = manager.open_or_resume("s2", foreign.wrapped.key_id, foreign.wrapped.wrapped);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::KeyUnwrapFailure);

    auto mislabelled = manager.open_or_resume("s3", ixcp::test::shared_key_pair().key_id(),
                                              foreign.wrapped.wrapped);
    ASSERT_TRUE(mislabelled.is_error());
    EXPECT_EQ(mislabelled.error().code, ErrorCode::KeyUnwrapFailure);

    EXPECT_EQ(manager.active_count(), 1u);
    EXPECT_FALSE(store.get(TransferSessionManager::kSessionsTable, "s2").value().has_value());

    auto bad_id = manager.open_or_resume("", first.wrapped.key_id, first.wrapped.wrapped);
    ASSERT_TRUE(bad_id.is_error());
    EXPECT_EQ(bad_id.error().code, ErrorCode::InvalidArgument);
}

TEST(TransferSessionManagerTest, MarkReceivingAndClose) {
    ixcp::storage::MemoryStore store;
    ixcp::events::EventBus bus;
    std::vector<std::string> closed;
    bus.subscribe<ixcp::events::SessionClosedEvent>([&](const ixcp::events::SessionClosedEvent& e) {
        closed.push_back(e.session_id + ":" + e.state);
    });

    TransferSessionManager manager(store, lookup_shared_key(), &bus);
    auto fresh = wrap_for(ixcp::test::shared_key_pair());

    auto unknown = manager.mark_receiving("s1");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    auto session = manager.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped);
    ASSERT_TRUE(session.is_ok());
    ASSERT_TRUE(manager.mark_receiving("s1").is_ok());
    ASSERT_TRUE(manager.mark_receiving("s1").is_ok());
    EXPECT_EQ(session.value()->state(), SessionState::Receiving);

    ASSERT_TRUE(manager.close("s1").is_ok());
    EXPECT_EQ(session.value()->state(), SessionState::Finalized);
    EXPECT_EQ(manager.find("s1"), nullptr);
    EXPECT_FALSE(store.get(TransferSessionManager::kSessionsTable, "s1").value().has_value());

    ASSERT_TRUE(manager.close("never-opened").is_ok());
    EXPECT_TRUE(manager.close("s1", SessionState::Receiving).is_error());

    ASSERT_EQ(closed.size(), 2u);
    EXPECT_EQ(closed[0], std::string("s1:") + ixcp::transfer::to_string(SessionState::Finalized));
}

TEST(TransferSessionManagerTest, CloseForFileSweepsLiveAndStoredSessions) {
    ixcp::storage::MemoryStore store;
    auto first = wrap_for(ixcp::test::shared_key_pair());
    auto second = wrap_for(ixcp::test::shared_key_pair());
    auto other = wrap_for(ixcp::test::shared_key_pair());

    {
        // A run that was abandoned before the receiver restarted.
        TransferSessionManager before_restart(store, lookup_shared_key());
        ASSERT_TRUE(before_restart.open_or_resume("old", first.wrapped.key_id, first.wrapped.wrapped,
                                                  "report.bin").is_ok());
    }

    TransferSessionManager manager(store, lookup_shared_key());
    ASSERT_TRUE(manager.open_or_resume("new", second.wrapped.key_id, second.wrapped.wrapped,
                                       "report.bin").is_ok());
    ASSERT_TRUE(manager.open_or_resume("unrelated", other.wrapped.key_id, other.wrapped.wrapped,
                                       "notes.txt").is_ok());
    EXPECT_EQ(manager.find("new")->info().file_keys, (std::set<std::string>{"report.bin"}));
    EXPECT_EQ(manager.active_count(), 2u);

    auto closed = manager.close_for_file("report.bin");
    ASSERT_TRUE(closed.is_ok());
    EXPECT_EQ(closed.value(), 2u);
    EXPECT_EQ(manager.active_count(), 1u);
    EXPECT_NE(manager.find("unrelated"), nullptr);
    EXPECT_FALSE(store.get(TransferSessionManager::kSessionsTable, "old").value().has_value());
    EXPECT_FALSE(store.get(TransferSessionManager::kSessionsTable, "new").value().has_value());
    EXPECT_TRUE(store.get(TransferSessionManager::kSessionsTable, "unrelated").value().has_value());

    EXPECT_EQ(manager.close_for_file("report.bin").value(), 0u);
    EXPECT_TRUE(manager.close_for_file("notes.txt", SessionState::Open).is_error());
}

TEST(TransferSessionManagerTest, FileKeysSurviveRestart) {
    ixcp::storage::MemoryStore store;
    auto fresh = wrap_for(ixcp::test::shared_key_pair());

    {
        TransferSessionManager manager(store, lookup_shared_key());
        ASSERT_TRUE(manager.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped, "a.bin").is_ok());
        ASSERT_TRUE(manager.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped, "b.bin").is_ok());
    }

    TransferSessionManager restarted(store, lookup_shared_key());
    auto session = restarted.open_or_resume("s1", fresh.wrapped.key_id, fresh.wrapped.wrapped);
    ASSERT_TRUE(session.is_ok());
    EXPECT_TRUE(session.value()->carries("a.bin"));
    EXPECT_TRUE(session.value()->carries("b.bin"));
    EXPECT_FALSE(session.value()->carries("c.bin"));
}
