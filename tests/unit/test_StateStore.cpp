#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "sync/StateStore.hpp"
#include "sync/errors.hpp"

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace hs::sync;
using namespace hs::sync::model;

class StateStoreTest : public hs::test::TempDirTest {
protected:
    fs::path statePath() const { return root / "nested" / "state.json"; }
};

TEST_F(StateStoreTest, MissingFileYieldsFreshState) {
    const auto state = StateStore(statePath()).load();
    EXPECT_TRUE(state.sessions.empty());
    EXPECT_TRUE(state.last_sync_at.empty());
}

TEST_F(StateStoreTest, SaveThenLoadReproducesSessions) {
    SyncState state;
    state.updateSession("session-1", "uuid-123", 5);
    state.updateSession("session-2", "uuid-456", 1);

    const StateStore store(statePath());
    store.save(state);

    const auto loaded = store.load();
    EXPECT_EQ(loaded.sessions, state.sessions);
    EXPECT_EQ(loaded.lastSyncedUUID("session-1"), "uuid-123");
    EXPECT_EQ(loaded.sessions.at("session-1").message_count, 5);
    EXPECT_FALSE(loaded.last_sync_at.empty());
}

TEST_F(StateStoreTest, SaveStampsLastSyncAt) {
    SyncState state;
    StateStore(statePath()).save(state);
    EXPECT_FALSE(state.last_sync_at.empty());
    EXPECT_EQ(state.last_sync_at.back(), 'Z');
}

TEST_F(StateStoreTest, FileIsOwnerOnlyAndTempIsGone) {
    SyncState state;
    state.updateSession("s", "u", 1);
    StateStore(statePath()).save(state);

    struct stat st{};
    ASSERT_EQ(::stat(statePath().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600);
    EXPECT_FALSE(fs::exists(statePath().string() + ".tmp"));
}

TEST_F(StateStoreTest, EveryCreatedDirectoryIsOwnerOnly) {
    const auto deep = root / "a" / "b" / "c" / "state.json";
    SyncState state;
    StateStore(deep).save(state);

    for (const auto& dir : {root / "a", root / "a" / "b", root / "a" / "b" / "c"}) {
        struct stat st{};
        ASSERT_EQ(::stat(dir.c_str(), &st), 0) << dir;
        EXPECT_EQ(st.st_mode & 0777, 0700) << dir;
    }
}

TEST_F(StateStoreTest, DirectoryCreationFailureThrowsPersistError) {
    write("blocker", "a file where a directory should be");

    SyncState state;
    EXPECT_THROW(StateStore(root / "blocker" / "sub" / "state.json").save(state), PersistError);
}

TEST_F(StateStoreTest, SaveReplacesPreviousContent) {
    const StateStore store(statePath());

    SyncState first;
    first.updateSession("old", "u1", 1);
    store.save(first);

    SyncState second;
    second.updateSession("new", "u2", 2);
    store.save(second);

    const auto loaded = store.load();
    EXPECT_EQ(loaded.sessions.size(), 1u);
    EXPECT_TRUE(loaded.sessions.contains("new"));
}

TEST_F(StateStoreTest, CorruptFileThrowsStateError) {
    write("nested/state.json", "{ this is not json");
    EXPECT_THROW((void)StateStore(statePath()).load(), StateError);
}

TEST_F(StateStoreTest, NullSessionsLoadAsEmptyMap) {
    write("nested/state.json", R"({"sessions":null,"last_sync_at":"2025-01-01T00:00:00Z"})");
    const auto state = StateStore(statePath()).load();
    EXPECT_TRUE(state.sessions.empty());
    EXPECT_EQ(state.last_sync_at, "2025-01-01T00:00:00Z");
}

TEST_F(StateStoreTest, ReadsDocumentedLayout) {
    write("nested/state.json",
          R"({"sessions":{"abc":{"last_synced_uuid":"u9","last_sync_at":"2025-02-02T00:00:00Z","message_count":7}},)"
          R"("last_sync_at":"2025-02-02T00:00:00Z"})");

    const auto state = StateStore(statePath()).load();
    ASSERT_TRUE(state.sessions.contains("abc"));
    EXPECT_EQ(state.sessions.at("abc"),
              (SessionState{.last_synced_uuid = "u9", .last_sync_at = "2025-02-02T00:00:00Z", .message_count = 7}));
}

TEST_F(StateStoreTest, UnwritableTargetThrowsPersistError) {
    // the target path is an existing directory, so the rename cannot succeed
    fs::create_directories(statePath());
    fs::create_directories(statePath() / "occupied");

    SyncState state;
    EXPECT_THROW(StateStore(statePath()).save(state), PersistError);
    EXPECT_FALSE(fs::exists(statePath().string() + ".tmp"));
}

TEST(SyncStateTest, LastSyncedUUIDForUnknownSessionIsEmpty) {
    SyncState state;
    state.updateSession("known", "uuid-abc", 2);
    EXPECT_EQ(state.lastSyncedUUID("known"), "uuid-abc");
    EXPECT_EQ(state.lastSyncedUUID("unknown"), "");
}
