#include <gtest/gtest.h>
#include "session_store.h"
#include "execution_types.h"
#include <filesystem>
#include <fstream>
#include <atomic>
#include <chrono>
#include <thread>
#include <unistd.h>

namespace pyexec {
namespace {

namespace fs = std::filesystem;

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("pyexec_sessions_" + std::to_string(getpid()));
        fs::remove_all(root);
        store = std::make_unique<SessionStore>(root.string());
    }

    void TearDown() override {
        store.reset();
        fs::remove_all(root);
    }

    fs::path root;
    std::unique_ptr<SessionStore> store;
};

TEST_F(SessionStoreTest, NewSessionCreatesOneEmptyDirectory) {
    // Given: A session id never seen before
    EXPECT_FALSE(store->exists("alpha"));

    // When: It is resolved
    auto workspace = store->resolve(std::string("alpha"));

    // Then: Exactly one new, empty directory exists for it
    ASSERT_NE(workspace, nullptr);
    EXPECT_EQ(workspace->path(), (root / "alpha").string());
    EXPECT_FALSE(workspace->ephemeral());
    EXPECT_TRUE(fs::is_directory(workspace->path()));
    EXPECT_TRUE(fs::is_empty(workspace->path()));
    EXPECT_TRUE(store->exists("alpha"));

    size_t session_dirs = 0;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.path().filename() != ".scratch") session_dirs++;
    }
    EXPECT_EQ(session_dirs, 1u);
}

TEST_F(SessionStoreTest, ExistingSessionKeepsItsState) {
    std::string first_path;
    {
        auto workspace = store->resolve(std::string("beta"));
        first_path = workspace->path();
        std::ofstream(first_path + "/state.txt") << "x = 42";
    }

    // Session workspaces survive their handle
    ASSERT_TRUE(fs::exists(first_path + "/state.txt"));

    auto again = store->resolve(std::string("beta"));
    EXPECT_EQ(again->path(), first_path);
    std::ifstream in(again->path() + "/state.txt");
    std::string content;
    std::getline(in, content);
    EXPECT_EQ(content, "x = 42");
}

TEST_F(SessionStoreTest, ScratchWorkspaceIsRemovedWithItsHandle) {
    std::string path;
    {
        auto workspace = store->resolve(std::nullopt);
        path = workspace->path();
        EXPECT_TRUE(workspace->ephemeral());
        EXPECT_TRUE(fs::is_directory(path));
        EXPECT_NE(path.find(".scratch"), std::string::npos);
        std::ofstream(path + "/tmp.txt") << "scratch";
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(SessionStoreTest, ScratchWorkspacesAreDistinct) {
    auto a = store->resolve(std::nullopt);
    auto b = store->resolve(std::nullopt);
    EXPECT_NE(a->path(), b->path());
}

TEST_F(SessionStoreTest, RejectsUnsafeSessionIds) {
    EXPECT_THROW(store->resolve(std::string("../escape")), ProvisionError);
    EXPECT_THROW(store->resolve(std::string("..")), ProvisionError);
    EXPECT_THROW(store->resolve(std::string("a/b")), ProvisionError);
    EXPECT_THROW(store->resolve(std::string(".scratch")), ProvisionError);
    EXPECT_THROW(store->resolve(std::string("")), ProvisionError);
    EXPECT_THROW(store->resolve(std::string(200, 'a')), ProvisionError);
    EXPECT_FALSE(fs::exists(root.parent_path() / "escape"));
}

TEST_F(SessionStoreTest, SessionIdValidation) {
    EXPECT_TRUE(SessionStore::is_valid_session_id("user-123_test.v2"));
    EXPECT_TRUE(SessionStore::is_valid_session_id(std::string(128, 'z')));
    EXPECT_FALSE(SessionStore::is_valid_session_id(std::string(129, 'z')));
    EXPECT_FALSE(SessionStore::is_valid_session_id("has space"));
    EXPECT_FALSE(SessionStore::is_valid_session_id("."));
}

TEST_F(SessionStoreTest, FileInPlaceOfWorkspaceIsReported) {
    fs::create_directories(root);
    std::ofstream(root / "gamma") << "not a directory";

    EXPECT_THROW(store->resolve(std::string("gamma")), ProvisionError);
}

TEST_F(SessionStoreTest, UncreatableRootIsReported) {
    fs::create_directories(root);
    std::ofstream(root / "blocker") << "file";
    SessionStore blocked((root / "blocker" / "sessions").string());

    EXPECT_THROW(blocked.resolve(std::string("delta")), ProvisionError);
    EXPECT_THROW(blocked.resolve(std::nullopt), ProvisionError);
}

TEST_F(SessionStoreTest, ConcurrentResolveOfSameNewSession) {
    std::vector<std::thread> threads;
    std::vector<std::string> paths(8);
    std::atomic<int> failures{0};
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&, i]() {
            try {
                paths[i] = store->resolve(std::string("shared"))->path();
            } catch (const ProvisionError&) {
                failures++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    for (const auto& p : paths) {
        EXPECT_EQ(p, paths[0]);
    }
}

TEST_F(SessionStoreTest, LockSerializesSameSessionOnly) {
    auto held = store->lock("epsilon");

    // A different session is never blocked
    std::atomic<bool> other_acquired{false};
    std::thread other([&]() {
        auto lock = store->lock("zeta");
        other_acquired = true;
    });
    other.join();
    EXPECT_TRUE(other_acquired);

    // The same session waits for the holder
    std::atomic<bool> same_acquired{false};
    std::thread same([&]() {
        auto lock = store->lock("epsilon");
        same_acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(same_acquired);

    held.unlock();
    same.join();
    EXPECT_TRUE(same_acquired);
}

TEST_F(SessionStoreTest, LocksAreDroppedWhenReleased) {
    // Given: Many distinct sessions locked and released in turn
    for (int i = 0; i < 100; i++) {
        auto lock = store->lock("session-" + std::to_string(i));
        EXPECT_TRUE(lock.owns_lock());
    }

    // Then: No per-session state is left behind
    EXPECT_EQ(store->active_locks(), 0u);
}

TEST_F(SessionStoreTest, WaitingHolderKeepsLockAlive) {
    auto held = store->lock("eta");
    EXPECT_EQ(store->active_locks(), 1u);

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto lock = store->lock("eta");
        acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Releasing the first holder hands the same slot to the waiter
    held.unlock();
    EXPECT_FALSE(held.owns_lock());
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(store->active_locks(), 0u);
}

TEST_F(SessionStoreTest, MovedLockReleasesOnce) {
    auto first = store->lock("theta");
    SessionLock second = std::move(first);
    EXPECT_FALSE(first.owns_lock());
    EXPECT_TRUE(second.owns_lock());

    second.unlock();
    second.unlock();
    EXPECT_EQ(store->active_locks(), 0u);
    auto again = store->lock("theta");
    EXPECT_TRUE(again.owns_lock());
}

} // namespace
} // namespace pyexec
