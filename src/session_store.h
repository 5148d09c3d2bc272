#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace pyexec {

// Workspace resolved for one request. A scratch workspace is removed when
// the handle is destroyed; a session workspace is left in place.
class WorkspaceHandle {
public:
    WorkspaceHandle(std::string path, bool ephemeral);
    ~WorkspaceHandle();

    WorkspaceHandle(const WorkspaceHandle&) = delete;
    WorkspaceHandle& operator=(const WorkspaceHandle&) = delete;

    const std::string& path() const { return path_; }
    bool ephemeral() const { return ephemeral_; }

private:
    std::string path_;
    bool ephemeral_;
};

class SessionStore;

// Exclusive hold on one session. Released on destruction or unlock().
class SessionLock {
public:
    SessionLock() = default;
    ~SessionLock() { unlock(); }

    SessionLock(SessionLock&& other) noexcept;
    SessionLock& operator=(SessionLock&& other) noexcept;

    bool owns_lock() const { return store_ != nullptr; }
    void unlock();

private:
    friend class SessionStore;
    SessionLock(SessionStore* store, std::string session_id, std::unique_lock<std::mutex> lock)
        : store_(store), session_id_(std::move(session_id)), lock_(std::move(lock)) {}

    SessionStore* store_ = nullptr;
    std::string session_id_;
    std::unique_lock<std::mutex> lock_;
};

// Maps session ids to durable workspace directories under a root. Safe to
// call concurrently; same-session callers can serialize through lock().
class SessionStore {
public:
    explicit SessionStore(std::string root);

    // Session workspace (created empty on first use) or, without an id, a
    // fresh scratch directory. Throws ProvisionError.
    std::unique_ptr<WorkspaceHandle> resolve(const std::optional<std::string>& session_id);

    // Blocks until no other holder has the session. A session's mutex only
    // exists while someone holds or waits for it.
    SessionLock lock(const std::string& session_id);

    // Sessions currently held or waited on
    size_t active_locks() const;

    bool exists(const std::string& session_id) const;

    static bool is_valid_session_id(const std::string& session_id);

    const std::string& root() const { return root_; }

private:
    friend class SessionLock;

    struct LockSlot {
        std::mutex mutex;
        size_t users = 0;
    };

    std::string create_scratch_directory();
    void release(const std::string& session_id);

    std::string root_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<LockSlot>> session_locks_;
};

} // namespace pyexec
