#include "session_store.h"
#include "constants.h"
#include "execution_types.h"
#include <filesystem>
#include <vector>
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace pyexec {

namespace {

// Hand the directory to the unprivileged sandbox identity when we can
void prepare_for_sandbox(const std::string& path) {
    if (geteuid() == 0) {
        if (chown(path.c_str(), SANDBOX_UID, SANDBOX_GID) != 0) {
            std::cerr << "[SessionStore] chown failed for " << path << ": "
                      << std::strerror(errno) << std::endl;
        }
    }
}

} // namespace

// ============================================================================
// WorkspaceHandle
// ============================================================================

WorkspaceHandle::WorkspaceHandle(std::string path, bool ephemeral)
    : path_(std::move(path)), ephemeral_(ephemeral) {}

WorkspaceHandle::~WorkspaceHandle() {
    if (!ephemeral_) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[SessionStore] Failed to remove scratch workspace " << path_
                  << ": " << ec.message() << std::endl;
    }
}

// ============================================================================
// SessionLock
// ============================================================================

SessionLock::SessionLock(SessionLock&& other) noexcept
    : store_(other.store_), session_id_(std::move(other.session_id_)),
      lock_(std::move(other.lock_)) {
    other.store_ = nullptr;
}

SessionLock& SessionLock::operator=(SessionLock&& other) noexcept {
    if (this != &other) {
        unlock();
        store_ = other.store_;
        session_id_ = std::move(other.session_id_);
        lock_ = std::move(other.lock_);
        other.store_ = nullptr;
    }
    return *this;
}

void SessionLock::unlock() {
    if (!store_) {
        return;
    }
    lock_.unlock();
    store_->release(session_id_);
    store_ = nullptr;
}

// ============================================================================
// SessionStore
// ============================================================================

SessionStore::SessionStore(std::string root) : root_(std::move(root)) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root_, ec);
    if (!ec) {
        root_ = absolute.lexically_normal().string();
    }
}

bool SessionStore::is_valid_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > MAX_SESSION_ID_LENGTH) {
        return false;
    }
    if (session_id == "." || session_id == ".." || session_id == SCRATCH_DIR_NAME) {
        return false;
    }
    for (char c : session_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::unique_ptr<WorkspaceHandle> SessionStore::resolve(
    const std::optional<std::string>& session_id
) {
    if (!session_id) {
        return std::make_unique<WorkspaceHandle>(create_scratch_directory(), true);
    }

    if (!is_valid_session_id(*session_id)) {
        throw ProvisionError("invalid session id");
    }

    std::string path = root_ + "/" + *session_id;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!fs::is_directory(path, ec)) {
            throw ProvisionError("session path is not a directory: " + path);
        }
        return std::make_unique<WorkspaceHandle>(path, false);
    }

    fs::create_directories(root_, ec);
    if (ec) {
        throw ProvisionError("cannot create session root " + root_ + ": " + ec.message());
    }

    // mkdir fails with EEXIST when a concurrent request won the race, which
    // is fine: both get the same directory
    if (mkdir(path.c_str(), 0700) != 0 && errno != EEXIST) {
        throw ProvisionError("cannot create session workspace " + path + ": " +
                             std::strerror(errno));
    }
    prepare_for_sandbox(path);

    std::cout << "[SessionStore] Created workspace for session " << *session_id << std::endl;
    return std::make_unique<WorkspaceHandle>(path, false);
}

std::string SessionStore::create_scratch_directory() {
    std::string scratch_root = root_ + "/" + SCRATCH_DIR_NAME;

    std::error_code ec;
    fs::create_directories(scratch_root, ec);
    if (ec) {
        throw ProvisionError("cannot create scratch root " + scratch_root + ": " + ec.message());
    }

    std::string templ = scratch_root + "/ws_XXXXXX";
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw ProvisionError("cannot create scratch workspace: " + std::string(std::strerror(errno)));
    }

    std::string path(buffer.data());
    prepare_for_sandbox(path);
    return path;
}

SessionLock SessionStore::lock(const std::string& session_id) {
    LockSlot* slot;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto& entry = session_locks_[session_id];
        if (!entry) {
            entry = std::make_unique<LockSlot>();
        }
        entry->users++;
        slot = entry.get();
    }
    // The slot outlives us: it is erased only once users drops to zero
    return SessionLock(this, session_id, std::unique_lock<std::mutex>(slot->mutex));
}

void SessionStore::release(const std::string& session_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = session_locks_.find(session_id);
    if (it != session_locks_.end() && --it->second->users == 0) {
        session_locks_.erase(it);
    }
}

size_t SessionStore::active_locks() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return session_locks_.size();
}

bool SessionStore::exists(const std::string& session_id) const {
    if (!is_valid_session_id(session_id)) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(root_ + "/" + session_id, ec);
}

} // namespace pyexec
