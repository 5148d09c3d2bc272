#include "sandbox_launcher.h"
#include <openssl/rand.h>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <chrono>

namespace pyexec {

std::string generate_sandbox_id() {
    unsigned char bytes[8];
    std::ostringstream id;
    id << std::hex << std::setfill('0');
    if (RAND_bytes(bytes, sizeof(bytes)) == 1) {
        for (unsigned char b : bytes) {
            id << std::setw(2) << static_cast<int>(b);
        }
    } else {
        // Fall back to time + counter, ids only need to be unique per host
        static std::atomic<unsigned> counter{0};
        id << std::chrono::steady_clock::now().time_since_epoch().count() << ++counter;
    }
    return id.str();
}

// ============================================================================
// ProcessSandbox
// ============================================================================

ProcessSandbox::ProcessSandbox(std::string id, std::unique_ptr<ChildProcess> child)
    : id_(std::move(id)), child_(std::move(child)) {}

ProcessSandbox::~ProcessSandbox() {
    terminate();
}

void ProcessSandbox::terminate() {
    if (terminated_) {
        return;
    }
    terminated_ = true;

    if (stop_hook_ && child_->running()) {
        try {
            stop_hook_();
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] Stop hook failed for " << id_ << ": " << e.what() << std::endl;
        }
    }

    child_->kill_and_reap();

    for (auto it = cleanups_.rbegin(); it != cleanups_.rend(); ++it) {
        try {
            (*it)();
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] Cleanup failed for " << id_ << ": " << e.what() << std::endl;
        }
    }
    cleanups_.clear();
}

// ============================================================================
// SandboxGuard
// ============================================================================

SandboxGuard::~SandboxGuard() {
    release();
}

void SandboxGuard::release() {
    if (!handle_) {
        return;
    }
    try {
        launcher_.teardown(*handle_);
    } catch (const std::exception& e) {
        std::cerr << "[Sandbox] Teardown of " << handle_->id() << " failed: " << e.what() << std::endl;
    }
    handle_.reset();
}

} // namespace pyexec
