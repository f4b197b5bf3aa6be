#include "symlink_watcher.hpp"
#include "logger.hpp"

#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace promfile {

namespace {

// Same limit the kernel applies while resolving a path (MAXSYMLINKS)
constexpr size_t MAX_SYMLINK_HOPS = 40;

// Spelling-independent name of the entry at `cursor`: "x/../x/a" and "x/a"
// give the same key. The entry itself is not followed.
std::string entry_key(const fs::path& cursor) {
    std::error_code ec;
    fs::path parent = fs::weakly_canonical(cursor.parent_path(), ec);
    if (ec) {
        return cursor.lexically_normal().string();
    }
    return (parent / cursor.filename()).string();
}

} // namespace

SymlinkChain trace_symlinks(const std::string& path) {
    SymlinkChain chain;
    std::set<std::string> seen;
    std::error_code ec;

    fs::path cursor = fs::absolute(path, ec);
    if (ec) {
        cursor = fs::path(path);
    }
    // "dir/" names the same entry as "dir"
    if (!cursor.has_filename() && cursor != cursor.root_path()) {
        cursor = cursor.parent_path();
    }

    while (true) {
        fs::path target = fs::read_symlink(cursor, ec);
        if (!ec) {
            const std::string link_path = cursor.string();
            if (!seen.insert(entry_key(cursor)).second) {
                Logger::warn("[SymlinkWatcher] Symlink loop at " + link_path + ", trace stopped");
                break;
            }
            if (chain.size() >= MAX_SYMLINK_HOPS) {
                Logger::warn("[SymlinkWatcher] More than " + std::to_string(MAX_SYMLINK_HOPS) +
                             " symlinks resolving " + path + ", trace stopped");
                break;
            }

            chain.push_back({link_path, target.string()});
            cursor = target.is_absolute() ? target : cursor.parent_path() / target;
            continue;
        }

        // Not a link (or missing): the parent directory may still be one
        fs::path parent = cursor.parent_path();
        if (parent.empty() || parent == cursor) {
            break;
        }
        cursor = parent;
    }

    return chain;
}

SymlinkWatcher::SymlinkWatcher(SymlinkChain chain,
                               GCancellable* cancellable,
                               std::shared_ptr<SignalGroup> group,
                               std::chrono::milliseconds interval)
    : chain_(std::move(chain))
    , cancellable_(G_CANCELLABLE(g_object_ref(cancellable)))
    , interval_(interval)
    , output_(std::move(group)) {
}

SymlinkWatcher::~SymlinkWatcher() {
    stop();
    g_object_unref(cancellable_);
}

bool SymlinkWatcher::start() {
    if (running_.load()) {
        return true;
    }

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
    if (g_cancellable_is_cancelled(cancellable_) || output_.is_closed()) {
        Logger::warn("[SymlinkWatcher] Cannot restart a watcher that has already ended");
        return false;
    }

    if (chain_.empty()) {
        Logger::debug("[SymlinkWatcher] No symlinks in resolution path, nothing to poll");
        return true;
    }

    running_.store(true);
    try {
        poll_thread_ = std::thread(&SymlinkWatcher::poll_loop, this);
    } catch (const std::system_error& e) {
        Logger::error("[SymlinkWatcher] Failed to create poll thread: " + std::string(e.what()));
        running_.store(false);
        return false;
    }

    Logger::debug("[SymlinkWatcher] Polling " + std::to_string(chain_.size()) + " symlink(s) every " +
                  std::to_string(interval_.count()) + "ms");
    return true;
}

void SymlinkWatcher::stop() {
    g_cancellable_cancel(cancellable_);
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

std::string SymlinkWatcher::check_drift() const {
    for (const auto& edge : chain_) {
        std::error_code ec;
        fs::path current = fs::read_symlink(edge.link_path, ec);
        if (ec) {
            return "Cannot read symlink " + edge.link_path + ": " + ec.message();
        }
        if (current.string() != edge.target) {
            return "Symlink " + edge.link_path + " now points to " + current.string() +
                   " (was " + edge.target + ")";
        }
    }
    return "";
}

void SymlinkWatcher::poll_loop() {
    while (!wait_for_cancel(cancellable_, interval_)) {
        std::string drift = check_drift();
        if (!drift.empty()) {
            Logger::info("[SymlinkWatcher] " + drift);
            output_.close();
            break;
        }
    }

    running_.store(false);
}

} // namespace promfile
