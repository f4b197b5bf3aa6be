#include "file_watch.hpp"
#include "logger.hpp"
#include "watch_error.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace promfile {

namespace {

void cancel_scope(GCancellable* /*external*/, gpointer user_data) {
    g_cancellable_cancel(G_CANCELLABLE(user_data));
}

} // namespace

std::unique_ptr<FileWatch> FileWatch::watch(GCancellable* cancellable,
                                            const std::string& path,
                                            GError** error,
                                            const WatchOptions& options) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (!exists && !ec) {
        g_set_error(error, PROMFILE_WATCH_ERROR, PROMFILE_WATCH_ERROR_NOT_FOUND,
                    "file does not exist: %s", path.c_str());
        return nullptr;
    }
    if (ec) {
        // Let inotify_add_watch() report the real problem
        Logger::debug("[FileWatch] Cannot stat " + path + ": " + ec.message());
    }

    std::unique_ptr<FileWatch> watch(new FileWatch(cancellable, path, options));
    if (!watch->start(error)) {
        return nullptr;
    }
    return watch;
}

FileWatch::FileWatch(GCancellable* cancellable, const std::string& path, const WatchOptions& options)
    : path_(path)
    , options_(options)
    , external_(cancellable ? G_CANCELLABLE(g_object_ref(cancellable)) : nullptr)
    , scope_(g_cancellable_new())
    , sources_(std::make_shared<SignalGroup>())
    , handle_(sources_) {
}

FileWatch::~FileWatch() {
    if (external_) {
        g_cancellable_disconnect(external_, external_handler_);
    }

    g_cancellable_cancel(scope_);
    if (multiplex_thread_.joinable()) {
        multiplex_thread_.join();
    }
    file_watcher_.reset();
    symlink_watcher_.reset();

    g_object_unref(scope_);
    if (external_) {
        g_object_unref(external_);
    }
}

bool FileWatch::start(GError** error) {
    // Trace before subscribing: a link swapped in between then shows up as
    // drift instead of leaving inotify on a stale target.
    SymlinkChain chain = trace_symlinks(path_);
    for (const auto& edge : chain) {
        Logger::debug("[FileWatch] " + path_ + " resolves through " + edge.link_path + " -> " + edge.target);
    }

    symlink_watcher_ = std::make_unique<SymlinkWatcher>(std::move(chain), scope_, sources_,
                                                        options_.symlink_poll_interval);
    file_watcher_ = std::make_unique<FileWatcher>(scope_, sources_);

    if (!file_watcher_->start(path_, error)) {
        return false;
    }

    if (!symlink_watcher_->start()) {
        g_set_error(error, PROMFILE_WATCH_ERROR, PROMFILE_WATCH_ERROR_THREAD,
                    "failed to start symlink watcher for %s", path_.c_str());
        return false;
    }

    // Runs cancel_scope() right away when the caller already cancelled
    if (external_) {
        external_handler_ = g_cancellable_connect(external_, G_CALLBACK(cancel_scope), scope_, nullptr);
    }

    try {
        multiplex_thread_ = std::thread(&FileWatch::multiplex_loop, this);
    } catch (const std::system_error& e) {
        Logger::error("[FileWatch] Failed to create multiplex thread: " + std::string(e.what()));
        g_set_error(error, PROMFILE_WATCH_ERROR, PROMFILE_WATCH_ERROR_THREAD,
                    "failed to start watch thread: %s", e.what());
        return false;
    }

    Logger::info("[FileWatch] Watching " + path_ + " (" + std::to_string(symlink_watcher_->chain().size()) +
                 " symlink(s) in resolution path)");
    return true;
}

bool FileWatch::next() {
    return handle_.receive();
}

void FileWatch::multiplex_loop() {
    SignalChannel& chain_output = symlink_watcher_->output();
    SignalChannel& file_output = file_watcher_->output();

    while (true) {
        // Chain first: once the chain drifted, pending content signals are stale
        auto selection = select_signal({&chain_output, &file_output}, scope_);
        if (!selection) {
            Logger::debug("[FileWatch] Watch of " + path_ + " cancelled");
            break;
        }
        if (selection->index == 0) {
            Logger::info("[FileWatch] Symlink chain of " + path_ + " changed, watch must be re-established");
            break;
        }
        if (!selection->received) {
            Logger::info("[FileWatch] File watch of " + path_ + " ended, watch must be re-established");
            break;
        }
        // A drift while the consumer is busy withdraws the pending signal
        if (!handle_.send(scope_, &chain_output)) {
            if (chain_output.is_closed()) {
                Logger::info("[FileWatch] Symlink chain of " + path_ + " changed, pending change dropped");
            }
            break;
        }
    }

    handle_.close();
    g_cancellable_cancel(scope_);
}

} // namespace promfile
