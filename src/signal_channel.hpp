// signal_channel.hpp - closable, unbuffered unit-signal channel
// Used to pass "something happened" notifications between watch threads.

#ifndef PROMFILE_SIGNAL_CHANNEL_HPP
#define PROMFILE_SIGNAL_CHANNEL_HPP

#include <gio/gio.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>

namespace promfile {

// Lock and condition shared by every channel that is selected on together.
struct SignalGroup {
    std::mutex mutex;
    std::condition_variable cond;
};

struct SignalSelection {
    size_t index;    // position of the channel in the select_signal() list
    bool received;   // false means that channel is closed
};

/**
 * Unbuffered channel carrying unit signals.
 *
 * send() is a rendezvous: it returns only once a receiver has taken the
 * signal. Closing discards a signal that has not been taken yet and wakes
 * every blocked sender and receiver. A channel closes at most once.
 *
 * Blocking calls accept an optional GCancellable; cancelling it makes the
 * call return false.
 */
class SignalChannel {
public:
    explicit SignalChannel(std::shared_ptr<SignalGroup> group = std::make_shared<SignalGroup>());

    SignalChannel(const SignalChannel&) = delete;
    SignalChannel& operator=(const SignalChannel&) = delete;

    // Returns true once a receiver took the signal, false if the channel was
    // closed or the cancellable fired first (the signal is then withdrawn).
    // When `abort` is given it must share this channel's group; its closure
    // withdraws the signal the same way.
    bool send(GCancellable* cancellable = nullptr, const SignalChannel* abort = nullptr);

    // Returns true when a signal was received, false once closed or cancelled.
    bool receive(GCancellable* cancellable = nullptr);

    // Returns true only for the call that actually closed the channel.
    bool close();
    bool is_closed() const;

    const std::shared_ptr<SignalGroup>& group() const { return group_; }

private:
    friend std::optional<SignalSelection> select_signal(std::initializer_list<SignalChannel*> channels,
                                                        GCancellable* cancellable);

    // group_->mutex must be held
    void take_locked();

    std::shared_ptr<SignalGroup> group_;
    bool pending_ = false;
    bool closed_ = false;
    uint64_t posted_ = 0;
    uint64_t taken_ = 0;
};

/**
 * Waits until one of `channels` holds a signal or is closed and reports
 * which. Channels are checked in list order, so an earlier channel wins
 * when several are ready. A pending signal on the chosen channel is
 * consumed. All channels must share the same SignalGroup.
 *
 * Returns std::nullopt when the cancellable fires first.
 */
std::optional<SignalSelection> select_signal(std::initializer_list<SignalChannel*> channels,
                                             GCancellable* cancellable);

// Sleeps up to `timeout`; returns true as soon as the cancellable fires.
bool wait_for_cancel(GCancellable* cancellable, std::chrono::milliseconds timeout);

} // namespace promfile

#endif // PROMFILE_SIGNAL_CHANNEL_HPP
