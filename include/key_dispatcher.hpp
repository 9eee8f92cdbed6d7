#pragma once

#include "key_event.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pushscribe {

class KeyListener {
public:
    virtual ~KeyListener() = default;

    // Called on the hook thread. Must be fast and must not block.
    virtual void on_key_event(const RawKeyEvent& event) = 0;
};

// OS-level keyboard hook. There is deliberately no stop(): once started the
// hook lives until it is destroyed at process exit, because tearing down and
// reinstalling low-level hooks is not safe on every platform.
class KeyboardHook {
public:
    using EventCallback = std::function<void(const RawKeyEvent&)>;

    virtual ~KeyboardHook() = default;

    // Install the hook and start delivering events on a dedicated thread
    virtual bool start(EventCallback callback) = 0;
};

// The single keyboard hook of the process, fanned out to every registered
// listener. Constructed once by the application and passed by reference to
// whatever needs to register.
class MasterKeyDispatcher {
public:
    explicit MasterKeyDispatcher(std::unique_ptr<KeyboardHook> hook);
    ~MasterKeyDispatcher();

    MasterKeyDispatcher(const MasterKeyDispatcher&) = delete;
    MasterKeyDispatcher& operator=(const MasterKeyDispatcher&) = delete;

    // Adds the listener; the first registration starts the hook.
    // Returns false if the hook could not be started.
    bool register_listener(KeyListener* listener);

    // Removes the listener from dispatch. Returns once no dispatch to it is in
    // flight. Never stops the hook. Must not be called from a listener.
    void unregister_listener(KeyListener* listener);

    // Deliver one event to every listener, in registration order. A listener
    // that throws is logged and skipped.
    void dispatch(const RawKeyEvent& event);

    bool hook_started() const { return hook_started_.load(); }
    size_t listener_count() const;

private:
    std::unique_ptr<KeyboardHook> hook_;
    std::atomic<bool> hook_started_{false};

    // Held for a whole fan-out; register/unregister take it too
    mutable std::mutex dispatch_mutex_;
    std::vector<KeyListener*> listeners_;
};

} // namespace pushscribe
