#include "key_dispatcher.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace pushscribe {

MasterKeyDispatcher::MasterKeyDispatcher(std::unique_ptr<KeyboardHook> hook)
    : hook_(std::move(hook)) {
}

MasterKeyDispatcher::~MasterKeyDispatcher() {
    // Process exit: the hook goes first so its thread can no longer dispatch
    hook_.reset();
}

bool MasterKeyDispatcher::register_listener(KeyListener* listener) {
    if (!listener) return false;

    std::lock_guard<std::mutex> lock(dispatch_mutex_);

    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }

    if (hook_started_.load()) return true;

    if (!hook_) {
        std::cerr << "No keyboard hook available" << std::endl;
        return false;
    }

    // The hook thread calls dispatch(), which waits on dispatch_mutex_ until
    // this registration has finished.
    bool started = hook_->start([this](const RawKeyEvent& event) { dispatch(event); });
    if (!started) {
        std::cerr << "Failed to start keyboard hook" << std::endl;
        return false;
    }

    hook_started_.store(true);
    std::cout << "Keyboard hook started" << std::endl;
    return true;
}

void MasterKeyDispatcher::unregister_listener(KeyListener* listener) {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void MasterKeyDispatcher::dispatch(const RawKeyEvent& event) {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);

    for (KeyListener* listener : listeners_) {
        try {
            listener->on_key_event(event);
        } catch (const std::exception& e) {
            std::cerr << "Key listener failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Key listener failed: unknown exception" << std::endl;
        }
    }
}

size_t MasterKeyDispatcher::listener_count() const {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    return listeners_.size();
}

} // namespace pushscribe
