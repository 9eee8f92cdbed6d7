#pragma once

#include "key_dispatcher.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pushscribe {

// Reads every keyboard under /dev/input (needs the input group or root).
// Events carry the evdev key code only; the code is layout independent.
// The directory is rescanned every few seconds so keyboards plugged in or
// reconnected after start() are picked up.
class EvdevKeyboardHook : public KeyboardHook {
public:
    explicit EvdevKeyboardHook(std::string input_dir = "/dev/input");
    ~EvdevKeyboardHook() override;

    EvdevKeyboardHook(const EvdevKeyboardHook&) = delete;
    EvdevKeyboardHook& operator=(const EvdevKeyboardHook&) = delete;

    bool start(EventCallback callback) override;

    // eventN nodes in `dir` not in `skip`, sorted by path
    static std::vector<std::string> list_event_nodes(const std::string& dir,
                                                     const std::set<std::string>& skip);

private:
    struct Device;

    // Opens keyboards not already open; returns the number added
    size_t open_keyboards();
    void run_loop();

    std::string input_dir_;
    std::vector<std::unique_ptr<Device>> devices_;
    EventCallback callback_;
    std::atomic<bool> running_{false};
    std::thread listener_thread_;
};

} // namespace pushscribe
