#include "keyboard_hook.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <sys/select.h>

#ifdef HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace pushscribe {

struct EvdevKeyboardHook::Device {
    std::string path;
    int fd = -1;
#ifdef HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
#endif

    ~Device() {
#ifdef HAS_LIBEVDEV
        if (dev) libevdev_free(dev);
#endif
        if (fd >= 0) close(fd);
    }
};

namespace {

constexpr auto RESCAN_INTERVAL = std::chrono::seconds(2);

#ifndef HAS_LIBEVDEV
bool test_bit(const unsigned long* bits, int bit) {
    const int bits_per_long = static_cast<int>(sizeof(unsigned long) * 8);
    return (bits[bit / bits_per_long] >> (bit % bits_per_long)) & 1UL;
}

// Anything that reports letter keys counts as a keyboard
bool is_keyboard_fd(int fd) {
    const size_t longs = KEY_MAX / (sizeof(unsigned long) * 8) + 1;
    unsigned long key_bits[longs] = {};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) return false;
    return test_bit(key_bits, KEY_A) && test_bit(key_bits, KEY_SPACE);
}
#endif

} // namespace

EvdevKeyboardHook::EvdevKeyboardHook(std::string input_dir)
    : input_dir_(std::move(input_dir)) {}

EvdevKeyboardHook::~EvdevKeyboardHook() {
    running_.store(false);
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

std::vector<std::string> EvdevKeyboardHook::list_event_nodes(const std::string& dir,
                                                             const std::set<std::string>& skip) {
    namespace fs = std::filesystem;

    std::vector<std::string> nodes;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        std::cerr << "Cannot read " << dir << ": " << ec.message() << std::endl;
        return nodes;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.compare(0, 5, "event") != 0) continue;

        std::string path = entry.path().string();
        if (skip.count(path)) continue;
        nodes.push_back(path);
    }

    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

size_t EvdevKeyboardHook::open_keyboards() {
    std::set<std::string> open_paths;
    for (const auto& device : devices_) {
        if (device->fd >= 0) open_paths.insert(device->path);
    }

    // Drop devices that went away
    devices_.erase(std::remove_if(devices_.begin(), devices_.end(),
                                  [](const std::unique_ptr<Device>& d) { return d->fd < 0; }),
                   devices_.end());

    size_t added = 0;
    for (const auto& path : list_event_nodes(input_dir_, open_paths)) {
        std::unique_ptr<Device> device(new Device());
        device->path = path;
        device->fd = open(device->path.c_str(), O_RDONLY | O_NONBLOCK);
        if (device->fd < 0) continue;

#ifdef HAS_LIBEVDEV
        if (libevdev_new_from_fd(device->fd, &device->dev) < 0) continue;
        if (!libevdev_has_event_type(device->dev, EV_KEY) ||
            !libevdev_has_event_code(device->dev, EV_KEY, KEY_A) ||
            !libevdev_has_event_code(device->dev, EV_KEY, KEY_SPACE)) {
            continue;
        }
        std::cout << "Using keyboard: " << device->path
                  << " (" << libevdev_get_name(device->dev) << ")" << std::endl;
#else
        if (!is_keyboard_fd(device->fd)) continue;
        std::cout << "Using keyboard: " << device->path << std::endl;
#endif
        devices_.push_back(std::move(device));
        added++;
    }

    return added;
}

bool EvdevKeyboardHook::start(EventCallback callback) {
    if (running_.load()) return true;

    if (open_keyboards() == 0) {
        std::cerr << "Failed to open keyboard device. Try running with sudo or add user to input group." << std::endl;
        return false;
    }

    callback_ = std::move(callback);
    running_.store(true);

    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void EvdevKeyboardHook::run_loop() {
    struct input_event ev;

    auto deliver = [this](const struct input_event& event) {
        // value: 0 release, 1 press, 2 autorepeat
        if (event.type != EV_KEY || event.value < 0 || event.value > 2) return;

        RawKeyEvent raw;
        raw.pressed = event.value != 0;
        raw.code = static_cast<int32_t>(event.code);
        if (callback_) callback_(raw);
    };

    auto last_scan = std::chrono::steady_clock::now();

    while (running_.load()) {
        // Only this thread touches devices_ once the loop runs
        auto now = std::chrono::steady_clock::now();
        if (now - last_scan >= RESCAN_INTERVAL) {
            last_scan = now;
            open_keyboards();
        }

        fd_set fds;
        FD_ZERO(&fds);
        int max_fd = -1;
        for (const auto& device : devices_) {
            if (device->fd < 0) continue;
            FD_SET(device->fd, &fds);
            if (device->fd > max_fd) max_fd = device->fd;
        }

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        if (max_fd < 0) {
            // Every keyboard is gone; wait for the next rescan
            select(0, nullptr, nullptr, nullptr, &tv);
            continue;
        }

        int ret = select(max_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

        for (const auto& device : devices_) {
            if (device->fd < 0 || !FD_ISSET(device->fd, &fds)) continue;

#ifdef HAS_LIBEVDEV
            unsigned int flags = LIBEVDEV_READ_FLAG_NORMAL;
            int rc;
            do {
                rc = libevdev_next_event(device->dev, flags, &ev);
                if (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC) {
                    deliver(ev);
                }
                // Dropped events: drain the resync queue before reading normally again
                flags = (rc == LIBEVDEV_READ_STATUS_SYNC) ? LIBEVDEV_READ_FLAG_SYNC
                                                          : LIBEVDEV_READ_FLAG_NORMAL;
            } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);

            if (rc == -ENODEV) {
                std::cerr << "Keyboard removed: " << device->path << std::endl;
                libevdev_free(device->dev);
                device->dev = nullptr;
                close(device->fd);
                device->fd = -1;
            }
#else
            while (true) {
                ssize_t n = read(device->fd, &ev, sizeof(ev));
                if (n == static_cast<ssize_t>(sizeof(ev))) {
                    deliver(ev);
                    continue;
                }
                if (n < 0 && errno == ENODEV) {
                    std::cerr << "Keyboard removed: " << device->path << std::endl;
                    close(device->fd);
                    device->fd = -1;
                }
                break;
            }
#endif
        }
    }
}

} // namespace pushscribe
