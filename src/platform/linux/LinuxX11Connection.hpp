#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "common/Result.hpp"

// Forward declarations to avoid including X11 headers in the header file
typedef struct _XDisplay Display;

namespace platform {
namespace linux_os {

    using XWindowId = unsigned long; // X11 `Window`

    /**
     * Shared Xlib connection plus the target window every X11 component
     * works on.
     *
     * Xlib is not re-entrant: every call must be made while holding lock().
     * The target window is looked up lazily by title substring (empty name =
     * root window) and re-resolved if it disappears.
     *
     * Dependencies:
     *   - libX11-dev / libX11-devel
     */
    class LinuxX11Connection {
    public:
        explicit LinuxX11Connection(std::string window_name);
        ~LinuxX11Connection();

        LinuxX11Connection(const LinuxX11Connection&) = delete;
        LinuxX11Connection& operator=(const LinuxX11Connection&) = delete;

        bool is_open() const { return display_ != nullptr; }

        std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

        // Caller must hold lock()
        Display* display() const { return display_; }

        // Resolve the target window. Caller must hold lock().
        common::Result<XWindowId> target_window();

        bool targets_root() const { return window_name_.empty(); }

        // Window title (UTF-8 _NET_WM_NAME, falling back to WM_NAME).
        // Caller must hold lock().
        std::string window_title(XWindowId window);

    private:
        XWindowId find_window(XWindowId root);
        bool window_alive(XWindowId window);

        std::mutex mutex_;
        Display* display_ = nullptr;
        std::string window_name_;
        XWindowId window_ = 0;
    };

} // namespace linux_os
} // namespace platform
