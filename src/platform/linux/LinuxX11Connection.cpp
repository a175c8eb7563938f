#include "LinuxX11Connection.hpp"
#include <iostream>
#include <vector>

// X11 Headers - only included in the .cpp file
#include <X11/Xlib.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>

namespace platform {
namespace linux_os {

    namespace {
        // BadWindow races (window closed between query and use) must not
        // kill the process through the default Xlib error handler
        int ignore_x_errors(Display*, XErrorEvent*) { return 0; }
    }

    LinuxX11Connection::LinuxX11Connection(std::string window_name)
        : window_name_(std::move(window_name)) {
        XInitThreads();

        display_ = XOpenDisplay(nullptr);
        if (!display_) {
            std::cerr << "[LinuxX11] Failed to open X display. "
                      << "Are you running in an X11 session?" << std::endl;
            return;
        }
        XSetErrorHandler(ignore_x_errors);
    }

    LinuxX11Connection::~LinuxX11Connection() {
        if (display_) {
            XCloseDisplay(display_);
            display_ = nullptr;
        }
    }

    std::string LinuxX11Connection::window_title(XWindowId window) {
        if (!display_) return "";

        Atom net_wm_name = XInternAtom(display_, "_NET_WM_NAME", False);
        Atom utf8_string = XInternAtom(display_, "UTF8_STRING", False);

        Atom actual_type;
        int actual_format;
        unsigned long n_items, bytes_after;
        unsigned char* prop = nullptr;

        std::string title;
        if (XGetWindowProperty(display_, window, net_wm_name, 0, 1024, False, utf8_string,
                               &actual_type, &actual_format, &n_items, &bytes_after, &prop) == Success && prop) {
            title.assign(reinterpret_cast<char*>(prop), n_items);
            XFree(prop);
        }

        if (title.empty()) {
            char* name = nullptr;
            if (XFetchName(display_, window, &name) && name) {
                title = name;
                XFree(name);
            }
        }
        return title;
    }

    bool LinuxX11Connection::window_alive(XWindowId window) {
        XWindowAttributes attrs;
        return XGetWindowAttributes(display_, window, &attrs) != 0;
    }

    XWindowId LinuxX11Connection::find_window(XWindowId root) {
        // Breadth-first walk of the window tree
        std::vector<Window> queue{root};
        for (size_t i = 0; i < queue.size(); ++i) {
            Window current = queue[i];
            if (current != root && window_title(current).find(window_name_) != std::string::npos) {
                return current;
            }

            Window root_ret, parent_ret;
            Window* children = nullptr;
            unsigned int n_children = 0;
            if (XQueryTree(display_, current, &root_ret, &parent_ret, &children, &n_children)) {
                queue.insert(queue.end(), children, children + n_children);
                if (children) XFree(children);
            }
        }
        return 0;
    }

    common::Result<XWindowId> LinuxX11Connection::target_window() {
        if (!display_) {
            return common::Result<XWindowId>::err(common::ErrorCode::NotInitialized, "X display not open");
        }

        Window root = DefaultRootWindow(display_);
        if (window_name_.empty()) {
            return common::Result<XWindowId>::ok(root);
        }

        if (window_ != 0 && window_alive(window_)) {
            return common::Result<XWindowId>::ok(window_);
        }

        window_ = find_window(root);
        if (window_ == 0) {
            return common::Result<XWindowId>::err(common::ErrorCode::DeviceNotFound,
                                                  "No window titled \"" + window_name_ + "\"");
        }
        return common::Result<XWindowId>::ok(window_);
    }

} // namespace linux_os
} // namespace platform
