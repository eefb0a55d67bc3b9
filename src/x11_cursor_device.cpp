#include "HumanCursor/x11_cursor_device.hpp"
#include <atomic>
#include "rclcpp/rclcpp.hpp"

// Xlib defines macros such as None and Status, so it comes last
#include <X11/Xlib.h>

namespace {

// Protocol error reported since the last check, 0 when none
std::atomic<int> pending_error_code(0);

// Replaces the default handler, which prints and exits the process
int record_x_error(Display*, XErrorEvent* event)
{
    pending_error_code = event->error_code;
    return 0;
}

}  // namespace

X11CursorDevice::X11CursorDevice(const std::string& display_name)
    : display_(XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str())),
      root_window_(0)
{
    if (display_ == nullptr) {
        throw CursorError("Could not open X display '" +
            (display_name.empty() ? std::string(XDisplayName(nullptr)) : display_name) + "'");
    }

    root_window_ = DefaultRootWindow(display_);
    XSetErrorHandler(record_x_error);

    RCLCPP_INFO(rclcpp::get_logger("x11_cursor_device"),
        "Connected to X display %s", DisplayString(display_));
}

X11CursorDevice::~X11CursorDevice()
{
    XCloseDisplay(display_);
}

Point X11CursorDevice::get_position()
{
    Window root_return;
    Window child_return;
    int root_x = 0, root_y = 0;
    int window_x = 0, window_y = 0;
    unsigned int mask = 0;

    // False means the pointer is on another screen than the root window
    if (!XQueryPointer(display_, root_window_, &root_return, &child_return,
                       &root_x, &root_y, &window_x, &window_y, &mask))
    {
        throw CursorError("Pointer is not on the default screen");
    }
    this->check_errors("XQueryPointer");

    return Point{root_x, root_y};
}

void X11CursorDevice::set_position(const Point& point)
{
    XWarpPointer(display_, None, root_window_, 0, 0, 0, 0, point.x, point.y);
    this->check_errors("XWarpPointer");
}

// Round-trip to the server so errors for the last request have been delivered
void X11CursorDevice::check_errors(const char* request)
{
    XSync(display_, False);

    const int error_code = pending_error_code.exchange(0);
    if (error_code != 0) {
        char description[256] = {0};
        XGetErrorText(display_, error_code, description, sizeof(description));
        throw CursorError(std::string(request) + " failed: " + description);
    }
}
