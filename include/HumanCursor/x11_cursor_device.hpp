#ifndef X11_CURSOR_DEVICE_HPP_
#define X11_CURSOR_DEVICE_HPP_

#include <string>
#include "HumanCursor/cursor_device.hpp"

// Forward declaration keeps Xlib macros out of dependent code
typedef struct _XDisplay Display;

/**
 * Pointer access through Xlib on the root window of the default screen.
 * Installs a process-wide X error handler so protocol errors surface as CursorError.
 */
class X11CursorDevice : public CursorDevice
{
public:
    /**
     * Open a connection to the X server.
     *
     * @param display_name Display to connect to, empty uses $DISPLAY
     */
    explicit X11CursorDevice(const std::string& display_name = "");
    ~X11CursorDevice() override;

    X11CursorDevice(const X11CursorDevice&) = delete;
    X11CursorDevice& operator=(const X11CursorDevice&) = delete;

    Point get_position() override;
    void set_position(const Point& point) override;

private:
    // Throws CursorError if the server rejected a request since the last check
    void check_errors(const char* request);

    Display* display_;
    unsigned long root_window_;
};

#endif // X11_CURSOR_DEVICE_HPP_
