#ifndef CURSOR_DEVICE_HPP_
#define CURSOR_DEVICE_HPP_

#include <stdexcept>
#include <string>
#include "HumanCursor/types.hpp"

/**
 * Raised when the platform refuses a pointer query or update.
 */
class CursorError : public std::runtime_error
{
public:
    explicit CursorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Access to the system pointer.
 * Both calls are synchronous and throw CursorError on failure.
 */
class CursorDevice
{
public:
    virtual ~CursorDevice() = default;

    // Current pointer position in screen pixels
    virtual Point get_position() = 0;

    // Move the pointer to the given screen position
    virtual void set_position(const Point& point) = 0;
};

#endif // CURSOR_DEVICE_HPP_
