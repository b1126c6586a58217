/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef XPCD_UTIL_STATUS_HPP
#define XPCD_UTIL_STATUS_HPP

// We need tXPC_CC:
#include "../../src/XPC.h"
#include <ostream>
#include <string>

namespace xpcd {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tXPC_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tXPC_CC value()             const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == XPC_CC_Ok; }

    /**
     * Writes an error status to the debug log.
     * Returns the status unchanged, so it can be used in tests.
     */
    const Status &log() const;

private:
    // Error information:
    tXPC_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define XPC_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define XPC_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace xpcd

#endif
