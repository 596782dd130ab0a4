/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Exception hierarchy carrying the throw site

**************************************************/

#ifndef SPROUT_ERROR_EXCEPTION_HPP
#define SPROUT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "sprout/macro.hpp"

namespace sprout::error {

/**
 * @brief Base exception of the library.
 *
 * Records the file, line and function of the throw site together with the
 * throwing thread. The message is built by streaming every trailing
 * constructor argument in order, so callers can mix strings and numbers.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full description including the throw site.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class OutOfRange : public Exception {
public:
    using Exception::Exception;
};

class FailToOpenFile : public Exception {
public:
    using Exception::Exception;
};

}  // namespace sprout::error

#define THROW_INVALID_ARGUMENT(...)                                       \
    throw sprout::error::InvalidArgument(SPROUT_FILE_NAME, SPROUT_FILE_LINE, \
                                         SPROUT_FUNC_NAME, __VA_ARGS__)

#define THROW_OUT_OF_RANGE(...)                                       \
    throw sprout::error::OutOfRange(SPROUT_FILE_NAME, SPROUT_FILE_LINE, \
                                    SPROUT_FUNC_NAME, __VA_ARGS__)

#define THROW_FAIL_TO_OPEN_FILE(...)                                       \
    throw sprout::error::FailToOpenFile(SPROUT_FILE_NAME, SPROUT_FILE_LINE, \
                                        SPROUT_FUNC_NAME, __VA_ARGS__)

#endif  // SPROUT_ERROR_EXCEPTION_HPP
