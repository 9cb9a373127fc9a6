/*!
 * \file exception.hpp
 * \brief Exception types and throw macros used across enumkit
 * \author Max Qian <lightapt.com>
 * \date 2023-11-10
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_ERROR_EXCEPTION_HPP
#define ENUMKIT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <boost/container/small_vector.hpp>

#define ENUMKIT_FILE_NAME __FILE__
#define ENUMKIT_FILE_LINE __LINE__
#define ENUMKIT_FUNC_NAME __func__

namespace enumkit::meta {
enum class EnumFormat : int;
}

namespace enumkit::error {

/**
 * @brief Base exception carrying the throw site and the throwing thread.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs the exception from the throw site and a message pack.
     *
     * @param file Source file of the throw site.
     * @param line Source line of the throw site.
     * @param func Function name of the throw site.
     * @param args Values streamed one after another into the message.
     */
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

    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

#define THROW_EXCEPTION(...)                                             \
    throw enumkit::error::Exception(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                    ENUMKIT_FUNC_NAME, __VA_ARGS__)

// Bad argument: empty format list, unknown format, malformed declaration.
class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                                     \
    throw enumkit::error::InvalidArgument(ENUMKIT_FILE_NAME,             \
                                          ENUMKIT_FILE_LINE,             \
                                          ENUMKIT_FUNC_NAME, __VA_ARGS__)

// Numeric literal does not fit the underlying integer width.
class OverflowError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_OVERFLOW_ERROR(...)                                          \
    throw enumkit::error::OverflowError(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                        ENUMKIT_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Text did not resolve under the attempted format order.
 *
 * Keeps the offending text and the formats that were tried so callers can
 * report or retry with a different order.
 */
class ParseError : public Exception {
public:
    using FormatList = boost::container::small_vector<meta::EnumFormat, 4>;

    template <typename Formats, typename... Args>
    ParseError(const char* file, int line, const char* func,
               std::string_view text, const Formats& formats, Args&&... args)
        : Exception(file, line, func, std::forward<Args>(args)...),
          text_(text),
          formats_(formats.begin(), formats.end()) {}

    [[nodiscard]] auto text() const noexcept -> const std::string& {
        return text_;
    }

    [[nodiscard]] auto formats() const noexcept -> const FormatList& {
        return formats_;
    }

private:
    std::string text_;
    FormatList formats_;
};

#define THROW_PARSE_ERROR(text, formats, ...)                             \
    throw enumkit::error::ParseError(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                     ENUMKIT_FUNC_NAME, text, formats,     \
                                     __VA_ARGS__)

}  // namespace enumkit::error

#endif  // ENUMKIT_ERROR_EXCEPTION_HPP
