// =============================================================================
// docsan - Error Handling Framework
// =============================================================================
// Every failure carries an ErrorCode that is also the process exit code:
//
//   0 success                   6 invalid argument
//   1 usage error               7 file not found
//   2 I/O error                 8 file exists
//   3 mapping file error        9 leak detected
//   4 placeholder collision    10 invalid state
//   5 detector unavailable
//
// Structural failures are thrown as DocsanException subclasses. Seams where
// the caller recovers (detector creation, mapping tryLoad, batch items)
// return Result<T> instead.
// =============================================================================

#ifndef DOCSAN_COMMON_ERROR_H
#define DOCSAN_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace docsan {

// =============================================================================
// Error Code Enumeration
// =============================================================================

enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,

    /// @brief Read/write, permission or rename failure.
    kIOError = 2,

    /// @brief Mapping artifact missing, truncated, corrupt, of an unsupported
    ///        version, or not a bijection.
    kMappingFileError = 3,

    /// @brief Source text already contains a placeholder delimiter.
    kPlaceholderCollision = 4,

    kDetectorUnavailable = 5,
    kInvalidArgument = 6,
    kFileNotFound = 7,
    kFileExists = 8,

    /// @brief A canonical value or variant survived into the sanitized text.
    kLeakDetected = 9,

    /// @brief Session operation called out of order.
    kInvalidState = 10
};

[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Category name used in what() strings.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kMappingFileError:
            return "mapping file error";
        case ErrorCode::kPlaceholderCollision:
            return "placeholder collision";
        case ErrorCode::kDetectorUnavailable:
            return "detector unavailable";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
        case ErrorCode::kLeakDetected:
            return "leak detected";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where an error happened: file, mapping entry, byte offset.
struct ErrorContext {
    std::string filePath;

    std::optional<std::uint32_t> entryIndex;

    /// @brief Offset into the artifact or the document text.
    std::optional<std::uint64_t> byteOffset;

    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withEntry(std::uint32_t index) {
        entryIndex = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief "file: X, entry: N, offset: M" (present fields only).
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

class DocsanException : public std::exception {
public:
    DocsanException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    DocsanException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~DocsanException() override = default;

    DocsanException(const DocsanException&) = default;
    DocsanException(DocsanException&&) noexcept = default;
    DocsanException& operator=(const DocsanException&) = default;
    DocsanException& operator=(DocsanException&&) noexcept = default;

    /// @brief Get the formatted error message (category, message, context).
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Message without category and context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1 or 6).
class UsageError : public DocsanException {
public:
    explicit UsageError(std::string message)
        : DocsanException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(ErrorCode code, std::string message)
        : DocsanException(code, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : DocsanException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2, 7 or 8).
/// @note Thrown for read/write failures, missing inputs, existing outputs.
class IOError : public DocsanException {
public:
    explicit IOError(std::string message)
        : DocsanException(ErrorCode::kIOError, std::move(message)) {}

    IOError(ErrorCode code, std::string message)
        : DocsanException(code, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : DocsanException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : DocsanException(ErrorCode::kIOError, formatWithSystemError(message, ec)) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : DocsanException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                          std::move(context)) {}

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

/// @brief Exception for unusable mapping artifacts (exit code 3).
/// @note Decode cannot proceed without a trustworthy mapping.
class MappingFileError : public DocsanException {
public:
    explicit MappingFileError(std::string message)
        : DocsanException(ErrorCode::kMappingFileError, std::move(message)) {}

    MappingFileError(std::string message, ErrorContext context)
        : DocsanException(ErrorCode::kMappingFileError, std::move(message), std::move(context)) {}

    /// @brief Construct for a checksum mismatch with expected and actual values.
    MappingFileError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : DocsanException(ErrorCode::kMappingFileError,
                          formatChecksumMismatch(expected, actual),
                          std::move(context)),
          expected_(expected),
          actual_(actual) {}

    /// @brief Expected checksum (checksum mismatches only).
    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    /// @brief Actual checksum (checksum mismatches only).
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Exception raised when the source already contains placeholder
///        delimiters (exit code 4).
class PlaceholderCollisionError : public DocsanException {
public:
    explicit PlaceholderCollisionError(std::string message)
        : DocsanException(ErrorCode::kPlaceholderCollision, std::move(message)) {}

    /// @brief Construct with the colliding offset and an excerpt of the text.
    PlaceholderCollisionError(std::uint64_t offset, std::string collidingText,
                              ErrorContext context = ErrorContext{})
        : DocsanException(ErrorCode::kPlaceholderCollision,
                          formatCollision(offset, collidingText),
                          std::move(context.withOffset(offset))),
          offset_(offset),
          collidingText_(std::move(collidingText)) {}

    /// @brief Byte offset of the first colliding delimiter (if available).
    [[nodiscard]] std::optional<std::uint64_t> offset() const noexcept { return offset_; }

    /// @brief Excerpt of the colliding text.
    [[nodiscard]] const std::string& collidingText() const noexcept { return collidingText_; }

private:
    static std::string formatCollision(std::uint64_t offset, const std::string& text);

    std::optional<std::uint64_t> offset_;
    std::string collidingText_;
};

/// @brief Exception for detectors that cannot run (exit code 5).
/// @note Recoverable by the caller: the engine works with reduced coverage.
class DetectorUnavailableError : public DocsanException {
public:
    explicit DetectorUnavailableError(std::string message)
        : DocsanException(ErrorCode::kDetectorUnavailable, std::move(message)) {}

    DetectorUnavailableError(std::string message, ErrorContext context)
        : DocsanException(ErrorCode::kDetectorUnavailable, std::move(message),
                          std::move(context)) {}
};

/// @brief Exception for sensitive values surviving the forward pass (exit code 9).
class LeakDetectedError : public DocsanException {
public:
    explicit LeakDetectedError(std::string message)
        : DocsanException(ErrorCode::kLeakDetected, std::move(message)) {}

    LeakDetectedError(std::string message, ErrorContext context)
        : DocsanException(ErrorCode::kLeakDetected, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error half of Result<T>.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a DocsanException.
    explicit Error(const DocsanException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the matching exception type.
    [[nodiscard]] DocsanException toException() const;

    /// @brief Throw the matching exception type.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> makeError(const DocsanException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Unwrap a Result, throwing the matching exception on error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if the void result holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note Non-docsan exceptions are reported as I/O errors.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const DocsanException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace docsan

#endif  // DOCSAN_COMMON_ERROR_H
