#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <sstream>
#include <cstddef>

// Check if source_location is available (not with nvcc)
#if __cplusplus >= 202002L && !defined(__NVCC__) && !defined(__CUDACC__)
    #define PRB_HAS_SOURCE_LOCATION 1
    #include <source_location>
#else
    #define PRB_HAS_SOURCE_LOCATION 0
#endif

namespace prb {

// ============================================================================
// Source Location Compatibility Layer
// ============================================================================

#if PRB_HAS_SOURCE_LOCATION
using SourceLocation = std::source_location;
#else
// nvcc does not ship std::source_location; the compiler builtins carry the same data
struct SourceLocation {
    const char* file_;
    int line_;
    const char* function_;

    constexpr SourceLocation(const char* f = __builtin_FILE(),
                              int l = __builtin_LINE(),
                              const char* fn = __builtin_FUNCTION())
        : file_(f), line_(l), function_(fn) {}

    constexpr const char* file_name() const noexcept { return file_; }
    constexpr int line() const noexcept { return line_; }
    constexpr const char* function_name() const noexcept { return function_; }
};
#endif

// ============================================================================
// Exception Base Class
// ============================================================================

class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message,
                       const SourceLocation& location = SourceLocation{})
        : std::runtime_error(format_message(message, location))
        , file_(location.file_name())
        , line_(static_cast<int>(location.line()))
        , function_(location.function_name())
    {}

    const char* file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const char* function() const noexcept { return function_; }

private:
    const char* file_;
    int line_;
    const char* function_;

    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        std::ostringstream oss;
        oss << loc.file_name() << ":"
            << loc.line() << " in "
            << loc.function_name() << "(): "
            << msg;
        return oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message,
                        const SourceLocation& location = SourceLocation{})
        : Exception(message, location) {}
};

class InvalidArgumentError : public Exception {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const SourceLocation& location = SourceLocation{})
        : Exception(message, location) {}
};

class OutOfRangeError : public Exception {
public:
    explicit OutOfRangeError(const std::string& message,
                             const SourceLocation& location = SourceLocation{})
        : Exception(message, location) {}
};

class FileIOError : public Exception {
public:
    explicit FileIOError(
        const std::string& filename,
        const std::string& operation = "access",
        const SourceLocation& location = SourceLocation{})
        : Exception("Failed to " + operation + " file: " + filename, location)
    {}
};

/**
 * @brief Two points (or a point list) with inconsistent component counts
 */
class DimensionMismatchError : public Exception {
public:
    explicit DimensionMismatchError(
        std::size_t expected,
        std::size_t actual,
        const SourceLocation& location = SourceLocation{})
        : Exception(format_dimension_message(expected, actual), location)
        , expected_(expected)
        , actual_(actual)
    {}

    std::size_t expected() const noexcept { return expected_; }
    std::size_t actual() const noexcept { return actual_; }

private:
    std::size_t expected_;
    std::size_t actual_;

    static std::string format_dimension_message(std::size_t expected, std::size_t actual) {
        std::ostringstream oss;
        oss << "Dimension mismatch: expected " << expected
            << " components, got " << actual;
        return oss.str();
    }
};

/**
 * @brief A particle family does not fit into the bond list row width
 */
class CapacityExceededError : public Exception {
public:
    explicit CapacityExceededError(
        std::size_t truncated_rows,
        std::size_t max_family,
        std::size_t capacity,
        const SourceLocation& location = SourceLocation{})
        : Exception(format_capacity_message(truncated_rows, max_family, capacity), location)
        , truncated_rows_(truncated_rows)
        , max_family_(max_family)
        , capacity_(capacity)
    {}

    std::size_t truncated_rows() const noexcept { return truncated_rows_; }
    std::size_t max_family() const noexcept { return max_family_; }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t truncated_rows_;
    std::size_t max_family_;
    std::size_t capacity_;

    static std::string format_capacity_message(std::size_t rows, std::size_t max_family,
                                               std::size_t capacity) {
        std::ostringstream oss;
        oss << "Bond list capacity " << capacity << " exceeded by " << rows
            << " particle(s) (largest family: " << max_family << ")";
        return oss.str();
    }
};

// ============================================================================
// Assertion Macros
// ============================================================================

#define PRB_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::prb::LogicError( \
                std::string("Assertion failed: ") + #condition + ": " + (message) \
            ); \
        } \
    } while (false)

#define PRB_REQUIRE(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::prb::InvalidArgumentError( \
                std::string("Requirement failed: ") + #condition + ": " + (message) \
            ); \
        } \
    } while (false)

#define PRB_CHECK_RANGE(index, size) \
    do { \
        if ((index) >= (size)) { \
            throw ::prb::OutOfRangeError( \
                "Index " + std::to_string(index) + " out of range [0, " + \
                std::to_string(size) + ")" \
            ); \
        } \
    } while (false)

} // namespace prb
