/**
 * LSV Inspector - Result Type
 *
 * Provides a Result<T> type for consistent error handling across the decoders.
 * Similar to C++23's std::expected.
 */

#pragma once

#include <cstdint>
#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lsv {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        UnrecognizedFormat,     // Bad magic or unsupported header version
        UnsupportedCompression, // Unknown compression method or flag bits
        UnsupportedType,        // Unknown attribute type tag
        CorruptData,            // Out-of-bounds range, size mismatch, broken structure
        InvalidEncoding,        // Non UTF-8 text where text is required
        NotFound,               // Missing member, node or attribute
        TypeMismatch,           // Value requested as the wrong variant
        IoError,
        InvalidArgument
    };

    Code code = Code::None;
    std::string message;
    std::string context;  // Additional context (member name, path, etc.)

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }

    // Common error constructors
    static Error unrecognized_format(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::UnrecognizedFormat, msg, ctx);
    }

    static Error unsupported_compression(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::UnsupportedCompression, msg, ctx);
    }

    static Error unsupported_type(uint32_t raw_tag, const std::string& ctx = "") {
        return Error(Code::UnsupportedType, "Unsupported attribute type " + std::to_string(raw_tag), ctx);
    }

    static Error corrupt_data(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::CorruptData, msg, ctx);
    }

    static Error invalid_encoding(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::InvalidEncoding, msg, ctx);
    }

    static Error not_found(const std::string& what, const std::string& ctx = "") {
        return Error(Code::NotFound, what + " not found", ctx);
    }

    static Error type_mismatch(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::TypeMismatch, msg, ctx);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error invalid_argument(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::InvalidArgument, msg, ctx);
    }
};

/**
 * Name of an error code, for log lines and CLI output.
 */
constexpr const char* error_code_string(Error::Code code) {
    switch (code) {
        case Error::Code::None:                   return "None";
        case Error::Code::UnrecognizedFormat:     return "UnrecognizedFormat";
        case Error::Code::UnsupportedCompression: return "UnsupportedCompression";
        case Error::Code::UnsupportedType:        return "UnsupportedType";
        case Error::Code::CorruptData:            return "CorruptData";
        case Error::Code::InvalidEncoding:        return "InvalidEncoding";
        case Error::Code::NotFound:               return "NotFound";
        case Error::Code::TypeMismatch:           return "TypeMismatch";
        case Error::Code::IoError:                return "IoError";
        case Error::Code::InvalidArgument:        return "InvalidArgument";
        default:                                  return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 *
 * Usage:
 *   Result<Package> open(std::vector<uint8_t> bytes);
 *
 *   auto result = PackageReader::open(bytes);
 *   if (result) {
 *       auto& package = result.value();
 *       // use package...
 *   } else {
 *       std::cerr << "Error: " << result.error().full_message() << "\n";
 *   }
 */
template<typename T>
class Result {
public:
    // Success construction
    Result(T value) : data_(std::move(value)) {}

    // Error construction
    Result(Error error) : data_(std::move(error)) {}

    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    // Access value with default
    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error
    const Error& error() const {
        if (ok()) {
            static const Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    // Shorthand for error().code
    Error::Code code() const { return error().code; }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    // Transform the value if present
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (ok()) {
            return Result<U>(func(value()));
        }
        return Result<U>(error());
    }

    // Convert to optional (discards error info)
    std::optional<T> to_optional() const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return std::nullopt;
    }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static const Error no_error;
        if (error_) {
            return *error_;
        }
        return no_error;
    }

    Error::Code code() const { return error().code; }

    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

// Helper macros for early return on error
#define LSV_TRY(expr) \
    do { \
        auto _lsv_result = (expr); \
        if (!_lsv_result.ok()) { \
            return _lsv_result.error(); \
        } \
    } while(0)

#define LSV_TRY_ASSIGN(var, expr) \
    auto _lsv_result_##var = (expr); \
    if (!_lsv_result_##var.ok()) { \
        return _lsv_result_##var.error(); \
    } \
    auto var = std::move(_lsv_result_##var.value())

} // namespace lsv
