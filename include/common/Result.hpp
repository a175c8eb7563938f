#pragma once
#include <variant>
#include <string>
#include <stdexcept>

namespace common {

    struct Ok {};

    enum class ErrorCode {
        Success = 0,
        Cancelled,        // Clean stop (Expected)
        Disconnected,     // Peer closed / EOF / reset
        TransportError,   // Read or write failed on the socket
        ProtocolError,    // Handshake mismatch
        Unavailable,      // Capability has nothing to offer yet
        DeviceNotFound,   // Display / window missing
        NotInitialized,
        SystemError,
        BindFailed,       // Listener could not bind or listen
        InvalidArgument,
        Unknown
    };

    struct AppError {
        ErrorCode code;
        std::string message;
        std::string location; // __FILE__:__LINE__
    };

    // Errors that end the connection they happened on
    inline bool is_transport_error(ErrorCode code) {
        return code == ErrorCode::Disconnected ||
               code == ErrorCode::TransportError ||
               code == ErrorCode::Cancelled;
    }

    inline const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::Success:         return "Success";
            case ErrorCode::Cancelled:       return "Cancelled";
            case ErrorCode::Disconnected:    return "Disconnected";
            case ErrorCode::TransportError:  return "TransportError";
            case ErrorCode::ProtocolError:   return "ProtocolError";
            case ErrorCode::Unavailable:     return "Unavailable";
            case ErrorCode::DeviceNotFound:  return "DeviceNotFound";
            case ErrorCode::NotInitialized:  return "NotInitialized";
            case ErrorCode::SystemError:     return "SystemError";
            case ErrorCode::BindFailed:      return "BindFailed";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::Unknown:         return "Unknown";
        }
        return "Unknown";
    }

    template <typename T = Ok>
    class Result {
        std::variant<T, AppError> value;

    public:
        // Constructors
        Result(T v) : value(std::move(v)) {}
        Result(AppError e) : value(std::move(e)) {}

        // Static Builders
        static Result<T> ok(T v) { return Result(std::move(v)); }

        static Result<T> err(ErrorCode code, const std::string& msg, const std::string& loc = "") {
            return Result(AppError{code, msg, loc});
        }

        // Re-wrap an error coming from a Result of another type
        static Result<T> err(const AppError& e) { return Result(e); }

        // Checkers
        bool is_ok() const { return std::holds_alternative<T>(value); }
        bool is_err() const { return std::holds_alternative<AppError>(value); }

        // Unwrappers
        const T& unwrap() const {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::unwrap failed: " + e.message);
            }
            return std::get<T>(value);
        }

        // Moves the value out; the Result must not be unwrapped again
        T take() {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::take failed: " + e.message);
            }
            return std::move(std::get<T>(value));
        }

        const AppError& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error called on success value");
            }
            return std::get<AppError>(value);
        }

        // For void-like results (Result<Ok>)
        static Result<Ok> success() { return Result<Ok>(Ok{}); }
    };

    using EmptyResult = Result<Ok>;

} // namespace common
