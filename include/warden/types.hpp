#pragma once

#include <expected>
#include <string>
#include <stdexcept>
#include <format>

namespace warden
{

    /**
     * Error categories for Warden operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        ValidationError,
        StorageError,
        AlreadyRunning,
        NotRunning,
        IntegrityViolation,
        DrainTimeout,
        ServiceError,
        NotFound,
        InvalidInput,
        InternalError,
        IOError,
        ParsingError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * Warden error with code and message
     */
    class WardenError : public std::runtime_error
    {
    public:
        ErrorCode code;

        WardenError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static WardenError config(const std::string &msg)
        {
            return WardenError(ErrorCode::ConfigError, msg);
        }

        static WardenError crypto(const std::string &msg)
        {
            return WardenError(ErrorCode::CryptoError, msg);
        }

        static WardenError validation(const std::string &msg)
        {
            return WardenError(ErrorCode::ValidationError, msg);
        }

        static WardenError storage(const std::string &msg)
        {
            return WardenError(ErrorCode::StorageError, msg);
        }

        static WardenError already_running(const std::string &msg)
        {
            return WardenError(ErrorCode::AlreadyRunning, msg);
        }

        static WardenError not_running(const std::string &msg)
        {
            return WardenError(ErrorCode::NotRunning, msg);
        }

        static WardenError integrity(const std::string &msg)
        {
            return WardenError(ErrorCode::IntegrityViolation, msg);
        }

        static WardenError drain_timeout(const std::string &msg)
        {
            return WardenError(ErrorCode::DrainTimeout, msg);
        }

        static WardenError service(const std::string &msg)
        {
            return WardenError(ErrorCode::ServiceError, msg);
        }

        static WardenError not_found(const std::string &msg)
        {
            return WardenError(ErrorCode::NotFound, msg);
        }

        static WardenError invalid_input(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidInput, msg);
        }

        static WardenError io(const std::string &msg)
        {
            return WardenError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardenError>;

} // namespace warden
