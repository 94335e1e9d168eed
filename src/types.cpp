#include "warden/types.hpp"

namespace warden
{

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::ValidationError:
            return "validation_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::AlreadyRunning:
            return "already_running";
        case ErrorCode::NotRunning:
            return "not_running";
        case ErrorCode::IntegrityViolation:
            return "integrity_violation";
        case ErrorCode::DrainTimeout:
            return "drain_timeout";
        case ErrorCode::ServiceError:
            return "service_error";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::InternalError:
            return "internal_error";
        case ErrorCode::IOError:
            return "io_error";
        case ErrorCode::ParsingError:
            return "parsing_error";
        }
        return "unknown";
    }

} // namespace warden
