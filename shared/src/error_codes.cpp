#include "chunkdrop/error_codes.hpp"

#include <array>

namespace chunkdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            unsigned int status;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidParameter, "invalid_parameter", 400},
            {ErrorCode::Conflict, "conflict", 409},
            {ErrorCode::SizeExceeded, "size_exceeded", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::IntegrityMismatch, "integrity_mismatch", 400},
            {ErrorCode::Busy, "busy", 409},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
            {ErrorCode::LengthRequired, "length_required", 411},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::HeaderTooLarge, "header_too_large", 431},
            {ErrorCode::Timeout, "timeout", 408},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    unsigned int http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

    HttpError::HttpError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace chunkdrop
