/**
 * chunkdrop - Error codes shared by the server, the uploader client and the HTTP layer.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidParameter = 1,
        Conflict = 2,
        SizeExceeded = 3,
        NotFound = 4,
        IntegrityMismatch = 5,
        Busy = 6,
        MethodNotAllowed = 7,
        LengthRequired = 8,
        PayloadTooLarge = 9,
        HeaderTooLarge = 10,
        Timeout = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    ErrorCode error_code_from_string(std::string_view value) noexcept;

    // HTTP status a response carrying this code is sent with.
    unsigned int http_status(ErrorCode code) noexcept;

    class HttpError : public std::runtime_error
    {
    public:
        HttpError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace chunkdrop
