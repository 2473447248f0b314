#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkdrop::server::multipart
{

    struct FormPart
    {
        std::string name;
        std::optional<std::string> filename;
        std::string content_type;
        // Views into the body passed to parse(); valid only as long as that body.
        std::string_view data;
    };

    // True when the part has a filename that is not blank; browsers send `filename=""` for an empty file input.
    bool carries_file(const FormPart &part);

    // Extracts the boundary parameter of a multipart/form-data Content-Type, if any.
    std::optional<std::string> boundary_from_content_type(std::string_view content_type);

    // Throws chunkdrop::HttpError(InvalidParameter) on a malformed body.
    std::vector<FormPart> parse(std::string_view body, std::string_view boundary);

} // namespace chunkdrop::server::multipart
