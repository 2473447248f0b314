#include "chunkdrop/server/multipart.hpp"

#include "chunkdrop/error_codes.hpp"
#include "chunkdrop/http.hpp"

namespace chunkdrop::server::multipart
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t");
            return value.substr(begin, end - begin + 1);
        }

        std::string unquote(std::string_view value)
        {
            value = trim(value);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }

        // Reads `key=value` pairs of a header such as `form-data; name="files"; filename="a.txt"`.
        std::optional<std::string> header_parameter(std::string_view header, std::string_view key)
        {
            while (!header.empty())
            {
                const auto semicolon = header.find(';');
                const auto item = trim(header.substr(0, semicolon));
                const auto eq = item.find('=');
                if (eq != std::string_view::npos && chunkdrop::http::iequals(trim(item.substr(0, eq)), key))
                {
                    return unquote(item.substr(eq + 1));
                }
                if (semicolon == std::string_view::npos)
                {
                    break;
                }
                header.remove_prefix(semicolon + 1);
            }
            return std::nullopt;
        }

        [[noreturn]] void malformed(const char *what)
        {
            throw chunkdrop::HttpError(chunkdrop::ErrorCode::InvalidParameter,
                                       std::string("Malformed multipart body: ") + what);
        }

    } // namespace

    bool carries_file(const FormPart &part)
    {
        return part.filename && part.filename->find_first_not_of(" \t\r\n\v\f") != std::string::npos;
    }

    std::optional<std::string> boundary_from_content_type(std::string_view content_type)
    {
        const auto semicolon = content_type.find(';');
        if (!chunkdrop::http::iequals(trim(content_type.substr(0, semicolon)), "multipart/form-data") ||
            semicolon == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto boundary = header_parameter(content_type.substr(semicolon + 1), "boundary");
        if (!boundary || boundary->empty() || boundary->size() > 200)
        {
            return std::nullopt;
        }
        return boundary;
    }

    std::vector<FormPart> parse(std::string_view body, std::string_view boundary)
    {
        const std::string delimiter = "--" + std::string(boundary);
        const std::string separator = "\r\n" + delimiter;

        auto pos = body.find(delimiter);
        if (pos == std::string_view::npos)
        {
            malformed("opening boundary missing");
        }
        pos += delimiter.size();

        std::vector<FormPart> parts;
        while (true)
        {
            if (body.substr(pos, 2) == "--")
            {
                return parts;
            }
            if (body.substr(pos, 2) != "\r\n")
            {
                malformed("boundary not followed by CRLF");
            }
            pos += 2;

            const auto headers_end = body.find("\r\n\r\n", pos);
            if (headers_end == std::string_view::npos)
            {
                malformed("part headers not terminated");
            }

            FormPart part;
            auto headers = body.substr(pos, headers_end - pos);
            while (!headers.empty())
            {
                const auto eol = headers.find("\r\n");
                const auto line = headers.substr(0, eol);
                const auto colon = line.find(':');
                if (colon != std::string_view::npos)
                {
                    const auto name = trim(line.substr(0, colon));
                    const auto value = trim(line.substr(colon + 1));
                    if (chunkdrop::http::iequals(name, "Content-Disposition"))
                    {
                        part.name = header_parameter(value, "name").value_or("");
                        part.filename = header_parameter(value, "filename");
                    }
                    else if (chunkdrop::http::iequals(name, "Content-Type"))
                    {
                        part.content_type = std::string(value);
                    }
                }
                if (eol == std::string_view::npos)
                {
                    break;
                }
                headers.remove_prefix(eol + 2);
            }

            const auto data_begin = headers_end + 4;
            const auto data_end = body.find(separator, data_begin);
            if (data_end == std::string_view::npos)
            {
                malformed("closing boundary missing");
            }
            part.data = body.substr(data_begin, data_end - data_begin);
            parts.push_back(std::move(part));
            pos = data_end + separator.size();
        }
    }

} // namespace chunkdrop::server::multipart
