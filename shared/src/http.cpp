#include "chunkdrop/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>

namespace chunkdrop::http
{

    namespace
    {

        struct StatusMapping
        {
            unsigned int status;
            std::string_view reason;
        };

        constexpr std::array<StatusMapping, 17> kReasonPhrases{{
            {100, "Continue"},
            {200, "OK"},
            {201, "Created"},
            {204, "No Content"},
            {400, "Bad Request"},
            {404, "Not Found"},
            {405, "Method Not Allowed"},
            {408, "Request Timeout"},
            {409, "Conflict"},
            {411, "Length Required"},
            {413, "Payload Too Large"},
            {415, "Unsupported Media Type"},
            {431, "Request Header Fields Too Large"},
            {500, "Internal Server Error"},
            {501, "Not Implemented"},
            {503, "Service Unavailable"},
            {505, "HTTP Version Not Supported"},
        }};

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

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        std::vector<std::string_view> split_lines(std::string_view head)
        {
            std::vector<std::string_view> lines;
            while (!head.empty())
            {
                const auto pos = head.find('\n');
                auto line = head.substr(0, pos);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                if (pos == std::string_view::npos)
                {
                    break;
                }
                head.remove_prefix(pos + 1);
            }
            return lines;
        }

        bool is_token_char(char ch)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c))
            {
                return true;
            }
            constexpr std::string_view kExtra = "!#$%&'*+-.^_`|~";
            return kExtra.find(ch) != std::string_view::npos;
        }

        HeaderList parse_header_lines(const std::vector<std::string_view> &lines, std::size_t first)
        {
            HeaderList headers;
            for (std::size_t i = first; i < lines.size(); ++i)
            {
                const auto line = lines[i];
                if (line.empty())
                {
                    continue;
                }
                if (line.front() == ' ' || line.front() == '\t')
                {
                    throw HttpError(ErrorCode::InvalidParameter, "Folded header lines are not supported");
                }
                const auto colon = line.find(':');
                if (colon == std::string_view::npos || colon == 0)
                {
                    throw HttpError(ErrorCode::InvalidParameter, "Malformed header line");
                }
                const auto name = line.substr(0, colon);
                if (!std::all_of(name.begin(), name.end(), is_token_char))
                {
                    throw HttpError(ErrorCode::InvalidParameter, "Malformed header name");
                }
                headers.push_back(Header{std::string(name), std::string(trim(line.substr(colon + 1)))});
            }
            return headers;
        }

        std::optional<std::uint64_t> parse_content_length(const HeaderList &headers)
        {
            std::optional<std::uint64_t> result;
            for (const auto &header : headers)
            {
                if (!iequals(header.name, "Content-Length"))
                {
                    continue;
                }
                std::uint64_t value = 0;
                const auto *begin = header.value.data();
                const auto *end = begin + header.value.size();
                const auto [ptr, ec] = std::from_chars(begin, end, value);
                if (ec != std::errc{} || ptr != end || header.value.empty())
                {
                    throw HttpError(ErrorCode::InvalidParameter, "Invalid Content-Length");
                }
                if (result && *result != value)
                {
                    throw HttpError(ErrorCode::InvalidParameter, "Conflicting Content-Length headers");
                }
                result = value;
            }
            return result;
        }

        bool header_has_token(std::optional<std::string_view> value, std::string_view token)
        {
            if (!value)
            {
                return false;
            }
            auto rest = *value;
            while (!rest.empty())
            {
                const auto comma = rest.find(',');
                if (iequals(trim(rest.substr(0, comma)), token))
                {
                    return true;
                }
                if (comma == std::string_view::npos)
                {
                    break;
                }
                rest.remove_prefix(comma + 1);
            }
            return false;
        }

    } // namespace

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    std::optional<std::string_view> find_header(const HeaderList &headers, std::string_view name)
    {
        for (const auto &header : headers)
        {
            if (iequals(header.name, name))
            {
                return std::string_view(header.value);
            }
        }
        return std::nullopt;
    }

    std::optional<std::string_view> Request::header(std::string_view name) const
    {
        return find_header(headers, name);
    }

    std::optional<std::string> Request::query_value(std::string_view key) const
    {
        const auto it = query.find(std::string(key));
        if (it == query.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::uint64_t> Request::content_length() const
    {
        return parse_content_length(headers);
    }

    bool Request::keep_alive() const
    {
        const auto connection = header("Connection");
        if (version_major == 1 && version_minor == 0)
        {
            return header_has_token(connection, "keep-alive");
        }
        return !header_has_token(connection, "close");
    }

    bool Request::expects_continue() const
    {
        const auto expect = header("Expect");
        return expect && iequals(trim(*expect), "100-continue");
    }

    bool Request::has_transfer_encoding() const
    {
        return header("Transfer-Encoding").has_value();
    }

    void Response::set_header(std::string name, std::string value)
    {
        for (auto &header : headers)
        {
            if (iequals(header.name, name))
            {
                header.value = std::move(value);
                return;
            }
        }
        headers.push_back(Header{std::move(name), std::move(value)});
    }

    std::optional<std::string_view> Response::header(std::string_view name) const
    {
        return find_header(headers, name);
    }

    std::optional<std::uint64_t> ResponseHead::content_length() const
    {
        return parse_content_length(headers);
    }

    Request parse_request_head(std::string_view head)
    {
        const auto lines = split_lines(head);
        if (lines.empty() || lines.front().empty())
        {
            throw HttpError(ErrorCode::InvalidParameter, "Empty request line");
        }

        const auto request_line = lines.front();
        const auto first_space = request_line.find(' ');
        const auto last_space = request_line.rfind(' ');
        if (first_space == std::string_view::npos || first_space == last_space)
        {
            throw HttpError(ErrorCode::InvalidParameter, "Malformed request line");
        }

        Request request;
        request.method = std::string(request_line.substr(0, first_space));
        request.target = std::string(request_line.substr(first_space + 1, last_space - first_space - 1));
        const auto version = request_line.substr(last_space + 1);

        if (request.method.empty() || !std::all_of(request.method.begin(), request.method.end(), is_token_char))
        {
            throw HttpError(ErrorCode::InvalidParameter, "Malformed request method");
        }
        if (request.target.empty() || request.target.front() != '/')
        {
            throw HttpError(ErrorCode::InvalidParameter, "Only origin-form request targets are supported");
        }
        if (version.size() != 8 || version.substr(0, 5) != "HTTP/" || version[6] != '.' ||
            !std::isdigit(static_cast<unsigned char>(version[5])) ||
            !std::isdigit(static_cast<unsigned char>(version[7])))
        {
            throw HttpError(ErrorCode::InvalidParameter, "Malformed HTTP version");
        }
        request.version_major = static_cast<unsigned int>(version[5] - '0');
        request.version_minor = static_cast<unsigned int>(version[7] - '0');
        if (request.version_major != 1)
        {
            throw HttpError(ErrorCode::InvalidParameter, "Unsupported HTTP version");
        }

        const auto query_pos = request.target.find('?');
        const std::string_view target_view(request.target);
        request.path = url_decode(target_view.substr(0, query_pos), false);
        if (query_pos != std::string::npos)
        {
            request.query = parse_query(target_view.substr(query_pos + 1));
        }

        request.headers = parse_header_lines(lines, 1);
        return request;
    }

    ResponseHead parse_response_head(std::string_view head)
    {
        const auto lines = split_lines(head);
        if (lines.empty())
        {
            throw HttpError(ErrorCode::InvalidParameter, "Empty status line");
        }
        const auto status_line = lines.front();
        if (status_line.substr(0, 5) != "HTTP/")
        {
            throw HttpError(ErrorCode::InvalidParameter, "Malformed status line");
        }
        const auto first_space = status_line.find(' ');
        if (first_space == std::string_view::npos || status_line.size() < first_space + 4)
        {
            throw HttpError(ErrorCode::InvalidParameter, "Malformed status line");
        }

        ResponseHead response;
        const auto code = status_line.substr(first_space + 1, 3);
        const auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), response.status);
        if (ec != std::errc{} || ptr != code.data() + code.size())
        {
            throw HttpError(ErrorCode::InvalidParameter, "Malformed status code");
        }
        if (status_line.size() > first_space + 5)
        {
            response.reason = std::string(status_line.substr(first_space + 5));
        }
        response.headers = parse_header_lines(lines, 1);
        return response;
    }

    std::string serialize_head(const Response &response, std::uint64_t content_length, bool keep_alive)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << response.status << ' ' << reason_phrase(response.status) << "\r\n";
        for (const auto &header : response.headers)
        {
            if (iequals(header.name, "Content-Length") || iequals(header.name, "Connection"))
            {
                continue;
            }
            out << header.name << ": " << header.value << "\r\n";
        }
        out << "Content-Length: " << content_length << "\r\n";
        out << "Connection: " << (keep_alive ? "keep-alive" : "close") << "\r\n\r\n";
        return out.str();
    }

    std::string serialize(const Response &response, bool keep_alive)
    {
        auto result = serialize_head(response, response.body.size(), keep_alive);
        result += response.body;
        return result;
    }

    std::string serialize_request_head(std::string_view method, std::string_view target, std::string_view host,
                                       std::uint64_t content_length, const HeaderList &extra_headers)
    {
        std::ostringstream out;
        out << method << ' ' << target << " HTTP/1.1\r\n";
        out << "Host: " << host << "\r\n";
        for (const auto &header : extra_headers)
        {
            out << header.name << ": " << header.value << "\r\n";
        }
        out << "Content-Length: " << content_length << "\r\n";
        out << "Connection: close\r\n\r\n";
        return out.str();
    }

    std::string_view reason_phrase(unsigned int status) noexcept
    {
        for (const auto &mapping : kReasonPhrases)
        {
            if (mapping.status == status)
            {
                return mapping.reason;
            }
        }
        return "Unknown";
    }

    std::string url_decode(std::string_view input, bool plus_as_space)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            const char ch = input[i];
            if (ch == '%' && i + 2 < input.size())
            {
                const int high = hex_value(input[i + 1]);
                const int low = hex_value(input[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    output.push_back(static_cast<char>((high << 4) | low));
                    i += 2;
                    continue;
                }
            }
            if (ch == '+' && plus_as_space)
            {
                output.push_back(' ');
                continue;
            }
            output.push_back(ch);
        }
        return output;
    }

    std::string url_encode(std::string_view input)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string output;
        output.reserve(input.size() * 3);
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || ch == '-' || ch == '_' || ch == '.' || ch == '~')
            {
                output.push_back(ch);
            }
            else
            {
                output.push_back('%');
                output.push_back(kHexDigits[(c >> 4) & 0x0F]);
                output.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return output;
    }

    QueryParams parse_query(std::string_view query)
    {
        QueryParams params;
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const auto pair = query.substr(0, amp);
            if (!pair.empty())
            {
                const auto eq = pair.find('=');
                auto key = url_decode(pair.substr(0, eq));
                auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
                // First occurrence wins.
                params.emplace(std::move(key), std::move(value));
            }
            if (amp == std::string_view::npos)
            {
                break;
            }
            query.remove_prefix(amp + 1);
        }
        return params;
    }

    Response make_json_response(unsigned int status, const nlohmann::json &body)
    {
        Response response;
        response.status = status;
        response.set_header("Content-Type", "application/json");
        response.body = body.dump();
        return response;
    }

    Response make_error_response(ErrorCode code, std::string_view message)
    {
        nlohmann::json body{
            {"error", to_string(code)},
            {"message", message},
        };
        return make_json_response(http_status(code), body);
    }

    Response make_text_response(unsigned int status, std::string body, std::string content_type)
    {
        Response response;
        response.status = status;
        response.set_header("Content-Type", std::move(content_type));
        response.body = std::move(body);
        return response;
    }

} // namespace chunkdrop::http
