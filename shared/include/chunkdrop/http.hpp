/**
 * chunkdrop - Minimal HTTP/1.1 message model: head parsing, query decoding and serialization.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrop/error_codes.hpp"

namespace chunkdrop::http
{

    struct Header
    {
        std::string name;
        std::string value;
    };

    using HeaderList = std::vector<Header>;
    using QueryParams = std::map<std::string, std::string>;

    // Case-insensitive lookup of the first header with the given name.
    std::optional<std::string_view> find_header(const HeaderList &headers, std::string_view name);

    struct Request
    {
        std::string method;
        std::string target;
        std::string path;
        QueryParams query;
        unsigned int version_major{1};
        unsigned int version_minor{1};
        HeaderList headers;

        std::optional<std::string_view> header(std::string_view name) const;
        std::optional<std::string> query_value(std::string_view key) const;

        // Throws HttpError when the header is present but malformed.
        std::optional<std::uint64_t> content_length() const;

        bool keep_alive() const;
        bool expects_continue() const;
        bool has_transfer_encoding() const;
    };

    struct Response
    {
        unsigned int status{200};
        HeaderList headers;
        std::string body;

        void set_header(std::string name, std::string value);
        std::optional<std::string_view> header(std::string_view name) const;
    };

    struct ResponseHead
    {
        unsigned int status{};
        std::string reason;
        HeaderList headers;

        std::optional<std::uint64_t> content_length() const;
    };

    // `head` is everything before the blank line that ends the header block.
    Request parse_request_head(std::string_view head);

    ResponseHead parse_response_head(std::string_view head);

    std::string serialize_head(const Response &response, std::uint64_t content_length, bool keep_alive);

    std::string serialize(const Response &response, bool keep_alive);

    std::string serialize_request_head(std::string_view method, std::string_view target, std::string_view host,
                                       std::uint64_t content_length, const HeaderList &extra_headers = {});

    std::string_view reason_phrase(unsigned int status) noexcept;

    std::string url_decode(std::string_view input, bool plus_as_space = true);

    std::string url_encode(std::string_view input);

    QueryParams parse_query(std::string_view query);

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    Response make_json_response(unsigned int status, const nlohmann::json &body);

    Response make_error_response(ErrorCode code, std::string_view message);

    Response make_text_response(unsigned int status, std::string body, std::string content_type = "text/plain; charset=utf-8");

} // namespace chunkdrop::http
