#include <array>
#include <cctype>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <span>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkdrop/crypto.hpp"
#include "chunkdrop/error_codes.hpp"
#include "chunkdrop/http.hpp"

using namespace chunkdrop;
using namespace chunkdrop::http;

void run_server_component_tests();
void run_client_logger_tests();

namespace
{

    void test_request_head_parsing()
    {
        const auto request = parse_request_head(
            "POST /upload/chunk?name=photo%20one.jpg&size=1000&offset=600&relpath=a%2Fb HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "content-length: 400\r\n"
            "Expect: 100-continue\r\n"
            "\r\n");
        assert(request.method == "POST");
        assert(request.path == "/upload/chunk");
        assert(request.query_value("name") == std::optional<std::string>("photo one.jpg"));
        assert(request.query_value("relpath") == std::optional<std::string>("a/b"));
        assert(request.query_value("offset") == std::optional<std::string>("600"));
        assert(!request.query_value("hash"));
        assert(request.content_length() == std::optional<std::uint64_t>(400));
        assert(request.expects_continue());
        assert(request.keep_alive());
        assert(!request.has_transfer_encoding());
    }

    void test_request_head_connection_rules()
    {
        const auto http10 = parse_request_head("GET /stats HTTP/1.0\r\n\r\n");
        assert(!http10.keep_alive());
        assert(!http10.content_length());

        const auto closing = parse_request_head("GET /stats HTTP/1.1\r\nConnection: close\r\n\r\n");
        assert(!closing.keep_alive());

        const auto chunked = parse_request_head("POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
        assert(chunked.has_transfer_encoding());
    }

    void test_malformed_requests()
    {
        const std::array<std::string_view, 4> malformed = {
            "",
            "GET\r\n\r\n",
            "GET stats HTTP/1.1\r\n\r\n",
            "GET /stats HTTP/2.0\r\n\r\n",
        };
        for (const auto head : malformed)
        {
            bool caught = false;
            try
            {
                (void)parse_request_head(head);
            }
            catch (const HttpError &ex)
            {
                caught = ex.code() == ErrorCode::InvalidParameter;
            }
            assert(caught);
        }

        const auto bad_length = parse_request_head("POST /upload/chunk HTTP/1.1\r\nContent-Length: 12x\r\n\r\n");
        bool caught = false;
        try
        {
            (void)bad_length.content_length();
        }
        catch (const HttpError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_query_decoding()
    {
        const auto params = parse_query("name=a+b.txt&name=ignored&empty=&flag&pct=%41%2f%zz");
        assert(params.at("name") == "a b.txt");
        assert(params.at("empty").empty());
        assert(params.contains("flag"));
        assert(params.at("pct") == "A/%zz");

        assert(url_decode("a+b", false) == "a+b");
        assert(url_decode("100%") == "100%");
        assert(url_encode("dir/my file.txt") == "dir%2Fmy%20file.txt");
        assert(url_decode(url_encode("r\xC3\xA9sum\xC3\xA9 (1).pdf")) == "r\xC3\xA9sum\xC3\xA9 (1).pdf");
    }

    void test_response_serialization()
    {
        auto response = make_json_response(409, nlohmann::json{{"received", 400}});
        const auto wire = serialize(response, true);
        assert(wire.starts_with("HTTP/1.1 409 Conflict\r\n"));
        assert(wire.find("Content-Type: application/json") != std::string::npos);
        assert(wire.find("Connection: keep-alive") != std::string::npos);
        assert(wire.find("Content-Length: " + std::to_string(response.body.size())) != std::string::npos);

        const auto head_end = wire.find("\r\n\r\n");
        assert(head_end != std::string::npos);
        const auto parsed = parse_response_head(std::string_view(wire).substr(0, head_end + 4));
        assert(parsed.status == 409);
        assert(parsed.content_length() == std::optional<std::uint64_t>(response.body.size()));
        assert(nlohmann::json::parse(wire.substr(head_end + 4))["received"] == 400);

        const auto error = make_error_response(ErrorCode::SizeExceeded, "too many bytes");
        assert(error.status == 400);
        const auto body = nlohmann::json::parse(error.body);
        assert(body["error"] == "size_exceeded");
        assert(body["message"] == "too many bytes");

        const auto request = serialize_request_head("POST", "/upload/finish?name=a.txt", "example", 0);
        assert(request.starts_with("POST /upload/finish?name=a.txt HTTP/1.1\r\nHost: example\r\n"));
        assert(request.find("Connection: close\r\n\r\n") != std::string::npos);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::Busy) == "busy");
        assert(error_code_from_string("integrity_mismatch") == ErrorCode::IntegrityMismatch);
        assert(error_code_from_string("no_such_code") == ErrorCode::InternalError);
        assert(http_status(ErrorCode::Conflict) == 409);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::HeaderTooLarge) == 431);
        assert(reason_phrase(413) == "Payload Too Large");
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(chunk_hash == stream_hash);

        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto file_path = temp_dir / "chunkdrop_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);

        std::string upper = chunk_hash;
        for (auto &ch : upper)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        assert(crypto::digests_match(upper, chunk_hash));
        assert(!crypto::digests_match(chunk_hash.substr(1), chunk_hash));
        assert(!crypto::digests_match(crypto::hash_bytes({}), chunk_hash));
    }

} // namespace

int main()
{
    try
    {
        test_request_head_parsing();
        test_request_head_connection_rules();
        test_malformed_requests();
        test_query_decoding();
        test_response_serialization();
        test_error_codes();
        test_crypto();
        run_server_component_tests();
        run_client_logger_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
