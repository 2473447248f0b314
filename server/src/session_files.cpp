#include "chunkdrop/server/session.hpp"

#include <asio/buffer.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrop/server/multipart.hpp"

namespace chunkdrop::server
{

    namespace
    {

        constexpr std::string_view kDownloadPrefix = "/downloads/";
        constexpr std::string_view kFormField = "files";
        constexpr std::size_t kDownloadBlockSize = 64 * 1024;

        struct ContentTypeMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ContentTypeMapping, 12> kContentTypes{{
            {".txt", "text/plain; charset=utf-8"},
            {".html", "text/html; charset=utf-8"},
            {".htm", "text/html; charset=utf-8"},
            {".css", "text/css"},
            {".js", "application/javascript"},
            {".json", "application/json"},
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
        }};

        std::string_view content_type_for(const std::filesystem::path &path)
        {
            auto extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            for (const auto &mapping : kContentTypes)
            {
                if (mapping.extension == extension)
                {
                    return mapping.content_type;
                }
            }
            return "application/octet-stream";
        }

        // Maps the decoded URL path below /downloads/ onto the destination root, refusing anything that leaves it.
        std::optional<std::filesystem::path> resolve_download(const StorageLayout &layout, std::string_view request_path)
        {
            const std::string relative(request_path.substr(kDownloadPrefix.size()));
            auto resolved = layout.destination_root();
            bool first = true;
            std::size_t start = 0;
            while (start <= relative.size())
            {
                auto end = relative.find('/', start);
                if (end == std::string::npos)
                {
                    end = relative.size();
                }
                const auto segment = relative.substr(start, end - start);
                start = end + 1;
                if (segment.empty())
                {
                    continue;
                }
                if (segment == "." || segment == ".." || segment.find('\\') != std::string::npos ||
                    segment.find('\0') != std::string::npos)
                {
                    return std::nullopt;
                }
                if (first && segment == layout.staging_dir_name())
                {
                    return std::nullopt;
                }
                first = false;
                resolved /= segment;
            }
            if (first)
            {
                return std::nullopt;
            }
            return resolved;
        }

    } // namespace

    void Session::handle_stats()
    {
        const auto files = services_.stats_counter.count_files();
        send_response(chunkdrop::http::make_json_response(200, nlohmann::json{{"files", files}}));
    }

    void Session::handle_legacy_upload()
    {
        const auto content_type = request_.header("Content-Type");
        const auto boundary = content_type ? multipart::boundary_from_content_type(*content_type) : std::nullopt;
        if (!boundary)
        {
            send_refusal(chunkdrop::http::make_error_response(chunkdrop::ErrorCode::InvalidParameter,
                                                              "expected multipart/form-data"));
            return;
        }
        if (body_remaining_ > services_.config.max_form_bytes)
        {
            spdlog::warn("{} form upload of {} bytes exceeds the {} byte limit", remote_endpoint(), body_remaining_,
                         services_.config.max_form_bytes);
            keep_alive_ = false;
            send_error(chunkdrop::ErrorCode::PayloadTooLarge, "form upload too large");
            return;
        }

        send_continue([this, boundary = *boundary]
                      { read_body([this, boundary]
                                  {
                                      try
                                      {
                                          store_legacy_form(boundary);
                                      }
                                      catch (const chunkdrop::HttpError &ex)
                                      {
                                          send_error(ex.code(), ex.what());
                                      }
                                      catch (const std::exception &ex)
                                      {
                                          spdlog::error("Form upload failed: {}", ex.what());
                                          send_error(chunkdrop::ErrorCode::InternalError, ex.what());
                                      } }); });
    }

    void Session::store_legacy_form(const std::string &boundary)
    {
        const auto parts = multipart::parse(body_, boundary);
        const bool has_field = std::any_of(parts.begin(), parts.end(), [](const multipart::FormPart &part)
                                           { return part.name == kFormField; });
        if (!has_field)
        {
            send_error(chunkdrop::ErrorCode::InvalidParameter, "No files part");
            return;
        }

        std::size_t stored = 0;
        for (const auto &part : parts)
        {
            if (part.name != kFormField || !multipart::carries_file(part))
            {
                continue;
            }
            const auto destination = next_free_path(services_.layout.final_path(UploadTarget{*part.filename, "", 0}));
            std::error_code ec;
            std::filesystem::create_directories(destination.parent_path(), ec);
            std::ofstream output(destination, std::ios::binary | std::ios::trunc);
            if (ec || !output)
            {
                throw StorageError(chunkdrop::ErrorCode::InternalError, "cannot write " + destination.string());
            }
            output.write(part.data.data(), static_cast<std::streamsize>(part.data.size()));
            output.close();
            if (!output)
            {
                throw StorageError(chunkdrop::ErrorCode::InternalError, "write failed for " + destination.string());
            }
            spdlog::info("Form upload stored {} ({} bytes)", destination.string(), part.data.size());
            ++stored;
        }

        send_response(chunkdrop::http::make_text_response(
            200, "Uploaded " + std::to_string(stored) + " file(s). <a href='/'>Back</a>", "text/html; charset=utf-8"));
    }

    void Session::handle_download()
    {
        const auto path = resolve_download(services_.layout, request_.path);
        std::error_code ec;
        if (!path || !std::filesystem::is_regular_file(*path, ec))
        {
            send_error(chunkdrop::ErrorCode::NotFound, "file not found");
            return;
        }
        const auto size = std::filesystem::file_size(*path, ec);
        auto stream = std::make_unique<std::ifstream>(*path, std::ios::binary);
        if (ec || !*stream)
        {
            send_error(chunkdrop::ErrorCode::NotFound, "file not readable");
            return;
        }

        chunkdrop::http::Response response;
        response.set_header("Content-Type", std::string(content_type_for(*path)));
        const bool keep_alive = keep_alive_;
        auto head = std::make_shared<std::string>(chunkdrop::http::serialize_head(response, size, keep_alive));
        download_stream_ = std::move(stream);
        download_remaining_ = size;
        spdlog::info("{} {} {} -> 200 ({} bytes)", remote_endpoint(), request_.method, request_.target, size);

        arm_deadline();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*head),
                          [this, self, head](const std::error_code &write_ec, std::size_t /*bytes_transferred*/)
                          {
                              if (write_ec)
                              {
                                  stop();
                                  return;
                              }
                              pump_download();
                          });
    }

    void Session::pump_download()
    {
        if (!download_stream_)
        {
            return;
        }
        if (download_remaining_ == 0)
        {
            download_stream_.reset();
            finish_exchange(keep_alive_);
            return;
        }

        ensure_body_buffer();
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>({download_remaining_, kDownloadBlockSize, body_buffer_.size()}));
        download_stream_->read(reinterpret_cast<char *>(body_buffer_.data()), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(download_stream_->gcount());
        if (got == 0)
        {
            // The file shrank after the head went out; the promised length cannot be honoured.
            spdlog::warn("Download of {} ended {} bytes early", request_.path, download_remaining_);
            stop();
            return;
        }
        download_remaining_ -= got;

        arm_deadline();
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(body_buffer_.data(), got),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              pump_download();
                          });
    }

} // namespace chunkdrop::server
