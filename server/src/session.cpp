#include "chunkdrop/server/session.hpp"

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <string_view>

#include <spdlog/spdlog.h>

namespace chunkdrop::server
{

    namespace
    {

        constexpr std::string_view kDownloadPrefix = "/downloads/";
        constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

    } // namespace

    Route resolve_route(std::string_view method, std::string_view path) noexcept
    {
        struct RouteMapping
        {
            std::string_view path;
            std::string_view method;
            Route route;
        };
        static constexpr RouteMapping kRoutes[] = {
            {"/upload/status", "GET", Route::UploadStatus},
            {"/upload/chunk", "POST", Route::UploadChunk},
            {"/upload/finish", "POST", Route::UploadFinish},
            {"/stats", "GET", Route::Stats},
            {"/upload", "POST", Route::LegacyUpload},
        };

        for (const auto &mapping : kRoutes)
        {
            if (mapping.path == path)
            {
                return mapping.method == method ? mapping.route : Route::MethodNotAllowed;
            }
        }
        if (path.starts_with(kDownloadPrefix) && path.size() > kDownloadPrefix.size())
        {
            return method == "GET" ? Route::Download : Route::MethodNotAllowed;
        }
        return Route::NotFound;
    }

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)),
          deadline_(socket_.get_executor()),
          services_(services),
          request_buffer_(services.config.max_header_bytes) {}

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_request_head();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        deadline_.cancel();
        on_disconnect();
    }

    void Session::on_disconnect()
    {
        abandon_chunk();
        download_stream_.reset();
    }

    void Session::arm_deadline()
    {
        deadline_.expires_after(services_.config.idle_timeout);
        std::weak_ptr<Session> weak = weak_from_this();
        deadline_.async_wait([weak](const std::error_code &ec)
                             {
                                 if (ec)
                                 {
                                     return;
                                 }
                                 if (auto self = weak.lock())
                                 {
                                     spdlog::info("Closing idle connection {}", self->remote_endpoint());
                                     self->stop();
                                 } });
    }

    void Session::read_request_head()
    {
        arm_deadline();
        auto self = shared_from_this();
        asio::async_read_until(socket_, request_buffer_, "\r\n\r\n",
                               [this, self](const std::error_code &ec, std::size_t head_size)
                               {
                                   if (ec == asio::error::not_found)
                                   {
                                       request_ = chunkdrop::http::Request{};
                                       request_started_ = std::chrono::steady_clock::now();
                                       keep_alive_ = false;
                                       body_remaining_ = 0;
                                       send_error(chunkdrop::ErrorCode::HeaderTooLarge, "Request header too large");
                                       return;
                                   }
                                   if (ec)
                                   {
                                       stop();
                                       return;
                                   }
                                   on_request_head(head_size);
                               });
    }

    void Session::on_request_head(std::size_t head_size)
    {
        request_started_ = std::chrono::steady_clock::now();
        const auto data = request_buffer_.data();
        const std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(head_size));
        request_buffer_.consume(head_size);

        try
        {
            request_ = chunkdrop::http::parse_request_head(head);
            keep_alive_ = request_.keep_alive();
            if (request_.has_transfer_encoding())
            {
                throw chunkdrop::HttpError(chunkdrop::ErrorCode::LengthRequired,
                                           "Transfer-Encoding is not supported, send Content-Length");
            }
            body_remaining_ = request_.content_length().value_or(0);
        }
        catch (const chunkdrop::HttpError &ex)
        {
            spdlog::warn("{} sent a malformed request: {}", remote_endpoint(), ex.what());
            request_ = chunkdrop::http::Request{};
            keep_alive_ = false;
            body_remaining_ = 0;
            send_error(ex.code(), ex.what());
            return;
        }

        spdlog::debug("{} -> {} {}", remote_endpoint(), request_.method, request_.target);
        dispatch();
    }

    void Session::dispatch()
    {
        switch (resolve_route(request_.method, request_.path))
        {
        case Route::UploadStatus:
            drain_body([this]
                       { run_handler(&Session::handle_upload_status); });
            break;
        case Route::UploadChunk:
            run_handler(&Session::handle_upload_chunk);
            break;
        case Route::UploadFinish:
            drain_body([this]
                       { run_handler(&Session::handle_upload_finish); });
            break;
        case Route::Stats:
            drain_body([this]
                       { run_handler(&Session::handle_stats); });
            break;
        case Route::LegacyUpload:
            run_handler(&Session::handle_legacy_upload);
            break;
        case Route::Download:
            drain_body([this]
                       { run_handler(&Session::handle_download); });
            break;
        case Route::MethodNotAllowed:
            send_refusal(chunkdrop::http::make_error_response(chunkdrop::ErrorCode::MethodNotAllowed,
                                                              request_.method + " not allowed on " + request_.path));
            break;
        case Route::NotFound:
            send_refusal(chunkdrop::http::make_error_response(chunkdrop::ErrorCode::NotFound,
                                                              "No route for " + request_.path));
            break;
        }
    }

    void Session::run_handler(void (Session::*handler)())
    {
        try
        {
            (this->*handler)();
        }
        catch (const StorageError &ex)
        {
            spdlog::error("{} {} failed: {}", request_.method, request_.target, ex.what());
            send_refusal(chunkdrop::http::make_error_response(ex.code(), ex.what()));
        }
        catch (const chunkdrop::HttpError &ex)
        {
            send_refusal(chunkdrop::http::make_error_response(ex.code(), ex.what()));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unhandled error for {} {}: {}", request_.method, request_.target, ex.what());
            send_refusal(chunkdrop::http::make_error_response(chunkdrop::ErrorCode::InternalError, ex.what()));
        }
    }

    void Session::send_response(chunkdrop::http::Response response)
    {
        if (stopped_)
        {
            return;
        }
        const bool keep_alive = keep_alive_ && body_remaining_ == 0;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_started_)
                                 .count();
        spdlog::info("{} {} {} -> {} ({} ms)", remote_endpoint(),
                     request_.method.empty() ? std::string("-") : request_.method,
                     request_.target.empty() ? std::string("-") : request_.target, response.status, elapsed);

        auto payload = std::make_shared<std::string>(chunkdrop::http::serialize(response, keep_alive));
        auto self = shared_from_this();
        arm_deadline();
        asio::async_write(socket_, asio::buffer(*payload),
                          [this, self, payload, keep_alive](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              finish_exchange(keep_alive);
                          });
    }

    void Session::send_error(chunkdrop::ErrorCode code, std::string message)
    {
        send_response(chunkdrop::http::make_error_response(code, message));
    }

    void Session::send_refusal(chunkdrop::http::Response response)
    {
        if (body_remaining_ == 0)
        {
            send_response(std::move(response));
            return;
        }
        // The client holds the body back until it sees 100 Continue, so there is nothing to drain.
        if (request_.expects_continue() || body_remaining_ > services_.config.max_drain_bytes)
        {
            keep_alive_ = false;
            send_response(std::move(response));
            return;
        }
        auto pending = std::make_shared<chunkdrop::http::Response>(std::move(response));
        drain_body([this, pending]
                   { send_response(std::move(*pending)); });
    }

    void Session::finish_exchange(bool keep_alive)
    {
        body_.clear();
        if (keep_alive)
        {
            read_request_head();
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
        stop();
    }

    void Session::send_continue(std::function<void()> next)
    {
        if (!request_.expects_continue() || body_remaining_ == 0)
        {
            next();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(kContinueResponse.data(), kContinueResponse.size()),
                          [this, self, next = std::move(next)](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              next();
                          });
    }

    std::size_t Session::take_buffered_body(std::byte *destination, std::size_t max_bytes)
    {
        const auto count = static_cast<std::size_t>(
            std::min<std::uint64_t>({request_buffer_.size(), body_remaining_, max_bytes}));
        if (count == 0)
        {
            return 0;
        }
        if (destination != nullptr)
        {
            asio::buffer_copy(asio::buffer(destination, count), request_buffer_.data());
        }
        request_buffer_.consume(count);
        body_remaining_ -= count;
        return count;
    }

    void Session::ensure_body_buffer()
    {
        if (body_buffer_.empty())
        {
            body_buffer_.resize(services_.config.read_buffer_size);
        }
    }

    void Session::drain_body(std::function<void()> next)
    {
        take_buffered_body(nullptr, request_buffer_.size());
        if (body_remaining_ == 0)
        {
            next();
            return;
        }
        if (body_remaining_ > services_.config.max_drain_bytes)
        {
            keep_alive_ = false;
            next();
            return;
        }
        ensure_body_buffer();
        arm_deadline();
        auto self = shared_from_this();
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(body_buffer_.size(), body_remaining_));
        socket_.async_read_some(asio::buffer(body_buffer_.data(), want),
                                [this, self, next = std::move(next)](const std::error_code &ec, std::size_t bytes) mutable
                                {
                                    if (ec)
                                    {
                                        stop();
                                        return;
                                    }
                                    body_remaining_ -= bytes;
                                    drain_body(std::move(next));
                                });
    }

    void Session::read_body(std::function<void()> next)
    {
        body_.clear();
        body_.resize(static_cast<std::size_t>(body_remaining_));
        const auto buffered = take_buffered_body(reinterpret_cast<std::byte *>(body_.data()), body_.size());
        if (body_remaining_ == 0)
        {
            next();
            return;
        }
        arm_deadline();
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(body_.data() + buffered, static_cast<std::size_t>(body_remaining_)),
                         [this, self, next = std::move(next)](const std::error_code &ec, std::size_t /*bytes*/)
                         {
                             if (ec)
                             {
                                 spdlog::warn("{} closed during request body: {}", remote_endpoint(), ec.message());
                                 stop();
                                 return;
                             }
                             body_remaining_ = 0;
                             next();
                         });
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkdrop::server
