#include "chunkdrop/server/session.hpp"

#include <asio/buffer.hpp>

#include <algorithm>
#include <charconv>
#include <span>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chunkdrop::server
{

    namespace
    {

        std::optional<std::uint64_t> parse_unsigned(std::string_view value)
        {
            std::uint64_t result = 0;
            const auto *end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(value.data(), end, result);
            if (value.empty() || ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return result;
        }

        // Throws HttpError when a present value is not a non-negative integer or a required one is absent.
        std::optional<std::uint64_t> numeric_param(const chunkdrop::http::Request &request, std::string_view key,
                                                   bool required)
        {
            const auto raw = request.query_value(key);
            if (!raw || raw->empty())
            {
                if (required)
                {
                    throw chunkdrop::HttpError(chunkdrop::ErrorCode::InvalidParameter, std::string(key) + " required");
                }
                return std::nullopt;
            }
            const auto value = parse_unsigned(*raw);
            if (!value)
            {
                throw chunkdrop::HttpError(chunkdrop::ErrorCode::InvalidParameter,
                                           std::string(key) + " must be a non-negative integer");
            }
            return value;
        }

        UploadTarget target_from_query(const chunkdrop::http::Request &request, bool size_required)
        {
            UploadTarget target;
            target.name = request.query_value("name").value_or("");
            if (target.name.empty())
            {
                throw chunkdrop::HttpError(chunkdrop::ErrorCode::InvalidParameter, "name required");
            }
            target.declared_size = numeric_param(request, "size", size_required).value_or(0);
            target.relpath = request.query_value("relpath").value_or("");
            return target;
        }

        chunkdrop::http::Response conflict_response(chunkdrop::ErrorCode code, std::uint64_t received,
                                                    std::string_view message)
        {
            nlohmann::json payload{
                {"received", received},
                {"error", chunkdrop::to_string(code)},
                {"message", message},
            };
            return chunkdrop::http::make_json_response(409, payload);
        }

        chunkdrop::http::Response size_exceeded_response(std::uint64_t received, std::string_view message)
        {
            nlohmann::json payload{
                {"error", chunkdrop::to_string(chunkdrop::ErrorCode::SizeExceeded)},
                {"message", message},
                {"received", received},
            };
            return chunkdrop::http::make_json_response(chunkdrop::http_status(chunkdrop::ErrorCode::SizeExceeded),
                                                       payload);
        }

    } // namespace

    void Session::handle_upload_status()
    {
        const auto target = target_from_query(request_, false);
        const auto status = services_.status_resolver.resolve(target);

        nlohmann::json payload{{"received", status.received}};
        if (status.complete)
        {
            payload["complete"] = true;
        }
        if (status.collision)
        {
            payload["collision"] = true;
        }
        send_response(chunkdrop::http::make_json_response(200, payload));
    }

    void Session::handle_upload_chunk()
    {
        const auto target = target_from_query(request_, true);
        const auto offset = *numeric_param(request_, "offset", true);
        const auto key = services_.layout.partial_path(target).generic_string();

        auto claim = services_.claims.try_claim(key);
        if (!claim)
        {
            const auto current = services_.chunk_receiver.current_length(target);
            spdlog::warn("{} refused: another chunk for {} is in flight", remote_endpoint(), key);
            send_refusal(conflict_response(chunkdrop::ErrorCode::Busy, current,
                                           "another chunk for this upload is being received"));
            return;
        }

        std::uint64_t current = 0;
        auto writer = services_.chunk_receiver.begin(target, offset, current);
        if (!writer)
        {
            spdlog::info("{} offset {} does not match {} bytes held for {}", remote_endpoint(), offset, current, key);
            send_refusal(conflict_response(chunkdrop::ErrorCode::Conflict, current, "offset mismatch"));
            return;
        }

        chunk_writer_.emplace(std::move(*writer));
        chunk_claim_.emplace(std::move(*claim));
        send_continue([this]
                      { stream_chunk_body(); });
    }

    void Session::stream_chunk_body()
    {
        try
        {
            ensure_body_buffer();
            const auto buffered = take_buffered_body(body_buffer_.data(), body_buffer_.size());
            chunk_writer_->write(std::span<const std::byte>(body_buffer_.data(), buffered));
            if (body_remaining_ == 0)
            {
                complete_chunk();
                return;
            }
        }
        catch (const StorageError &ex)
        {
            abandon_chunk();
            keep_alive_ = false;
            send_error(ex.code(), ex.what());
            return;
        }

        arm_deadline();
        auto self = shared_from_this();
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(body_buffer_.size(), body_remaining_));
        socket_.async_read_some(asio::buffer(body_buffer_.data(), want),
                                [this, self](const std::error_code &ec, std::size_t bytes)
                                {
                                    if (ec)
                                    {
                                        // Bytes already appended stay; the client resumes from the new length.
                                        spdlog::warn("{} chunk body interrupted with {} bytes missing: {}",
                                                     remote_endpoint(), body_remaining_, ec.message());
                                        stop();
                                        return;
                                    }
                                    try
                                    {
                                        chunk_writer_->write(std::span<const std::byte>(body_buffer_.data(), bytes));
                                    }
                                    catch (const StorageError &ex)
                                    {
                                        abandon_chunk();
                                        keep_alive_ = false;
                                        send_error(ex.code(), ex.what());
                                        return;
                                    }
                                    body_remaining_ -= bytes;
                                    if (body_remaining_ == 0)
                                    {
                                        complete_chunk();
                                        return;
                                    }
                                    stream_chunk_body();
                                });
    }

    void Session::complete_chunk()
    {
        ChunkResult result;
        try
        {
            result = chunk_writer_->finish();
        }
        catch (const StorageError &ex)
        {
            chunk_writer_.reset();
            chunk_claim_.reset();
            send_error(ex.code(), ex.what());
            return;
        }
        chunk_writer_.reset();
        chunk_claim_.reset();

        if (result.outcome == ChunkOutcome::SizeExceeded)
        {
            send_response(size_exceeded_response(result.received, "received more bytes than declared size"));
            return;
        }
        send_response(chunkdrop::http::make_json_response(200, nlohmann::json{{"received", result.received}}));
    }

    void Session::abandon_chunk() noexcept
    {
        if (chunk_writer_)
        {
            try
            {
                const auto result = chunk_writer_->finish();
                spdlog::info("Kept {} bytes of {} for resume", result.received, chunk_writer_->path().string());
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Closing partial file failed: {}", ex.what());
            }
            chunk_writer_.reset();
        }
        chunk_claim_.reset();
    }

    void Session::handle_upload_finish()
    {
        const auto target = target_from_query(request_, false);
        std::optional<std::string> expected_hash;
        if (auto hash = request_.query_value("hash"); hash && !hash->empty())
        {
            expected_hash = std::move(*hash);
        }

        const auto key = services_.layout.partial_path(target).generic_string();
        if (services_.claims.is_claimed(key))
        {
            send_response(conflict_response(chunkdrop::ErrorCode::Busy, services_.chunk_receiver.current_length(target),
                                            "a chunk for this upload is still being received"));
            return;
        }

        const auto result = services_.finalizer.finalize(target, expected_hash);
        spdlog::debug("Finalize {} -> {}", key, to_string(result.outcome));
        if (result.ok())
        {
            nlohmann::json payload{
                {"ok", true},
                {"path", result.final_path.string()},
            };
            if (!result.note().empty())
            {
                payload["note"] = result.note();
            }
            send_response(chunkdrop::http::make_json_response(200, payload));
            return;
        }

        switch (result.outcome)
        {
        case FinalizeOutcome::NotFound:
            send_error(chunkdrop::ErrorCode::NotFound, result.message);
            break;
        case FinalizeOutcome::Incomplete:
            send_response(conflict_response(chunkdrop::ErrorCode::Conflict, result.received, result.message));
            break;
        case FinalizeOutcome::SizeExceeded:
            send_response(size_exceeded_response(result.received, result.message));
            break;
        case FinalizeOutcome::IntegrityMismatch:
            send_error(chunkdrop::ErrorCode::IntegrityMismatch, result.message);
            break;
        default:
            send_error(chunkdrop::ErrorCode::InternalError, result.message);
            break;
        }
    }

} // namespace chunkdrop::server
