#include "chunkdrop/client/uploader.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>
#include <thread>

#include "chunkdrop/crypto.hpp"

namespace chunkdrop::client
{

    namespace
    {

        constexpr std::size_t kStreamBlockSize = 64 * 1024;
        constexpr int kMaxRealignments = 10;
        constexpr int kMaxNetworkRetries = 3;
        constexpr auto kRetryDelay = std::chrono::seconds(1);

        std::uint64_t received_of(const Reply &reply)
        {
            if (reply.body.is_object() && reply.body.contains("received") && reply.body["received"].is_number_unsigned())
            {
                return reply.body["received"].get<std::uint64_t>();
            }
            return 0;
        }

        std::string describe(const Reply &reply)
        {
            if (reply.body.is_object() && reply.body.contains("message"))
            {
                return std::to_string(reply.status) + " " + reply.body.value("message", std::string{});
            }
            return std::to_string(reply.status);
        }

        std::string outcome_label(FileOutcome outcome)
        {
            switch (outcome)
            {
            case FileOutcome::Uploaded:
                return "uploaded";
            case FileOutcome::AlreadyComplete:
                return "already_complete";
            case FileOutcome::Failed:
                break;
            }
            return "failed";
        }

    } // namespace

    std::string remote_relpath(const std::string &prefix, const std::filesystem::path &source_root,
                               const std::filesystem::path &file)
    {
        std::filesystem::path relative = source_root.filename();
        const auto parent = file.parent_path().lexically_relative(source_root);
        if (!parent.empty() && parent != ".")
        {
            relative /= parent;
        }
        if (!prefix.empty())
        {
            relative = std::filesystem::path(prefix) / relative;
        }
        return relative.generic_string();
    }

    Uploader::Uploader(ClientConfig config, Logger &logger)
        : config_(std::move(config)), logger_(logger) {}

    UploadReport Uploader::run()
    {
        UploadReport report;
        const auto record = [&report](FileOutcome outcome)
        {
            switch (outcome)
            {
            case FileOutcome::Uploaded:
                ++report.uploaded;
                break;
            case FileOutcome::AlreadyComplete:
                ++report.skipped;
                break;
            case FileOutcome::Failed:
                ++report.failed;
                break;
            }
        };

        for (const auto &source : config_.sources)
        {
            std::error_code ec;
            if (std::filesystem::is_directory(source, ec))
            {
                const auto root = source.has_filename() ? source : source.parent_path();
                for (std::filesystem::recursive_directory_iterator it(
                         root, std::filesystem::directory_options::skip_permission_denied, ec),
                     end;
                     !ec && it != end; it.increment(ec))
                {
                    if (it->is_regular_file(ec))
                    {
                        record(upload_file(it->path(), remote_relpath(config_.relpath, root, it->path())));
                    }
                }
                if (ec)
                {
                    std::cout << "ERROR: cannot walk " << source.string() << ": " << ec.message() << std::endl;
                    ++report.failed;
                }
            }
            else if (std::filesystem::is_regular_file(source, ec))
            {
                record(upload_file(source, config_.relpath));
            }
            else
            {
                std::cout << "ERROR: " << source.string() << " is not a file or directory" << std::endl;
                ++report.failed;
            }
        }
        return report;
    }

    FileOutcome Uploader::upload_file(const std::filesystem::path &local, const std::string &relpath)
    {
        const auto started = std::chrono::steady_clock::now();
        TransferRecord record;
        const auto name = local.filename().string();
        record.file = relpath.empty() ? name : relpath + "/" + name;

        const auto outcome = run_transfer(local, relpath, record);
        record.outcome = outcome_label(outcome);
        record.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        logger_.transfer(record);
        return outcome;
    }

    FileOutcome Uploader::run_transfer(const std::filesystem::path &local, const std::string &relpath,
                                       TransferRecord &record)
    {
        const auto name = local.filename().string();
        const auto &display = record.file;
        const auto fail = [&](const std::string &reason)
        {
            std::cout << "ERROR: " << display << ": " << reason << std::endl;
            record.detail = reason;
            return FileOutcome::Failed;
        };

        std::error_code ec;
        const auto size = std::filesystem::file_size(local, ec);
        if (ec)
        {
            return fail(ec.message());
        }
        record.size = size;
        std::ifstream input(local, std::ios::binary);
        if (!input)
        {
            return fail("could not open for reading");
        }

        try
        {
            int network_failures = 0;
            int realignments = 0;
            std::uint64_t offset = 0;
            bool need_status = true;
            bool sent_anything = false;

            // The server keeps an overrun partial until a finish discards it; then the upload starts over.
            const auto discard_overrun = [&](std::uint64_t held)
            {
                if (record.restarts > 0)
                {
                    return false;
                }
                logger_.event("upload", "{} server holds {} of {} bytes, discarding", display, held, size);
                const auto discarded = finish(name, relpath, size, {});
                if (discarded.status != 400 || discarded.body.value("error", std::string{}) != "size_exceeded")
                {
                    return false;
                }
                std::cout << "Restarting " << display << " from byte 0" << std::endl;
                ++record.restarts;
                offset = 0;
                sent_anything = false;
                return true;
            };

            while (true)
            {
                try
                {
                    if (need_status)
                    {
                        const auto status = get_status(name, relpath, size);
                        if (status.status != 200)
                        {
                            return fail("status " + describe(status));
                        }
                        if (status.body.value("complete", false))
                        {
                            std::cout << "SKIP " << display << " (already on server)" << std::endl;
                            return FileOutcome::AlreadyComplete;
                        }
                        // A collision means the name is held by an unrelated file; start from scratch.
                        offset = status.body.value("collision", false) ? 0 : received_of(status);
                        need_status = false;
                        if (offset > 0 && offset <= size)
                        {
                            std::cout << "Resuming " << display << " from byte " << offset << std::endl;
                            record.resumed_from = offset;
                        }
                    }

                    if (offset > size)
                    {
                        const auto held = offset;
                        if (!discard_overrun(held))
                        {
                            return fail("server holds " + std::to_string(held) + " bytes, more than " +
                                        std::to_string(size));
                        }
                        continue;
                    }
                    if (offset == size && (size > 0 || sent_anything))
                    {
                        break;
                    }

                    const auto length = std::min<std::uint64_t>(config_.chunk_size, size - offset);
                    input.clear();
                    input.seekg(static_cast<std::streamoff>(offset));
                    const auto reply = send_chunk(name, relpath, size, offset, input, length);
                    if (reply.status == 200)
                    {
                        offset = received_of(reply);
                        sent_anything = true;
                        realignments = 0;
                        std::cout << "\rUploaded " << offset << " / " << size << " bytes of " << display
                                  << std::flush;
                        continue;
                    }
                    if (reply.status == 409 && ++realignments <= kMaxRealignments)
                    {
                        const auto server_offset = received_of(reply);
                        const auto reason = reply.body.value("error", std::string{});
                        logger_.event("realign", "{} {} -> {} ({})", display, offset, server_offset, reason);
                        ++record.realignments;
                        if (reason == "busy")
                        {
                            std::this_thread::sleep_for(kRetryDelay);
                        }
                        offset = server_offset;
                        continue;
                    }
                    if (reply.status == 400 && reply.body.value("error", std::string{}) == "size_exceeded")
                    {
                        std::cout << std::endl;
                        if (discard_overrun(received_of(reply)))
                        {
                            continue;
                        }
                    }
                    std::cout << std::endl;
                    return fail("chunk " + describe(reply));
                }
                catch (const std::system_error &ex)
                {
                    if (++network_failures > kMaxNetworkRetries)
                    {
                        throw;
                    }
                    logger_.event("retry", "{} network error: {}", display, ex.what());
                    std::this_thread::sleep_for(kRetryDelay);
                    need_status = true;
                }
            }
            if (size > 0)
            {
                std::cout << std::endl;
            }

            const auto hash = config_.send_hash ? chunkdrop::crypto::hash_file(local) : std::string{};
            const auto done = finish(name, relpath, size, hash);
            if (done.status != 200)
            {
                return fail("finish " + describe(done));
            }
            const auto note = done.body.value("note", std::string{});
            record.remote_path = done.body.value("path", std::string{});
            record.detail = note;
            std::cout << "OK " << display << " -> " << record.remote_path
                      << (note.empty() ? "" : " (" + note + ")") << std::endl;
            return FileOutcome::Uploaded;
        }
        catch (const std::exception &ex)
        {
            return fail(ex.what());
        }
    }

    Reply Uploader::get_status(const std::string &name, const std::string &relpath, std::uint64_t size)
    {
        return exchange("GET", build_target("/upload/status", name, relpath, size), nullptr, 0);
    }

    Reply Uploader::send_chunk(const std::string &name, const std::string &relpath, std::uint64_t size,
                               std::uint64_t offset, std::istream &input, std::uint64_t length)
    {
        auto target = build_target("/upload/chunk", name, relpath, size);
        target += "&offset=" + std::to_string(offset);
        return exchange("POST", target, &input, length);
    }

    Reply Uploader::finish(const std::string &name, const std::string &relpath, std::uint64_t size,
                           const std::string &hash)
    {
        auto target = build_target("/upload/finish", name, relpath, size);
        if (!hash.empty())
        {
            target += "&hash=" + hash;
        }
        return exchange("POST", target, nullptr, 0);
    }

    std::string Uploader::build_target(std::string_view path, const std::string &name, const std::string &relpath,
                                       std::uint64_t size) const
    {
        std::string target(path);
        target += "?name=" + chunkdrop::http::url_encode(name);
        target += "&size=" + std::to_string(size);
        if (!relpath.empty())
        {
            target += "&relpath=" + chunkdrop::http::url_encode(relpath);
        }
        return target;
    }

    Reply Uploader::exchange(std::string_view method, const std::string &target, std::istream *body,
                             std::uint64_t body_length)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        asio::ip::tcp::socket socket(io_context_);
        asio::connect(socket, resolver.resolve(config_.host, std::to_string(config_.port)));

        chunkdrop::http::HeaderList extra;
        if (body != nullptr && body_length > 0)
        {
            extra.push_back({"Content-Type", "application/octet-stream"});
            extra.push_back({"Expect", "100-continue"});
        }
        const auto head = chunkdrop::http::serialize_request_head(method, target, config_.host, body_length, extra);
        asio::write(socket, asio::buffer(head));

        asio::streambuf buffer;
        if (body != nullptr && body_length > 0)
        {
            auto interim = read_reply(socket, buffer);
            if (interim.status != 100)
            {
                return interim;
            }

            std::array<char, kStreamBlockSize> block{};
            auto remaining = body_length;
            while (remaining > 0)
            {
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, block.size()));
                body->read(block.data(), static_cast<std::streamsize>(want));
                const auto got = static_cast<std::size_t>(body->gcount());
                if (got == 0)
                {
                    throw std::runtime_error("local file shrank during upload");
                }
                asio::write(socket, asio::buffer(block.data(), got));
                remaining -= got;
            }
        }

        auto reply = read_reply(socket, buffer);
        std::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
        logger_.event("http", "{} {} -> {}", method, target, reply.status);
        return reply;
    }

    Reply Uploader::read_reply(asio::ip::tcp::socket &socket, asio::streambuf &buffer)
    {
        const auto head_size = asio::read_until(socket, buffer, "\r\n\r\n");
        const auto data = buffer.data();
        const std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(head_size));
        buffer.consume(head_size);

        const auto parsed = chunkdrop::http::parse_response_head(head);
        Reply reply;
        reply.status = parsed.status;
        if (parsed.status == 100)
        {
            return reply;
        }

        const auto length = static_cast<std::size_t>(parsed.content_length().value_or(0));
        if (buffer.size() < length)
        {
            asio::read(socket, buffer, asio::transfer_exactly(length - buffer.size()));
        }
        const auto body_data = buffer.data();
        std::string text(asio::buffers_begin(body_data), asio::buffers_begin(body_data) + static_cast<std::ptrdiff_t>(length));
        buffer.consume(length);

        const auto content_type = chunkdrop::http::find_header(parsed.headers, "Content-Type");
        if (content_type && content_type->find("json") != std::string_view::npos)
        {
            reply.body = nlohmann::json::parse(text, nullptr, false);
        }
        else
        {
            reply.body = nlohmann::json{{"message", text}};
        }
        return reply;
    }

} // namespace chunkdrop::client
