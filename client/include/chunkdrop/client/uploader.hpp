#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkdrop/client/config.hpp"
#include "chunkdrop/client/logger.hpp"
#include "chunkdrop/http.hpp"

namespace chunkdrop::client
{

    enum class FileOutcome
    {
        Uploaded,
        AlreadyComplete,
        Failed
    };

    struct UploadReport
    {
        std::size_t uploaded{};
        std::size_t skipped{};
        std::size_t failed{};
    };

    struct Reply
    {
        unsigned int status{};
        nlohmann::json body;
    };

    // Builds the remote relative directory of `file` found while walking `source_root`.
    std::string remote_relpath(const std::string &prefix, const std::filesystem::path &source_root,
                               const std::filesystem::path &file);

    /**
     * Drives the resumable protocol: ask for the resume offset, send chunks, realign on 409 and
     * finish. Each request runs on its own connection.
     */
    class Uploader
    {
    public:
        Uploader(ClientConfig config, Logger &logger);

        UploadReport run();

        FileOutcome upload_file(const std::filesystem::path &local, const std::string &relpath);

    private:
        FileOutcome run_transfer(const std::filesystem::path &local, const std::string &relpath,
                                 TransferRecord &record);
        Reply get_status(const std::string &name, const std::string &relpath, std::uint64_t size);
        Reply send_chunk(const std::string &name, const std::string &relpath, std::uint64_t size,
                         std::uint64_t offset, std::istream &input, std::uint64_t length);
        Reply finish(const std::string &name, const std::string &relpath, std::uint64_t size,
                     const std::string &hash);

        Reply exchange(std::string_view method, const std::string &target, std::istream *body,
                       std::uint64_t body_length);
        Reply read_reply(asio::ip::tcp::socket &socket, asio::streambuf &buffer);
        std::string build_target(std::string_view path, const std::string &name, const std::string &relpath,
                                 std::uint64_t size) const;

        ClientConfig config_;
        Logger &logger_;
        asio::io_context io_context_;
    };

} // namespace chunkdrop::client
