#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/streambuf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunkdrop/error_codes.hpp"
#include "chunkdrop/http.hpp"
#include "chunkdrop/server/chunk_receiver.hpp"
#include "chunkdrop/server/config.hpp"
#include "chunkdrop/server/finalizer.hpp"
#include "chunkdrop/server/stats_counter.hpp"
#include "chunkdrop/server/status_resolver.hpp"
#include "chunkdrop/server/storage_layout.hpp"
#include "chunkdrop/server/target_claims.hpp"

namespace chunkdrop::server
{

    struct ServerServices
    {
        const ServerConfig &config;
        const StorageLayout &layout;
        const ChunkReceiver &chunk_receiver;
        const StatusResolver &status_resolver;
        const Finalizer &finalizer;
        const StatsCounter &stats_counter;
        TargetClaims &claims;
    };

    enum class Route
    {
        UploadStatus,
        UploadChunk,
        UploadFinish,
        Stats,
        LegacyUpload,
        Download,
        MethodNotAllowed,
        NotFound
    };

    Route resolve_route(std::string_view method, std::string_view path) noexcept;

    // One HTTP/1.1 connection. All handlers run on the socket's strand, one exchange at a time.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_request_head();
        void on_request_head(std::size_t head_size);
        void dispatch();
        // Runs a route handler, turning its exceptions into error responses.
        void run_handler(void (Session::*handler)());
        void send_response(chunkdrop::http::Response response);
        void send_error(chunkdrop::ErrorCode code, std::string message);
        // Sends a response that refuses the request body: drains it when cheap, otherwise closes afterwards.
        void send_refusal(chunkdrop::http::Response response);
        void finish_exchange(bool keep_alive);
        void send_continue(std::function<void()> next);
        void arm_deadline();
        void on_disconnect();

        // Body plumbing
        std::size_t take_buffered_body(std::byte *destination, std::size_t max_bytes);
        void ensure_body_buffer();
        void drain_body(std::function<void()> next);
        void read_body(std::function<void()> next);
        void stream_chunk_body();
        void complete_chunk();
        void abandon_chunk() noexcept;

        // Resumable upload handlers
        void handle_upload_status();
        void handle_upload_chunk();
        void handle_upload_finish();

        // Stats, legacy form upload and downloads
        void handle_stats();
        void handle_legacy_upload();
        void store_legacy_form(const std::string &boundary);
        void handle_download();
        void pump_download();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        asio::steady_timer deadline_;
        ServerServices services_;

        asio::streambuf request_buffer_;
        std::vector<std::byte> body_buffer_;
        chunkdrop::http::Request request_;
        std::uint64_t body_remaining_{};
        bool keep_alive_{};
        bool stopped_{false};
        std::chrono::steady_clock::time_point request_started_{};

        std::string body_;
        std::optional<ChunkWriter> chunk_writer_;
        std::optional<TargetClaim> chunk_claim_;

        std::unique_ptr<std::ifstream> download_stream_;
        std::uint64_t download_remaining_{};
    };

} // namespace chunkdrop::server
