#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkdrop/server/chunk_receiver.hpp"
#include "chunkdrop/server/config.hpp"
#include "chunkdrop/server/finalizer.hpp"
#include "chunkdrop/server/stats_counter.hpp"
#include "chunkdrop/server/status_resolver.hpp"
#include "chunkdrop/server/storage_layout.hpp"
#include "chunkdrop/server/target_claims.hpp"

namespace chunkdrop::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        StorageLayout layout_;
        ChunkReceiver chunk_receiver_;
        StatusResolver status_resolver_;
        Finalizer finalizer_;
        StatsCounter stats_counter_;
        TargetClaims claims_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkdrop::server
