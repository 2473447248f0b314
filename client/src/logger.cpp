#include "chunkdrop/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

#include <iostream>

#include <nlohmann/json.hpp>

namespace chunkdrop::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            // Appends, so an interrupted run and its resume end up in one log.
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("chunkdrop_client", std::move(sink));
            logger_->set_pattern("%Y-%m-%dT%H:%M:%S.%e %L %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Transfer log " << path->string() << " unavailable: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::transfer(const TransferRecord &record)
    {
        if (!logger_)
        {
            return;
        }
        nlohmann::json entry{
            {"file", record.file},
            {"outcome", record.outcome},
            {"size", record.size},
            {"resumed_from", record.resumed_from},
            {"realignments", record.realignments},
            {"restarts", record.restarts},
            {"elapsed_ms", record.elapsed.count()},
        };
        if (!record.remote_path.empty())
        {
            entry["remote_path"] = record.remote_path;
        }
        if (!record.detail.empty())
        {
            entry["detail"] = record.detail;
        }
        const auto level = record.outcome == "failed" ? spdlog::level::warn : spdlog::level::info;
        logger_->log(level, "transfer {}", entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        logger_->flush();
    }

} // namespace chunkdrop::client
