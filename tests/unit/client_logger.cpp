#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkdrop/client/logger.hpp"

using namespace chunkdrop::client;

namespace
{

    std::string last_transfer_line(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        std::string line;
        std::string found;
        while (std::getline(in, line))
        {
            if (line.find(" transfer {") != std::string::npos)
            {
                found = line;
            }
        }
        return found;
    }

    void test_transfer_records()
    {
        const auto path = std::filesystem::temp_directory_path() / "chunkdrop_client_log_test.log";
        std::error_code ec;
        std::filesystem::remove(path, ec);

        {
            Logger logger(path);
            assert(logger.enabled());
            logger.event("http", "{} {} -> {}", "GET", "/upload/status?name=a.bin", 200);

            TransferRecord record;
            record.file = "photos/a.bin";
            record.outcome = "uploaded";
            record.size = 4096;
            record.resumed_from = 1024;
            record.realignments = 1;
            record.restarts = 0;
            record.remote_path = "/srv/drop/photos/a.bin";
            record.elapsed = std::chrono::milliseconds{42};
            logger.transfer(record);
        }

        const auto line = last_transfer_line(path);
        assert(!line.empty());
        const auto entry = nlohmann::json::parse(line.substr(line.find('{')));
        assert(entry["file"] == "photos/a.bin");
        assert(entry["outcome"] == "uploaded");
        assert(entry["size"] == 4096);
        assert(entry["resumed_from"] == 1024);
        assert(entry["realignments"] == 1);
        assert(entry["elapsed_ms"] == 42);
        assert(entry["remote_path"] == "/srv/drop/photos/a.bin");
        assert(!entry.contains("detail"));

        {
            Logger logger(path);
            TransferRecord failed;
            failed.file = "b.bin";
            failed.outcome = "failed";
            failed.detail = "finish 409 partial holds 3 of 10 declared bytes";
            logger.transfer(failed);
        }
        const auto failed_line = last_transfer_line(path);
        const auto appended = nlohmann::json::parse(failed_line.substr(failed_line.find('{')));
        assert(appended["outcome"] == "failed");
        assert(appended["detail"] == "finish 409 partial holds 3 of 10 declared bytes");
        assert(!appended.contains("remote_path"));

        std::ifstream in(path);
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content.find("photos/a.bin") != std::string::npos);
        assert(content.find("/upload/status?name=a.bin -> 200") != std::string::npos);

        std::filesystem::remove(path, ec);
    }

    void test_disabled_logger()
    {
        Logger logger(std::nullopt);
        assert(!logger.enabled());
        logger.event("http", "{}", "ignored");
        logger.transfer(TransferRecord{});
    }

} // namespace

void run_client_logger_tests()
{
    test_transfer_records();
    test_disabled_logger();
}
