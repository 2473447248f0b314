#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "chunkdrop/crypto.hpp"
#include "chunkdrop/server/chunk_receiver.hpp"
#include "chunkdrop/server/config.hpp"
#include "chunkdrop/server/finalizer.hpp"
#include "chunkdrop/server/multipart.hpp"
#include "chunkdrop/server/path_sanitizer.hpp"
#include "chunkdrop/server/session.hpp"
#include "chunkdrop/server/stats_counter.hpp"
#include "chunkdrop/server/status_resolver.hpp"
#include "chunkdrop/server/storage_layout.hpp"
#include "chunkdrop/server/target_claims.hpp"

using namespace chunkdrop;
using namespace chunkdrop::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    std::string pattern_bytes(std::size_t size, char seed = 'a')
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>(seed + static_cast<char>(i % 23));
        }
        return data;
    }

    ChunkResult send(const ChunkReceiver &receiver, const UploadTarget &target, std::uint64_t offset,
                     const std::string &bytes)
    {
        std::istringstream body(bytes);
        return receiver.receive(target, offset, body, 128);
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    MoveRetryPolicy quick_policy()
    {
        return MoveRetryPolicy{2, std::chrono::milliseconds{0}};
    }

    void test_relative_path_sanitizing()
    {
        assert(paths::sanitize_relative_path("../../secrets") == std::filesystem::path("secrets"));
        assert(paths::sanitize_relative_path("a\\b/./c//") == std::filesystem::path("a") / "b" / "c");
        assert(paths::sanitize_relative_path("  docs  /<script>/x") == std::filesystem::path("docs") / "_" / "x");
        assert(paths::sanitize_relative_path("/etc/passwd") == std::filesystem::path("etc") / "passwd");
        assert(paths::sanitize_relative_path("").empty());

        std::string deep;
        for (int i = 0; i < 80; ++i)
        {
            deep += "d/";
        }
        const auto bounded = paths::sanitize_relative_path(deep);
        assert(static_cast<std::size_t>(std::distance(bounded.begin(), bounded.end())) == paths::kMaxDepth);

        const auto long_segment = paths::sanitize_relative_path(std::string(400, 'x'));
        assert(long_segment.string().size() == paths::kMaxSegmentLength);
    }

    void test_file_name_sanitizing()
    {
        assert(paths::sanitize_file_name("photo.jpg") == "photo.jpg");
        assert(paths::sanitize_file_name("../../etc/passwd") == "etc_passwd");
        assert(paths::sanitize_file_name("my  holiday photo.jpg") == "my_holiday_photo.jpg");
        assert(paths::sanitize_file_name("R\xC3\xA9sum\xC3\xA9.pdf") == "Rsum.pdf");
        assert(paths::sanitize_file_name("a;b|c.txt") == "abc.txt");
        assert(paths::sanitize_file_name("   ") == paths::kDefaultFileName);
        assert(paths::sanitize_file_name("...") == paths::kDefaultFileName);

        const auto bounded = paths::sanitize_file_name(std::string(300, 'n') + ".tar");
        assert(bounded.size() == paths::kMaxFileNameLength);
        assert(bounded.ends_with(".tar"));
    }

    void test_storage_layout()
    {
        const StorageLayout layout("/srv/drop/./uploads/");
        assert(layout.staging_root() == layout.destination_root() / ".incoming");

        const UploadTarget traversal{"a.txt", "../../secrets", 0};
        const auto final_path = layout.final_path(traversal);
        assert(final_path == layout.destination_root() / "secrets" / "a.txt");
        const auto relative = final_path.lexically_relative(layout.destination_root());
        assert(!relative.empty() && *relative.begin() != "..");
        assert(layout.partial_path(traversal) == layout.staging_root() / "secrets" / "a.txt.part");

        const UploadTarget hidden{"b.txt", "x/.incoming/y", 0};
        assert(layout.final_path(hidden) == layout.destination_root() / "x" / "_" / "y" / "b.txt");

        bool caught = false;
        try
        {
            StorageLayout invalid("/srv/drop", "../escape");
        }
        catch (const StorageError &ex)
        {
            caught = ex.code() == ErrorCode::InvalidParameter;
        }
        assert(caught);
    }

    void test_chunked_upload_and_resume()
    {
        const auto root = fresh_root("chunkdrop_upload_test");
        const StorageLayout layout(root);
        layout.ensure_roots();
        const ChunkReceiver receiver(layout);
        const StatusResolver resolver(layout);
        const Finalizer finalizer(layout, quick_policy());

        const UploadTarget target{"photo.jpg", "", 1000};
        const auto content = pattern_bytes(1000);

        assert(resolver.resolve(target).received == 0);

        auto first = send(receiver, target, 0, content.substr(0, 600));
        assert(first.outcome == ChunkOutcome::Appended);
        assert(first.received == 600);

        // A restarted client learns where to continue.
        const auto status = resolver.resolve(target);
        assert(status.received == 600);
        assert(!status.complete);

        auto second = send(receiver, target, 600, content.substr(600));
        assert(second.outcome == ChunkOutcome::Appended);
        assert(second.received == 1000);

        const auto result = finalizer.finalize(target);
        assert(result.outcome == FinalizeOutcome::Renamed);
        assert(result.ok());
        assert(result.note().empty());
        assert(result.final_path == root / "photo.jpg");
        assert(read_file(result.final_path) == content);
        assert(!std::filesystem::exists(layout.partial_path(target)));

        const auto done = resolver.resolve(target);
        assert(done.complete);
        assert(done.received == 1000);

        cleanup_path(root);
    }

    void test_offset_conflict_leaves_partial_untouched()
    {
        const auto root = fresh_root("chunkdrop_conflict_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const UploadTarget target{"data.bin", "nested/dir", 1000};

        const auto content = pattern_bytes(400);
        assert(send(receiver, target, 0, content).received == 400);

        const auto ahead = send(receiver, target, 500, pattern_bytes(100, 'A'));
        assert(ahead.outcome == ChunkOutcome::OffsetConflict);
        assert(ahead.received == 400);

        const auto behind = send(receiver, target, 0, pattern_bytes(100, 'A'));
        assert(behind.outcome == ChunkOutcome::OffsetConflict);
        assert(behind.received == 400);

        assert(read_file(layout.partial_path(target)) == content);

        std::uint64_t current = 0;
        assert(!receiver.begin(target, 401, current));
        assert(current == 400);

        cleanup_path(root);
    }

    void test_empty_file_upload()
    {
        const auto root = fresh_root("chunkdrop_empty_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const Finalizer finalizer(layout, quick_policy());
        const UploadTarget target{"empty.txt", "", 0};

        assert(send(receiver, target, 0, "").received == 0);
        assert(std::filesystem::exists(layout.partial_path(target)));

        const auto result = finalizer.finalize(target);
        assert(result.outcome == FinalizeOutcome::Renamed);
        assert(std::filesystem::file_size(result.final_path) == 0);

        cleanup_path(root);
    }

    void test_size_exceeded()
    {
        const auto root = fresh_root("chunkdrop_size_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const UploadTarget target{"small.bin", "", 10};

        assert(send(receiver, target, 0, pattern_bytes(6)).outcome == ChunkOutcome::Appended);
        const auto over = send(receiver, target, 6, pattern_bytes(6));
        assert(over.outcome == ChunkOutcome::SizeExceeded);
        assert(over.received == 12);

        // Finishing discards the overrun partial so the same target can start over from zero.
        const Finalizer finalizer(layout, quick_policy());
        const auto discarded = finalizer.finalize(target);
        assert(discarded.outcome == FinalizeOutcome::SizeExceeded);
        assert(!discarded.ok());
        assert(discarded.received == 12);
        assert(!std::filesystem::exists(layout.partial_path(target)));
        assert(!std::filesystem::exists(root / "small.bin"));
        assert(StatusResolver(layout).resolve(target).received == 0);

        const auto content = pattern_bytes(10, 'k');
        const auto restart = send(receiver, target, 0, content);
        assert(restart.outcome == ChunkOutcome::Appended);
        assert(restart.received == 10);
        const auto finished = finalizer.finalize(target);
        assert(finished.outcome == FinalizeOutcome::Renamed);
        assert(read_file(finished.final_path) == content);

        cleanup_path(root);
    }

    void test_finalize_is_idempotent()
    {
        const auto root = fresh_root("chunkdrop_idempotent_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const Finalizer finalizer(layout, quick_policy());
        const UploadTarget target{"report.pdf", "docs", 64};

        assert(send(receiver, target, 0, pattern_bytes(64)).received == 64);
        const auto first = finalizer.finalize(target);
        const auto second = finalizer.finalize(target);
        assert(first.outcome == FinalizeOutcome::Renamed);
        assert(second.outcome == FinalizeOutcome::AlreadyFinalized);
        assert(second.ok());
        assert(second.note() == "already finalized");
        assert(first.final_path == second.final_path);
        assert(!std::filesystem::exists(root / "docs" / "report (1).pdf"));
        assert(std::filesystem::file_size(first.final_path) == 64);

        cleanup_path(root);
    }

    void test_finalize_collision()
    {
        const auto root = fresh_root("chunkdrop_collision_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const Finalizer finalizer(layout, quick_policy());

        write_file(root / "a.txt", "unrelated");
        const UploadTarget target{"a.txt", "", 5};
        assert(send(receiver, target, 0, "hello").received == 5);

        const auto result = finalizer.finalize(target);
        assert(result.outcome == FinalizeOutcome::Collided);
        assert(result.note() == "renamed to avoid collision");
        assert(result.final_path == root / "a (1).txt");
        assert(read_file(root / "a.txt") == "unrelated");
        assert(read_file(root / "a (1).txt") == "hello");

        cleanup_path(root);
    }

    void test_concurrent_finalize()
    {
        const auto root = fresh_root("chunkdrop_race_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const Finalizer finalizer(layout, quick_policy());
        const UploadTarget target{"race.bin", "", 4096};

        for (int round = 0; round < 20; ++round)
        {
            cleanup_path(root / "race.bin");
            assert(send(receiver, target, 0, pattern_bytes(4096)).received == 4096);

            FinalizeResult first;
            FinalizeResult second;
            std::thread a([&] { first = finalizer.finalize(target); });
            std::thread b([&] { second = finalizer.finalize(target); });
            a.join();
            b.join();

            assert(first.ok());
            assert(second.ok());
            assert(first.final_path == root / "race.bin");
            assert(first.final_path == second.final_path);
            assert(std::filesystem::file_size(root / "race.bin") == 4096);
            assert(!std::filesystem::exists(root / "race (1).bin"));
            assert(!std::filesystem::exists(layout.partial_path(target)));
        }

        cleanup_path(root);
    }

    void test_settle_vanished_partial()
    {
        const auto root = fresh_root("chunkdrop_vanished_test");
        const StorageLayout layout(root);
        const Finalizer finalizer(layout, quick_policy());
        const UploadTarget target{"a.txt", "", 5};

        // Another finisher already moved the partial onto the name this call wanted.
        write_file(root / "a.txt", "hello");
        const auto winner = finalizer.settle_vanished(target, root / "a.txt", false);
        assert(winner.outcome == FinalizeOutcome::ConcurrentWinner);
        assert(winner.ok());
        assert(winner.note() == "finalized concurrently");
        assert(winner.final_path == root / "a.txt");

        // Collided: a.txt is unrelated even though its size matches; the winner sits at a (1).txt.
        write_file(root / "a (1).txt", "world");
        const auto sibling = finalizer.settle_vanished(target, root / "a (2).txt", true);
        assert(sibling.outcome == FinalizeOutcome::ConcurrentWinner);
        assert(sibling.final_path == root / "a (1).txt");

        // Collided with no numbered sibling of the right size: the unrelated file is never reported.
        write_file(root / "a (1).txt", "too long");
        const auto lost = finalizer.settle_vanished(target, root / "a (2).txt", true);
        assert(lost.outcome == FinalizeOutcome::NotFound);
        assert(!lost.ok());
        assert(lost.final_path != root / "a.txt");

        std::filesystem::remove(root / "a (1).txt");
        assert(finalizer.settle_vanished(target, root / "a (1).txt", true).outcome == FinalizeOutcome::NotFound);
        assert(finalizer.settle_vanished(UploadTarget{"b.txt", "", 5}, root / "b.txt", false).outcome ==
               FinalizeOutcome::NotFound);

        cleanup_path(root);
    }

    void test_unrelated_final_without_partial()
    {
        const auto root = fresh_root("chunkdrop_open_question_test");
        const StorageLayout layout(root);
        const StatusResolver resolver(layout);
        const Finalizer finalizer(layout, quick_policy());

        write_file(root / "notes.txt", "short");
        const UploadTarget target{"notes.txt", "", 100};

        const auto status = resolver.resolve(target);
        assert(status.received == 5);
        assert(!status.complete);
        assert(status.collision);

        const auto result = finalizer.finalize(target);
        assert(result.outcome == FinalizeOutcome::NotFound);
        assert(read_file(root / "notes.txt") == "short");

        const UploadTarget undeclared{"notes.txt", "", 0};
        assert(resolver.resolve(undeclared).complete);
        assert(finalizer.finalize(undeclared).outcome == FinalizeOutcome::AlreadyFinalized);

        cleanup_path(root);
    }

    void test_finalize_without_partial()
    {
        const auto root = fresh_root("chunkdrop_missing_test");
        const StorageLayout layout(root);
        const Finalizer finalizer(layout, quick_policy());

        const auto result = finalizer.finalize(UploadTarget{"ghost.bin", "", 10});
        assert(result.outcome == FinalizeOutcome::NotFound);
        assert(!result.ok());

        cleanup_path(root);
    }

    void test_finalize_incomplete()
    {
        const auto root = fresh_root("chunkdrop_incomplete_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const Finalizer finalizer(layout, quick_policy());
        const UploadTarget target{"big.iso", "", 1000};

        assert(send(receiver, target, 0, pattern_bytes(300)).received == 300);
        const auto result = finalizer.finalize(target);
        assert(result.outcome == FinalizeOutcome::Incomplete);
        assert(result.received == 300);
        assert(std::filesystem::exists(layout.partial_path(target)));
        assert(!std::filesystem::exists(root / "big.iso"));

        cleanup_path(root);
    }

    void test_finalize_checks_content_hash()
    {
        const auto root = fresh_root("chunkdrop_hash_test");
        const StorageLayout layout(root);
        const ChunkReceiver receiver(layout);
        const Finalizer finalizer(layout, quick_policy());
        const UploadTarget target{"checked.bin", "", 32};
        const auto content = pattern_bytes(32);

        assert(send(receiver, target, 0, content).received == 32);

        const auto wrong = crypto::hash_bytes(std::as_bytes(std::span(content.data(), 31)));
        const auto refused = finalizer.finalize(target, wrong);
        assert(refused.outcome == FinalizeOutcome::IntegrityMismatch);
        assert(std::filesystem::exists(layout.partial_path(target)));

        const auto right = crypto::hash_bytes(std::as_bytes(std::span(content.data(), content.size())));
        const auto accepted = finalizer.finalize(target, right);
        assert(accepted.outcome == FinalizeOutcome::Renamed);
        assert(read_file(accepted.final_path) == content);

        cleanup_path(root);
    }

    void test_move_with_retry()
    {
        const auto root = fresh_root("chunkdrop_move_test");
        const StorageLayout layout(root);
        const Finalizer finalizer(layout, quick_policy());

        write_file(root / "from.bin", "payload");
        std::error_code error;
        assert(finalizer.move_with_retry(root / "from.bin", root / "to.bin", error) == MoveStatus::Moved);
        assert(read_file(root / "to.bin") == "payload");
        assert(!std::filesystem::exists(root / "from.bin"));

        assert(finalizer.move_with_retry(root / "missing.bin", root / "other.bin", error) == MoveStatus::SourceVanished);
        assert(error);

        cleanup_path(root);
    }

    void test_next_free_path()
    {
        const auto root = fresh_root("chunkdrop_free_path_test");
        assert(next_free_path(root / "a.txt") == root / "a.txt");
        write_file(root / "a.txt", "1");
        write_file(root / "a (1).txt", "2");
        assert(next_free_path(root / "a.txt") == root / "a (2).txt");
        write_file(root / "archive", "3");
        assert(next_free_path(root / "archive") == root / "archive (1)");

        cleanup_path(root);
    }

    void test_stats_counter()
    {
        const auto root = fresh_root("chunkdrop_stats_test");
        const StorageLayout layout(root);
        layout.ensure_roots();
        const StatsCounter counter(layout);

        assert(counter.count_files() == 0);
        write_file(root / "one.txt", "1");
        write_file(root / "docs" / "two.txt", "2");
        write_file(root / "docs" / "deep" / "three.txt", "3");
        write_file(root / "stray.part", "x");
        write_file(layout.staging_root() / "pending.bin.part", "x");
        write_file(layout.staging_root() / "docs" / "other.bin", "x");
        write_file(root / "docs" / ".incoming" / "hidden.bin", "x");
        assert(counter.count_files() == 3);

        cleanup_path(root);
    }

    void test_target_claims()
    {
        TargetClaims claims;
        {
            auto claim = claims.try_claim("staging/a.part");
            assert(claim);
            assert(claims.is_claimed("staging/a.part"));
            assert(!claims.try_claim("staging/a.part"));
            assert(claims.try_claim("staging/b.part"));
            assert(!claims.is_claimed("staging/b.part"));

            auto moved = std::move(*claim);
            claim.reset();
            assert(claims.is_claimed("staging/a.part"));
        }
        assert(!claims.is_claimed("staging/a.part"));
        assert(claims.try_claim("staging/a.part"));
    }

    void test_multipart_parsing()
    {
        const auto boundary = multipart::boundary_from_content_type("multipart/form-data; boundary=\"XyZ\"");
        assert(boundary == std::optional<std::string>("XyZ"));
        assert(!multipart::boundary_from_content_type("application/json"));
        assert(!multipart::boundary_from_content_type("multipart/form-data"));

        const std::string body =
            "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"files\"; filename=\"a.txt\"\r\n"
            "Content-Type: text/plain\r\n"
            "\r\n"
            "hello\r\nworld\r\n"
            "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"note\"\r\n"
            "\r\n"
            "plain field\r\n"
            "--XyZ--\r\n";
        const auto parts = multipart::parse(body, "XyZ");
        assert(parts.size() == 2);
        assert(parts[0].name == "files");
        assert(parts[0].filename == std::optional<std::string>("a.txt"));
        assert(parts[0].content_type == "text/plain");
        assert(parts[0].data == "hello\r\nworld");
        assert(parts[1].name == "note");
        assert(!parts[1].filename);
        assert(parts[1].data == "plain field");
        assert(multipart::carries_file(parts[0]));
        assert(!multipart::carries_file(parts[1]));

        const std::string blank_names =
            "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"files\"; filename=\"\"\r\n"
            "\r\n"
            "\r\n"
            "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"files\"; filename=\"   \"\r\n"
            "\r\n"
            "ignored\r\n"
            "--XyZ\r\n"
            "Content-Disposition: form-data; name=\"files\"; filename=\" b.txt \"\r\n"
            "\r\n"
            "kept\r\n"
            "--XyZ--\r\n";
        const auto blanks = multipart::parse(blank_names, "XyZ");
        assert(blanks.size() == 3);
        assert(!multipart::carries_file(blanks[0]));
        assert(!multipart::carries_file(blanks[1]));
        assert(multipart::carries_file(blanks[2]));

        bool caught = false;
        try
        {
            (void)multipart::parse("--XyZ\r\nContent-Disposition: form-data; name=\"files\"\r\n\r\nno end", "XyZ");
        }
        catch (const HttpError &ex)
        {
            caught = ex.code() == ErrorCode::InvalidParameter;
        }
        assert(caught);
    }

    ServerConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "chunkdrop_server");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_config_parsing()
    {
        const auto config = parse({"--root", "/srv/drop", "--port", "8080", "--threads", "4", "--staging-dir",
                                   ".pending", "--idle-timeout", "30", "--move-attempts", "3", "--move-backoff-ms",
                                   "50", "--verbose"});
        assert(config.root == std::filesystem::path("/srv/drop"));
        assert(config.port == 8080);
        assert(config.worker_threads == 4);
        assert(config.staging_dir_name == ".pending");
        assert(config.idle_timeout == std::chrono::seconds(30));
        assert(config.move_attempts == 3);
        assert(config.move_backoff == std::chrono::milliseconds(50));
        assert(config.verbose);
        assert(!config.log_file);

        const auto defaults = parse({"--root", "/srv/drop"});
        assert(defaults.port == 5000);
        assert(defaults.staging_dir_name == kDefaultStagingDirName);

        assert(parse({"--help"}).show_help);

        const std::vector<std::vector<std::string>> invalid = {
            {},
            {"--root"},
            {"--root", "/srv", "--port", "http"},
            {"--root", "/srv", "--port", "70000"},
            {"--root", "/srv", "--bogus"},
        };
        for (const auto &args : invalid)
        {
            bool caught = false;
            try
            {
                (void)parse(args);
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_route_resolution()
    {
        assert(resolve_route("GET", "/upload/status") == Route::UploadStatus);
        assert(resolve_route("POST", "/upload/chunk") == Route::UploadChunk);
        assert(resolve_route("POST", "/upload/finish") == Route::UploadFinish);
        assert(resolve_route("GET", "/stats") == Route::Stats);
        assert(resolve_route("POST", "/upload") == Route::LegacyUpload);
        assert(resolve_route("GET", "/downloads/docs/a.txt") == Route::Download);
        assert(resolve_route("GET", "/upload/chunk") == Route::MethodNotAllowed);
        assert(resolve_route("DELETE", "/downloads/a.txt") == Route::MethodNotAllowed);
        assert(resolve_route("GET", "/downloads/") == Route::NotFound);
        assert(resolve_route("GET", "/nothing") == Route::NotFound);
    }

} // namespace

void run_server_component_tests()
{
    test_relative_path_sanitizing();
    test_file_name_sanitizing();
    test_storage_layout();
    test_chunked_upload_and_resume();
    test_offset_conflict_leaves_partial_untouched();
    test_empty_file_upload();
    test_size_exceeded();
    test_finalize_is_idempotent();
    test_finalize_collision();
    test_concurrent_finalize();
    test_settle_vanished_partial();
    test_unrelated_final_without_partial();
    test_finalize_without_partial();
    test_finalize_incomplete();
    test_finalize_checks_content_hash();
    test_move_with_retry();
    test_next_free_path();
    test_stats_counter();
    test_target_claims();
    test_multipart_parsing();
    test_config_parsing();
    test_route_resolution();
}
