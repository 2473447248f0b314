/**
 * chunkdrop - Content digests built on libsodium (BLAKE2b, hex encoded).
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace chunkdrop::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Compares two hex digests ignoring letter case.
    bool digests_match(std::string_view expected, std::string_view actual);

} // namespace chunkdrop::crypto
