#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace chunkdrop::server::paths
{

    constexpr std::size_t kMaxSegmentLength = 255;
    constexpr std::size_t kMaxDepth = 50;
    constexpr std::size_t kMaxFileNameLength = 240;
    constexpr std::string_view kDefaultFileName = "upload.bin";
    constexpr std::string_view kPlaceholderSegment = "_";

    // True when every character of a directory segment is in the allow-list.
    bool is_safe_segment(std::string_view segment) noexcept;

    /**
     * Normalizes a client supplied directory path into at most kMaxDepth relative segments.
     * Traversal segments are dropped, disallowed segments degrade to kPlaceholderSegment.
     * The result is never absolute and never contains "..".
     */
    std::filesystem::path sanitize_relative_path(std::string_view relpath);

    std::string sanitize_file_name(std::string_view name);

} // namespace chunkdrop::server::paths
