#include "chunkdrop/server/path_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace chunkdrop::server::paths
{

    namespace
    {

        constexpr std::string_view kSegmentPunctuation = " ._-()+=@#,&{}!$%^~[]";
        constexpr std::size_t kMaxKeptExtension = 16;

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t\r\n\v\f");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t\r\n\v\f");
            return value.substr(begin, end - begin + 1);
        }

        bool is_name_char(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.' || ch == '-';
        }

        std::string bound_length(std::string name)
        {
            if (name.size() <= kMaxFileNameLength)
            {
                return name;
            }
            const auto dot = name.rfind('.');
            if (dot != std::string::npos && dot > 0 && name.size() - dot <= kMaxKeptExtension)
            {
                const auto extension = name.substr(dot);
                return name.substr(0, kMaxFileNameLength - extension.size()) + extension;
            }
            name.resize(kMaxFileNameLength);
            return name;
        }

    } // namespace

    bool is_safe_segment(std::string_view segment) noexcept
    {
        return !segment.empty() && std::all_of(segment.begin(), segment.end(), [](char ch)
                                                { return (static_cast<unsigned char>(ch) < 0x80 &&
                                                          std::isalnum(static_cast<unsigned char>(ch))) ||
                                                         kSegmentPunctuation.find(ch) != std::string_view::npos; });
    }

    std::filesystem::path sanitize_relative_path(std::string_view relpath)
    {
        std::filesystem::path result;
        std::size_t depth = 0;
        while (!relpath.empty() && depth < kMaxDepth)
        {
            const auto separator = relpath.find_first_of("/\\");
            const auto segment = trim(relpath.substr(0, separator));
            relpath = separator == std::string_view::npos ? std::string_view{} : relpath.substr(separator + 1);

            if (segment.empty() || segment == "." || segment == "..")
            {
                continue;
            }
            if (!is_safe_segment(segment))
            {
                result /= std::string(kPlaceholderSegment);
            }
            else
            {
                result /= std::string(segment.substr(0, kMaxSegmentLength));
            }
            ++depth;
        }
        return result;
    }

    std::string sanitize_file_name(std::string_view name)
    {
        // Separators become whitespace, whitespace runs become a single '_'.
        std::string collapsed;
        collapsed.reserve(name.size());
        bool pending_space = false;
        for (const char ch : name)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (c >= 0x80)
            {
                continue;
            }
            if (ch == '/' || ch == '\\' || std::isspace(c))
            {
                pending_space = true;
                continue;
            }
            if (pending_space && !collapsed.empty())
            {
                collapsed.push_back('_');
            }
            pending_space = false;
            collapsed.push_back(ch);
        }

        std::string filtered;
        filtered.reserve(collapsed.size());
        std::copy_if(collapsed.begin(), collapsed.end(), std::back_inserter(filtered), is_name_char);

        const auto begin = filtered.find_first_not_of("._");
        if (begin == std::string::npos)
        {
            return std::string(kDefaultFileName);
        }
        const auto end = filtered.find_last_not_of("._");
        return bound_length(filtered.substr(begin, end - begin + 1));
    }

} // namespace chunkdrop::server::paths
