#include "chunkup/server/file_naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace chunkup::server
{

    namespace
    {
        // ASCII replacements for U+00A0..U+00FF after compatibility decomposition.
        // Characters without an ASCII base map to nothing.
        constexpr std::array<std::string_view, 96> kLatin1Fold = {
            " ", "", "", "", "", "", "", "", " ", "", "a", "", "", "", "", " ",
            "", "", "2", "3", " ", "", "", "", " ", "1", "o", "", "14", "12", "34", "",
            "A", "A", "A", "A", "A", "A", "", "C", "E", "E", "E", "E", "I", "I", "I", "I",
            "", "N", "O", "O", "O", "O", "O", "", "", "U", "U", "U", "U", "Y", "", "",
            "a", "a", "a", "a", "a", "a", "", "c", "e", "e", "e", "e", "i", "i", "i", "i",
            "", "n", "o", "o", "o", "o", "o", "", "", "u", "u", "u", "u", "y", "", "y"};

#ifdef _WIN32
        constexpr std::array<std::string_view, 24> kDeviceNames = {
            "CON", "PRN", "AUX", "NUL",
            "COM0", "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
            "LPT0", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};
#endif

        std::size_t sequence_length(unsigned char lead)
        {
            if ((lead & 0xE0) == 0xC0)
            {
                return 2;
            }
            if ((lead & 0xF0) == 0xE0)
            {
                return 3;
            }
            if ((lead & 0xF8) == 0xF0)
            {
                return 4;
            }
            return 1;
        }

        // Folds Latin-1 letters to ASCII and drops every other non-ASCII sequence.
        std::string fold_to_ascii(std::string_view input)
        {
            std::string out;
            out.reserve(input.size());
            std::size_t i = 0;
            while (i < input.size())
            {
                const auto lead = static_cast<unsigned char>(input[i]);
                if (lead < 0x80)
                {
                    out.push_back(static_cast<char>(lead));
                    ++i;
                    continue;
                }
                const auto length = std::min(sequence_length(lead), input.size() - i);
                if (length == 2)
                {
                    const auto trail = static_cast<unsigned char>(input[i + 1]);
                    const unsigned code_point = ((lead & 0x1Fu) << 6) | (trail & 0x3Fu);
                    if ((trail & 0xC0) == 0x80 && code_point >= 0xA0 && code_point <= 0xFF)
                    {
                        out.append(kLatin1Fold[code_point - 0xA0]);
                    }
                }
                i += length;
            }
            return out;
        }

        bool is_allowed(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' || c == '-';
        }

        std::string sanitize_component(const std::optional<std::string> &owner)
        {
            if (!owner)
            {
                return {};
            }
            return secure_file_name(*owner);
        }

    } // namespace

    std::string secure_file_name(std::string_view name)
    {
        auto ascii = fold_to_ascii(name);
        std::replace(ascii.begin(), ascii.end(), '/', ' ');
#ifdef _WIN32
        std::replace(ascii.begin(), ascii.end(), '\\', ' ');
#endif

        // Collapse whitespace runs into single underscores, dropping leading and trailing runs.
        std::string joined;
        joined.reserve(ascii.size());
        bool pending_separator = false;
        for (const char c : ascii)
        {
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                pending_separator = !joined.empty();
                continue;
            }
            if (pending_separator)
            {
                joined.push_back('_');
                pending_separator = false;
            }
            joined.push_back(c);
        }

        std::string filtered;
        filtered.reserve(joined.size());
        std::copy_if(joined.begin(), joined.end(), std::back_inserter(filtered), is_allowed);

        const auto first = filtered.find_first_not_of("._");
        if (first == std::string::npos)
        {
            return {};
        }
        const auto last = filtered.find_last_not_of("._");
        auto result = filtered.substr(first, last - first + 1);

#ifdef _WIN32
        std::string stem = result.substr(0, result.find('.'));
        std::transform(stem.begin(), stem.end(), stem.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        if (std::find(kDeviceNames.begin(), kDeviceNames.end(), stem) != kDeviceNames.end())
        {
            result.insert(result.begin(), '_');
        }
#endif
        return result;
    }

    std::string validate_file_name(std::string_view name)
    {
        if (name.find('.') == std::string_view::npos)
        {
            throw std::invalid_argument("Invalid file name. File name must have an extension");
        }
        auto sanitized = secure_file_name(name);
        if (sanitized.empty())
        {
            throw std::invalid_argument("Invalid file name. File name is empty after sanitizing");
        }
        return sanitized;
    }

    std::string make_blob_key(const std::string &session_id, const std::optional<std::string> &owner,
                              const std::string &file_name, bool preserve_file_name, Clock::time_point now)
    {
        std::string name = file_name;
        if (!preserve_file_name)
        {
            auto hex_id = session_id;
            hex_id.erase(std::remove(hex_id.begin(), hex_id.end(), '-'), hex_id.end());
            name = hex_id + std::filesystem::path(file_name).extension().string();
        }

        const std::time_t seconds = Clock::to_time_t(now);
        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream key;
        key << "uploads/";
        const auto owner_component = sanitize_component(owner);
        if (!owner_component.empty())
        {
            key << owner_component << '/';
        }
        key << std::put_time(&utc, "%Y/%m/%d/") << name;
        return key.str();
    }

} // namespace chunkup::server
