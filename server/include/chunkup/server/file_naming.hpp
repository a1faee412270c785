#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "chunkup/server/upload_session.hpp"

namespace chunkup::server
{

    // Reduces an untrusted name to [A-Za-z0-9_.-]. May return an empty string.
    std::string secure_file_name(std::string_view name);

    // Requires an extension and a non-empty sanitized result. Throws std::invalid_argument.
    std::string validate_file_name(std::string_view name);

    // uploads/[<owner>/]YYYY/MM/DD/<name>, dated in UTC.
    std::string make_blob_key(const std::string &session_id, const std::optional<std::string> &owner,
                              const std::string &file_name, bool preserve_file_name, Clock::time_point now);

} // namespace chunkup::server
