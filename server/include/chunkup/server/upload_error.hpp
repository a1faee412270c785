#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "chunkup/error_codes.hpp"

namespace chunkup::server
{

    struct UploadError
    {
        chunkup::ErrorCode code{chunkup::ErrorCode::InternalError};
        std::string message;
        // Set only for errors the caller may fix by resending the same chunk.
        std::optional<std::uint32_t> remaining_retries;

        bool retryable() const noexcept { return remaining_retries.has_value(); }
    };

    // Either a value or an UploadError. Engine operations never throw for expected failures.
    template <typename T>
    class Outcome
    {
    public:
        Outcome(T value) : state_(std::move(value)) {}
        Outcome(UploadError error) : state_(std::move(error)) {}

        bool ok() const noexcept { return std::holds_alternative<T>(state_); }
        explicit operator bool() const noexcept { return ok(); }

        const T &value() const & { return std::get<T>(state_); }
        T &value() & { return std::get<T>(state_); }
        T &&value() && { return std::get<T>(std::move(state_)); }

        const UploadError &error() const & { return std::get<UploadError>(state_); }

    private:
        std::variant<T, UploadError> state_;
    };

    inline UploadError make_error(chunkup::ErrorCode code, std::string message,
                                  std::optional<std::uint32_t> remaining_retries = std::nullopt)
    {
        return UploadError{code, std::move(message), remaining_retries};
    }

} // namespace chunkup::server
