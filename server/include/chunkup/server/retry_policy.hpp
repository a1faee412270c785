#pragma once

#include <cstdint>

#include "chunkup/server/upload_session.hpp"

namespace chunkup::server
{

    enum class RetryDecision : std::uint8_t
    {
        Retry,
        Exhausted
    };

    // Budget bookkeeping for transient chunk failures. Persistence and blob cleanup are the
    // caller's job; this only touches UploadSession::retry_budget.
    class RetryPolicy
    {
    public:
        explicit RetryPolicy(std::uint32_t initial_budget) : initial_budget_(initial_budget) {}

        std::uint32_t initial_budget() const noexcept { return initial_budget_; }

        RetryDecision on_transient_failure(UploadSession &session) const noexcept;

        void on_success(UploadSession &session) const noexcept;

    private:
        std::uint32_t initial_budget_;
    };

} // namespace chunkup::server
