#include "chunkup/server/retry_policy.hpp"

namespace chunkup::server
{

    RetryDecision RetryPolicy::on_transient_failure(UploadSession &session) const noexcept
    {
        if (session.retry_budget == 0)
        {
            return RetryDecision::Exhausted;
        }
        --session.retry_budget;
        return RetryDecision::Retry;
    }

    void RetryPolicy::on_success(UploadSession &session) const noexcept
    {
        session.retry_budget = initial_budget_;
    }

} // namespace chunkup::server
