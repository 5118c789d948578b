#include <qsession/retry_strategy.hpp>
#include <qsession/session_monitor.hpp>
#include <qsession/errors.hpp>

#include <boost/random/uniform_int_distribution.hpp>

#include <algorithm>
#include <ctime>

namespace qsession {

namespace {

const char* error_message(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown error";
    }
}

}

retry_strategy::retry_strategy(const retry_parameters& params, session_monitor* sm)
  : params_(params)
  , sm_(sm)
  , rand_(static_cast<boost::uint32_t>(std::time(0)))
{
}

void retry_strategy::retry(const context& ctx, const attempt_function& attempt)
{
    for (int attempt_no = 0; ; ++attempt_no)
    {
        ctx.check();

        attempt_result res = attempt(ctx);
        if (!res.error)
            return;

        bool idempotent = res.idempotent ? *res.idempotent : params_.idempotent;
        decision d = classify(res.error, idempotent);
        bool will_retry = d != no_retry && attempt_no < params_.max_retries && !ctx.done();

        if (sm_)
            sm_->attempt_failed(attempt_no + 1, error_message(res.error), will_retry);

        if (!will_retry)
            std::rethrow_exception(res.error);

        if (d != retry_immediately && !ctx.sleep_for(backoff_ms(d, attempt_no)))
            std::rethrow_exception(res.error);
    }
}

retry_strategy::decision retry_strategy::classify(const std::exception_ptr& error, bool idempotent) const
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const bad_session&)
    {
        return retry_immediately;
    }
    catch (const session_busy&)
    {
        return retry_immediately;
    }
    catch (const overloaded&)
    {
        return idempotent ? retry_slow_backoff : no_retry;
    }
    catch (const aborted&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (const unavailable&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (const session_expired&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (const undetermined&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (const remote_timeout&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (const transport_error&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (const session_pool_empty&)
    {
        return idempotent ? retry_fast_backoff : no_retry;
    }
    catch (...)
    {
        return no_retry;
    }
}

int retry_strategy::backoff_ms(decision d, int attempt)
{
    int slot = params_.backoff_slot_ms * (d == retry_slow_backoff ? 10 : 1);
    int max_delay = slot * (1 << std::min(std::max(attempt, 0), std::max(params_.backoff_ceiling, 0)));

    // jitter within the upper half of the delay
    boost::mutex::scoped_lock g(rand_guard_);
    boost::random::uniform_int_distribution<int> dist(max_delay / 2, max_delay);
    return dist(rand_);
}

}
