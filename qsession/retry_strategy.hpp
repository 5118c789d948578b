#ifndef QSESSION_RETRY_STRATEGY_HPP
#define QSESSION_RETRY_STRATEGY_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/context.hpp>

#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/thread/mutex.hpp>

#include <exception>

namespace qsession {

class session_monitor;

/// \brief Retry policy parameters
struct QSESSION_API retry_parameters
{
    retry_parameters()
      : max_retries(10)
      , backoff_slot_ms(5)
      , backoff_ceiling(6)
      , idempotent(false)
    {
    }

    /// Number of retries after the first attempt, 0 disables retries
    int max_retries;
    /// Base delay of exponential backoff
    int backoff_slot_ms;
    /// Backoff stops growing after this number of attempts
    int backoff_ceiling;
    /// Idempotency assumed for attempts that don`t report it
    bool idempotent;
};

///
/// \brief Outcome of a single attempt passed back to retry loop
///
/// Empty error means success.
///
struct attempt_result
{
    attempt_result() {}

    attempt_result(const std::exception_ptr& e, const boost::optional<bool>& idem)
      : error(e), idempotent(idem)
    {
    }

    std::exception_ptr error;
    boost::optional<bool> idempotent;
};

///
/// \brief Repeatedly invokes attempt until it succeeds, error is not retryable or retries are exhausted
///
/// bad_session and session_busy are always retried because next attempt gets fresh session. Transient
/// errors are retried only when attempt is idempotent. Other errors are rethrown immediately.
///
class QSESSION_API retry_strategy : boost::noncopyable
{
public:
    typedef boost::function<attempt_result(const context&)> attempt_function;

    explicit retry_strategy(const retry_parameters& params = retry_parameters(), session_monitor* sm = 0);
    virtual ~retry_strategy() {}

    ///
    /// Run \a attempt until success, rethrow the last error on failure.
    /// Throw operation_cancelled/deadline_exceeded if \a ctx is done before the first attempt.
    ///
    virtual void retry(const context& ctx, const attempt_function& attempt);

    const retry_parameters& parameters() const
    {
        return params_;
    }

protected:
    typedef enum {
        no_retry,
        retry_immediately,
        retry_fast_backoff,
        retry_slow_backoff
    } decision;

    ///
    /// Decide whether the \a error is worth retrying
    ///
    virtual decision classify(const std::exception_ptr& error, bool idempotent) const;

    ///
    /// Return backoff delay before retry number \a attempt
    ///
    int backoff_ms(decision d, int attempt);

private:
    retry_parameters params_;
    session_monitor* sm_;

    boost::mutex rand_guard_;
    boost::random::mt19937 rand_;
};

}

#endif // QSESSION_RETRY_STRATEGY_HPP
