#ifndef QSESSION_DETAIL_WAITER_HPP
#define QSESSION_DETAIL_WAITER_HPP

#include <qsession/session.hpp>

#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/chrono/system_clocks.hpp>
#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

namespace qsession { namespace detail {

///
/// \brief Single-fire completion handle of a pending acquire
///
/// Exactly one of fulfill(), grant() and cancel() succeeds, the others return false. A granted waiter
/// owns an admission slot and creates the session itself.
///
class waiter : boost::noncopyable
{
public:
    typedef boost::chrono::steady_clock::time_point time_point;

    waiter() : state_(pending), interrupted_(false) {}

    /// Hand session over to the waiting caller. Return false if waiter was cancelled.
    bool fulfill(const session_ptr& sess)
    {
        {
            boost::mutex::scoped_lock g(guard_);
            if (state_ != pending)
                return false;

            state_ = fulfilled;
            sess_ = sess;
        }
        cv_.notify_one();
        return true;
    }

    /// Let the waiting caller create new session in the reserved admission slot. Return false if waiter
    /// was already completed.
    bool grant()
    {
        {
            boost::mutex::scoped_lock g(guard_);
            if (state_ != pending)
                return false;

            state_ = granted;
        }
        cv_.notify_one();
        return true;
    }

    bool is_granted()
    {
        boost::mutex::scoped_lock g(guard_);
        return state_ == granted;
    }

    /// Withdraw the waiter. Return false if it was already fulfilled or granted.
    bool cancel()
    {
        boost::mutex::scoped_lock g(guard_);
        if (state_ != pending)
            return state_ == cancelled;

        state_ = cancelled;
        return true;
    }

    /// Wake up waiting thread without fulfilling
    void interrupt()
    {
        {
            boost::mutex::scoped_lock g(guard_);
            interrupted_ = true;
        }
        cv_.notify_one();
    }

    /// Block until completed, interrupted or \a deadline passed. Return empty pointer if not fulfilled.
    session_ptr wait(const boost::optional<time_point>& deadline)
    {
        boost::mutex::scoped_lock g(guard_);
        while (state_ == pending && !interrupted_)
        {
            if (!deadline)
                cv_.wait(g);
            else if (cv_.wait_until(g, *deadline) == boost::cv_status::timeout)
                break;
        }

        return state_ == fulfilled ? sess_ : session_ptr();
    }

    session_ptr get()
    {
        boost::mutex::scoped_lock g(guard_);
        return sess_;
    }

private:
    typedef enum {
        pending,
        fulfilled,
        granted,
        cancelled
    } state_type;

    boost::mutex guard_;
    boost::condition_variable cv_;
    state_type state_;
    bool interrupted_;
    session_ptr sess_;
};

typedef boost::shared_ptr<waiter> waiter_ptr;

}} // namespace qsession, detail

#endif // QSESSION_DETAIL_WAITER_HPP
