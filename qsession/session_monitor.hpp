#ifndef QSESSION_SESSION_MONITOR_HPP
#define QSESSION_SESSION_MONITOR_HPP

#include <qsession/endpoint.hpp>

#include <cstddef>
#include <string>

namespace qsession {

/// 
/// \brief Interface for monitoring session lifecycle and execution
///
/// All hooks are called synchronously from the thread that made the change and must not throw.
///
class session_monitor
{
public:
    virtual ~session_monitor() {}

    virtual void session_created(
        const std::string& // session_id
      , const endpoint&    // ep
      )
    {}

    virtual void session_create_failed(const char* /* what */) {}

    virtual void session_deleted(const std::string& /* session_id */) {}

    ///
    /// Server refused to delete session, it is dropped from the pool anyway
    ///
    virtual void session_delete_failed(
        const std::string& // session_id
      , const char*        // what
      )
    {}

    ///
    /// Called when session was evicted because server reported it unusable
    ///
    virtual void session_broken(const std::string& /* session_id */) {}

    ///
    /// Called after query has been executed. 
    /// \param ok - false when error occurred
    /// \param execution_time - time in seconds that has been taken to execute query
    ///
    virtual void query_executed(
        const std::string& // query
      , bool               // ok
      , double             // execution_time
      )
    {}

    virtual void transaction_started() {}
    virtual void transaction_committed() {}
    virtual void transaction_reverted() {}

    ///
    /// Best-effort rollback failed, original error (if any) is propagated instead
    ///
    virtual void transaction_rollback_failed(const char* /* what */) {}

    virtual void waiter_timed_out(int /* timeout_ms */) {}

    ///
    /// Called for every failed attempt of retried operation
    ///
    virtual void attempt_failed(
        int         // attempt
      , const char* // what
      , bool        // will_retry
      )
    {}

    virtual void pool_destroyed(std::size_t /* sessions_deleted */) {}
};

}

#endif // QSESSION_SESSION_MONITOR_HPP
