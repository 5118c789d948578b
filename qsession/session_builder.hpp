#ifndef QSESSION_SESSION_BUILDER_HPP
#define QSESSION_SESSION_BUILDER_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/session.hpp>
#include <qsession/retry_strategy.hpp>

#include <boost/noncopyable.hpp>

#include <string>

namespace qsession {

class discovery;
class session_monitor;

///
/// \brief Creates sessions on a single endpoint
///
/// Each new session gets attached keep-alive stream, end of the stream schedules session deletion.
///
class QSESSION_API session_builder : boost::noncopyable
{
public:
    session_builder(
        const endpoint& ep
      , const rpc::query_service_ptr& service
      , discovery& disc
      , retry_strategy& retrier
      , session_monitor* sm = 0
      );

    ///
    /// Create and attach new session, retrying transient failures. Created session is free and reports
    /// its lifecycle signals to \a listener.
    ///
    session_ptr create(const context& ctx, session_listener* listener);

    const endpoint& get_endpoint() const
    {
        return endpoint_;
    }

private:
    attempt_result create_attempt(session_listener* listener, session_ptr& result);

    endpoint endpoint_;
    rpc::query_service_ptr service_;
    discovery& discovery_;
    retry_strategy& retrier_;
    session_monitor* sm_;
};

typedef boost::shared_ptr<session_builder> session_builder_ptr;

}

#endif // QSESSION_SESSION_BUILDER_HPP
