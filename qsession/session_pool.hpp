#ifndef QSESSION_SESSION_POOL_HPP
#define QSESSION_SESSION_POOL_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/detail/waiter.hpp>
#include <qsession/session.hpp>
#include <qsession/session_builder.hpp>
#include <qsession/retry_strategy.hpp>
#include <qsession/settings.hpp>

#include <boost/thread/mutex.hpp>
#include <boost/signals2/connection.hpp>
#include <boost/noncopyable.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <set>
#include <string>

namespace qsession {

class discovery;
class session_monitor;

/// Snapshot of pool counters
struct pool_stats
{
    pool_stats() : live(0), free(0), waiting(0), being_created(0), being_deleted(0) {}

    std::size_t live;
    std::size_t free;
    std::size_t waiting;
    int being_created;
    int being_deleted;
};

/// \brief Thread-safe pool of sessions with maximum number limit
///
/// Sessions are created lazily on endpoints returned by discovery. When the limit is reached callers
/// queue up and are served in FIFO order by released sessions. Sessions reported broken by their holders
/// or closed by server are deleted and never handed out again.
///
/// All sessions must be released before the pool is destroyed.
class QSESSION_API session_pool : boost::noncopyable, private session_listener
{
public:
    session_pool(
        discovery& disc
      , rpc::transport_iface& transport
      , const std::string& database
      , const pool_settings& settings = pool_settings()
      , const retry_parameters& create_retry = retry_parameters()
      , session_monitor* sm = 0
      );

    /// Calls destroy()
    ~session_pool();

    ///
    /// Get free session from pool or create new one if limit is not reached. Otherwise wait until someone
    /// releases session. With \a timeout_ms > 0 throw session_pool_empty if no session became available
    /// in time, with \a timeout_ms == 0 wait indefinitely.
    ///
    /// Returned session is busy and must be released by session::release().
    ///
    session_ptr acquire(int timeout_ms = 0);

    ///
    /// Same as acquire(timeout_ms) but wait is also bounded by \a ctx deadline and cancellation
    ///
    session_ptr acquire(const context& ctx, int timeout_ms = 0);

    ///
    /// Delete all sessions and wait for completion. Pending acquires fail, new acquires are rejected.
    ///
    void destroy();

    pool_stats stats();

    const pool_settings& settings() const
    {
        return settings_;
    }

private:
    typedef std::set<session_ptr> session_set;
    typedef std::map<endpoint, session_builder_ptr> builder_map;
    typedef std::deque<detail::waiter_ptr> waiter_queue;

    // session_listener
    virtual void session_released(const session_ptr& sess);
    virtual void session_broken(const session_ptr& sess);
    virtual void session_stream_closed(const session_ptr& sess);

    session_builder_ptr get_session_builder();
    void remove_session_builder(const endpoint& ep);

    session_ptr create_session(const context& ctx);
    session_ptr create_busy_session(const context& ctx);
    session_ptr wait_for_session(const detail::waiter_ptr& w, const context& ctx, int timeout_ms);

    bool admission_allowed_locked() const;
    session_ptr find_free_locked() const;
    bool fulfill_waiter_locked(const session_ptr& sess);
    bool grant_waiter_locked();
    void serve_waiter_locked();
    void offer_locked(const session_ptr& sess);
    void begin_delete_locked(const session_ptr& sess);

    void finish_delete(const session_ptr& sess);

    discovery& discovery_;
    rpc::transport_iface& transport_;
    std::string database_;
    pool_settings settings_;
    retry_strategy create_retrier_;
    session_monitor* sm_;

    boost::mutex guard_;
    session_set sessions_;
    builder_map builders_;
    waiter_queue waiters_;
    int new_sessions_requested_;
    int sessions_being_deleted_;
    bool destroyed_;

    boost::signals2::scoped_connection endpoint_removed_conn_;
};

}

#endif // QSESSION_SESSION_POOL_HPP
