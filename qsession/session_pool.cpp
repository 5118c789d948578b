#include <qsession/session_pool.hpp>
#include <qsession/session_monitor.hpp>
#include <qsession/discovery.hpp>
#include <qsession/errors.hpp>

#include <boost/bind.hpp>
#include <boost/foreach.hpp>
#include <boost/thread/thread.hpp>

#include <algorithm>
#include <vector>

namespace qsession {

session_pool::session_pool(
    discovery& disc
  , rpc::transport_iface& transport
  , const std::string& database
  , const pool_settings& settings
  , const retry_parameters& create_retry
  , session_monitor* sm
  )
  : discovery_(disc)
  , transport_(transport)
  , database_(database)
  , settings_(settings)
  , create_retrier_(create_retry, sm)
  , sm_(sm)
  , new_sessions_requested_(0)
  , sessions_being_deleted_(0)
  , destroyed_(false)
{
    settings_.validate();

    endpoint_removed_conn_ = discovery_.on_endpoint_removed(
        boost::bind(&session_pool::remove_session_builder, this, _1)
        );
}

session_pool::~session_pool()
{
    endpoint_removed_conn_.disconnect();
    destroy();
}

session_ptr session_pool::acquire(int timeout_ms)
{
    return acquire(context::background(), timeout_ms);
}

session_ptr session_pool::acquire(const context& ctx, int timeout_ms)
{
    ctx.check();

    detail::waiter_ptr w;
    {
        boost::mutex::scoped_lock g(guard_);

        if (destroyed_)
            throw invalid_session_state("acquire", "session pool is destroyed");

        if (session_ptr sess = find_free_locked())  // take session from pool
        {
            sess->acquire();
            return sess;
        }
        else if (admission_allowed_locked())        // we can create new session
        {
            ++new_sessions_requested_;
        }
        else                                        // we must wait until someone will free session for us
        {
            w.reset(new detail::waiter);
            waiters_.push_back(w);
        }
    }

    if (!w)
        return create_busy_session(ctx);

    return wait_for_session(w, ctx, timeout_ms);
}

void session_pool::destroy()
{
    std::vector<session_ptr> victims;
    std::vector<detail::waiter_ptr> pending;
    {
        boost::mutex::scoped_lock g(guard_);

        destroyed_ = true;
        BOOST_FOREACH(const session_ptr& sess, sessions_)
        {
            if (sess->state_.deleted)
                continue;

            begin_delete_locked(sess);
            victims.push_back(sess);
        }

        pending.assign(waiters_.begin(), waiters_.end());
    }

    BOOST_FOREACH(const detail::waiter_ptr& w, pending)
        w->interrupt();

    boost::thread_group tg;
    BOOST_FOREACH(const session_ptr& sess, victims)
        tg.create_thread(boost::bind(&session_pool::finish_delete, this, sess));

    tg.join_all();

    if (sm_)
        sm_->pool_destroyed(victims.size());
}

pool_stats session_pool::stats()
{
    boost::mutex::scoped_lock g(guard_);

    pool_stats st;
    st.live = sessions_.size();
    BOOST_FOREACH(const session_ptr& sess, sessions_)
    {
        if (sess->is_free())
            ++st.free;
    }
    st.waiting = waiters_.size();
    st.being_created = new_sessions_requested_;
    st.being_deleted = sessions_being_deleted_;
    return st;
}

void session_pool::session_released(const session_ptr& sess)
{
    boost::mutex::scoped_lock g(guard_);

    if (!sess->state_.busy)
        throw invalid_session_state("release", "session " + sess->id() + " is not acquired");

    if (sess->state_.deleted)
    {
        sess->state_.busy = false;
        return;
    }

    if (sess->state_.closing || destroyed_)
    {
        begin_delete_locked(sess);
        g.unlock();
        finish_delete(sess);
        return;
    }

    offer_locked(sess);
}

void session_pool::session_broken(const session_ptr& sess)
{
    boost::mutex::scoped_lock g(guard_);

    if (sess->state_.deleted)
        return;

    begin_delete_locked(sess);
    g.unlock();

    if (sm_)
        sm_->session_broken(sess->id());

    finish_delete(sess);
}

void session_pool::session_stream_closed(const session_ptr& sess)
{
    boost::mutex::scoped_lock g(guard_);

    if (sess->state_.deleted)
        return;

    // session is in use or still being created, its holder will trigger deletion on release
    if (sess->state_.busy || !sessions_.count(sess))
    {
        sess->mark_delete_on_release();
        return;
    }

    begin_delete_locked(sess);
    g.unlock();
    finish_delete(sess);
}

session_builder_ptr session_pool::get_session_builder()
{
    endpoint ep = discovery_.get_endpoint();
    {
        boost::mutex::scoped_lock g(guard_);
        builder_map::iterator it = builders_.find(ep);
        if (it != builders_.end())
            return it->second;
    }

    session_builder_ptr builder(
        new session_builder(ep, transport_.connect(ep, database_), discovery_, create_retrier_, sm_)
        );

    boost::mutex::scoped_lock g(guard_);
    return builders_.insert(std::make_pair(ep, builder)).first->second;
}

void session_pool::remove_session_builder(const endpoint& ep)
{
    boost::mutex::scoped_lock g(guard_);
    builders_.erase(ep);
}

session_ptr session_pool::create_session(const context& ctx)
{
    return get_session_builder()->create(ctx, this);
}

session_ptr session_pool::create_busy_session(const context& ctx)
{
    session_ptr sess;
    try
    {
        sess = create_session(ctx);
    }
    catch (...)
    {
        boost::mutex::scoped_lock g(guard_);
        --new_sessions_requested_;

        // the failed slot may be the only thing a waiter was queued behind
        serve_waiter_locked();
        throw;
    }

    boost::mutex::scoped_lock g(guard_);
    --new_sessions_requested_;
    sessions_.insert(sess);

    // session may be already closing if its stream ended during creation, it is deleted on release then
    sess->state_.busy = true;

    if (destroyed_)
    {
        begin_delete_locked(sess);
        g.unlock();
        finish_delete(sess);
        throw invalid_session_state("acquire", "session pool is destroyed");
    }

    return sess;
}

session_ptr session_pool::wait_for_session(const detail::waiter_ptr& w, const context& ctx, int timeout_ms)
{
    boost::optional<detail::waiter::time_point> deadline = ctx.deadline();
    bool pool_timeout = false;
    if (timeout_ms > 0)
    {
        detail::waiter::time_point tp = context::clock::now() + boost::chrono::milliseconds(timeout_ms);
        if (!deadline || tp <= *deadline)
        {
            deadline = tp;
            pool_timeout = true;
        }
    }

    boost::signals2::scoped_connection cancel_conn(ctx.on_cancel(boost::bind(&detail::waiter::interrupt, w)));
    if (ctx.is_cancelled())
        w->interrupt();

    if (session_ptr sess = w->wait(deadline))
        return sess;

    // admission slot was reserved for us
    if (w->is_granted())
        return create_busy_session(ctx);

    bool destroyed = false;
    {
        boost::mutex::scoped_lock g(guard_);

        // session or admission slot could be handed over right after wait ended
        if (!w->cancel())
        {
            if (session_ptr sess = w->get())
                return sess;

            g.unlock();
            return create_busy_session(ctx);
        }

        waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), w), waiters_.end());
        destroyed = destroyed_;
    }

    if (destroyed)
        throw invalid_session_state("acquire", "session pool is destroyed");

    if (ctx.is_cancelled())
        throw operation_cancelled();

    if (pool_timeout)
    {
        if (sm_)
            sm_->waiter_timed_out(timeout_ms);
        throw session_pool_empty(timeout_ms);
    }

    throw deadline_exceeded();
}

bool session_pool::admission_allowed_locked() const
{
    int effective_size = static_cast<int>(sessions_.size()) + new_sessions_requested_ - sessions_being_deleted_;
    return effective_size < settings_.max_limit;
}

session_ptr session_pool::find_free_locked() const
{
    BOOST_FOREACH(const session_ptr& sess, sessions_)
    {
        if (sess->is_free())
            return sess;
    }

    return session_ptr();
}

bool session_pool::fulfill_waiter_locked(const session_ptr& sess)
{
    while (!waiters_.empty())
    {
        detail::waiter_ptr w = waiters_.front();
        waiters_.pop_front();

        if (w->fulfill(sess))
            return true;
    }

    return false;
}

void session_pool::offer_locked(const session_ptr& sess)
{
    // hand busy session directly to the longest waiting caller, so that no newcomer can steal it
    if (!fulfill_waiter_locked(sess))
        sess->state_.busy = false;
}

bool session_pool::grant_waiter_locked()
{
    while (!waiters_.empty())
    {
        detail::waiter_ptr w = waiters_.front();
        waiters_.pop_front();

        if (w->grant())
        {
            ++new_sessions_requested_;
            return true;
        }
    }

    return false;
}

void session_pool::serve_waiter_locked()
{
    if (destroyed_ || waiters_.empty())
        return;

    if (session_ptr free_sess = find_free_locked())
    {
        free_sess->state_.busy = true;
        offer_locked(free_sess);
        return;
    }

    // otherwise the waiter keeps waiting for the next release
    if (admission_allowed_locked())
        grant_waiter_locked();
}

void session_pool::begin_delete_locked(const session_ptr& sess)
{
    // busy flag stays, holder still has to release the session
    sess->state_.deleted = true;
    ++sessions_being_deleted_;

    // deleted session never feeds a waiter, give it another one
    serve_waiter_locked();
}

void session_pool::finish_delete(const session_ptr& sess)
{
    sess->destroy();

    {
        boost::mutex::scoped_lock g(guard_);
        sessions_.erase(sess);
        --sessions_being_deleted_;
    }

    if (sm_)
        sm_->session_deleted(sess->id());
}

}
