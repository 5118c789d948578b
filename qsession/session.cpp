#include <qsession/session.hpp>
#include <qsession/session_monitor.hpp>
#include <qsession/errors.hpp>

#include <boost/bind.hpp>
#include <boost/chrono/duration.hpp>

namespace qsession {

/// Marks session as having an operation in flight, only one operation is allowed at a time
class session::operation_guard : boost::noncopyable
{
public:
    operation_guard(session& s, const std::string& op) : s_(s)
    {
        boost::mutex::scoped_lock g(s_.op_guard_);
        if (s_.current_operation_)
            throw invalid_session_state(op.c_str(), "operation '" + *s_.current_operation_ 
                + "' is in progress on session " + s_.id_);

        s_.current_operation_ = op;
    }

    ~operation_guard()
    {
        boost::mutex::scoped_lock g(s_.op_guard_);
        s_.current_operation_ = boost::none;
    }

private:
    session& s_;
};

session::session(
    const rpc::query_service_ptr& service
  , const endpoint& ep
  , const std::string& id
  , session_listener* listener
  , session_monitor* sm
  )
  : service_(service)
  , endpoint_(ep)
  , id_(id)
  , listener_(listener)
  , sm_(sm)
  , destroyed_(false)
{
}

session::~session()
{
    // stream callback holds only weak reference, but the stream itself must not outlive the session
    if (attached_)
        attached_->cancel();
}

rpc::execute_result session::execute(const std::string& query)
{
    if (is_deleted())
        throw invalid_session_state("execute", "session " + id_ + " is deleted");

    operation_guard og(*this, query);

    if (call_.ctx)
        call_.ctx->check();

    rpc::execute_request req;
    req.session_id = id_;
    req.query = query;
    if (tx_id_)
        req.tx.tx_id = tx_id_;
    else if (call_.tx_settings)
        req.tx.begin_tx = call_.tx_settings;
    if (call_.ctx)
        req.deadline = call_.ctx->deadline();

    boost::chrono::steady_clock::time_point start = boost::chrono::steady_clock::now();
    rpc::execute_result res = service_->execute_query(req);
    boost::chrono::duration<double> took = boost::chrono::steady_clock::now() - start;

    if (sm_)
        sm_->query_executed(query, res.st.ok(), took.count());

    rpc::throw_on_error(res.st, "execute_query");

    if (res.tx_id && !tx_id_)
    {
        tx_id_ = res.tx_id;
        if (sm_)
            sm_->transaction_started();
    }

    return res;
}

void session::begin_transaction(const rpc::tx_settings& settings)
{
    if (is_deleted())
        throw invalid_session_state("begin_transaction", "session " + id_ + " is deleted");

    if (tx_id_)
        throw invalid_session_state("begin_transaction", "transaction " + *tx_id_ + " is already open");

    operation_guard og(*this, "begin_transaction");

    if (call_.ctx)
        call_.ctx->check();

    rpc::begin_transaction_result res = service_->begin_transaction(id_, settings);
    rpc::throw_on_error(res.st, "begin_transaction");

    tx_id_ = res.tx_id;
    if (sm_)
        sm_->transaction_started();
}

void session::commit_transaction()
{
    if (!tx_id_)
        return;

    operation_guard og(*this, "commit_transaction");

    std::string tx_id = *tx_id_;
    tx_id_ = boost::none;

    if (is_deleted())
        throw invalid_session_state("commit_transaction", "session " + id_ + " is deleted");

    rpc::throw_on_error(service_->commit_transaction(id_, tx_id), "commit_transaction");

    if (sm_)
        sm_->transaction_committed();
}

void session::rollback_transaction()
{
    if (!tx_id_)
        return;

    operation_guard og(*this, "rollback_transaction");

    std::string tx_id = *tx_id_;
    tx_id_ = boost::none;

    if (is_deleted())
        throw invalid_session_state("rollback_transaction", "session " + id_ + " is deleted");

    rpc::throw_on_error(service_->rollback_transaction(id_, tx_id), "rollback_transaction");

    if (sm_)
        sm_->transaction_reverted();
}

bool session::try_rollback()
{
    try
    {
        rollback_transaction();
        return true;
    }
    catch (const std::exception& e)
    {
        if (sm_)
            sm_->transaction_rollback_failed(e.what());
        return false;
    }
}

void session::set_idempotent(bool idempotent)
{
    if (!call_.idempotent_at_do_level)
        call_.idempotent = idempotent;
}

void session::release()
{
    if (listener_)
    {
        listener_->session_released(shared_from_this());
        return;
    }

    if (!state_.busy)
        throw invalid_session_state("release", "session " + id_ + " is not acquired");

    state_.busy = false;
    if (state_.closing)
        destroy();
}

void session::acquire()
{
    if (!is_free())
        throw invalid_session_state("acquire", "session " + id_ + " is not free");

    state_.busy = true;
}

void session::attach()
{
    rpc::attach_result res = service_->attach_session(id_, 
        boost::bind(&session::on_stream_closed, boost::weak_ptr<session>(shared_from_this()), _1));
    rpc::throw_on_error(res.st, "attach_session");

    attached_ = res.stream;
}

void session::on_stream_closed(const boost::weak_ptr<session>& weak, const rpc::status&)
{
    session_ptr sess = weak.lock();
    if (!sess)
        return;

    if (sess->listener_)
        sess->listener_->session_stream_closed(sess);
    else
        sess->mark_delete_on_release();
}

void session::mark_delete_on_release()
{
    state_.closing = true;
}

void session::signal_broken()
{
    if (listener_)
        listener_->session_broken(shared_from_this());
    else
        destroy();
}

void session::destroy()
{
    // transaction id belongs to the holder, it may still be using the session
    if (destroyed_.exchange(true))
        return;

    if (attached_)
        attached_->cancel();

    rpc::status st = service_->delete_session(id_);
    if (!st.ok() && sm_)
        sm_->session_delete_failed(id_, rpc::status_name(st.code));
}

void session::reset_call_state()
{
    call_ = call_state();

    boost::mutex::scoped_lock g(op_guard_);
    current_operation_ = boost::none;
}

}
