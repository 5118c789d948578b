#ifndef QSESSION_SESSION_HPP
#define QSESSION_SESSION_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/rpc/interfaces.hpp>
#include <qsession/context.hpp>
#include <qsession/endpoint.hpp>

#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/optional.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/atomic.hpp>

#include <string>

namespace qsession {

class session;
class session_monitor;

typedef boost::shared_ptr<session> session_ptr;

///
/// \brief Receiver of session lifecycle signals
///
/// Registered at session creation time, implemented by session_pool.
///
struct session_listener
{
    virtual ~session_listener() {}

    /// Holder has finished using the session
    virtual void session_released(const session_ptr& sess) = 0;

    /// Holder has got bad_session or session_busy error from server, session must not be reused
    virtual void session_broken(const session_ptr& sess) = 0;

    /// Keep-alive stream of the session has ended, may be called from any thread
    virtual void session_stream_closed(const session_ptr& sess) = 0;
};

/// \brief Handle of a single server side session
///
/// Session is created by session_builder and owned by session_pool. The caller that acquired a session
/// is its exclusive user until release(). Lifecycle flags are guarded by the owning pool, per-call state
/// is managed by query_client.
class QSESSION_API session : public boost::enable_shared_from_this<session>, boost::noncopyable
{
public:
    ~session();

    /// Session id assigned by server
    const std::string& id() const
    {
        return id_;
    }

    const endpoint& get_endpoint() const
    {
        return endpoint_;
    }

    /// Execute query within the open transaction, or begin one if transaction settings were given
    /// to query_client::run. Throw remote_error descendant on failure.
    rpc::execute_result execute(const std::string& query);

    /// Begin transaction explicitly. Use transaction class instead for RAII reasons.
    void begin_transaction(const rpc::tx_settings& settings = rpc::tx_settings::auto_begin());

    /// Commit open transaction, do nothing if there is none. Transaction is closed even when commit fails.
    void commit_transaction();

    /// Rollback open transaction, do nothing if there is none. Transaction is closed even when rollback fails.
    void rollback_transaction();

    /// Id of the open transaction
    const boost::optional<std::string>& transaction_id() const
    {
        return tx_id_;
    }

    /// Mark operations of the current call idempotent or not. Ignored if idempotency was given to
    /// query_client::run explicitly.
    void set_idempotent(bool idempotent);

    const boost::optional<bool>& is_idempotent() const
    {
        return call_.idempotent;
    }

    /// Return session to the pool. Don`t use session after this call.
    void release();

    bool is_free() const
    {
        return !state_.busy && !state_.closing && !is_deleted();
    }

    bool is_busy() const
    {
        return state_.busy;
    }

    bool is_closing() const
    {
        return state_.closing;
    }

    bool is_deleted() const
    {
        return state_.deleted || destroyed_;
    }

private:
    friend class session_pool;
    friend class session_builder;
    friend class query_client;
    friend class transaction;

    /// Lifecycle flags, mutated under session_pool mutex. Holder reads them without the lock.
    struct lifecycle
    {
        lifecycle() : busy(false), closing(false), deleted(false) {}

        boost::atomic<bool> busy;
        boost::atomic<bool> closing;
        boost::atomic<bool> deleted;
    };

    /// State stamped on session for the duration of query_client::run attempt
    struct call_state
    {
        call_state() : idempotent_at_do_level(false) {}

        boost::optional<context> ctx;
        boost::optional<rpc::tx_settings> tx_settings;
        boost::optional<bool> idempotent;
        bool idempotent_at_do_level;
    };

    class operation_guard;

    session(
        const rpc::query_service_ptr& service
      , const endpoint& ep
      , const std::string& id
      , session_listener* listener
      , session_monitor* sm
      );

    static void on_stream_closed(const boost::weak_ptr<session>& weak, const rpc::status& st);

    void acquire();
    void attach();
    void destroy();
    void mark_delete_on_release();
    void signal_broken();
    bool try_rollback();
    void reset_call_state();

    rpc::query_service_ptr service_;
    endpoint endpoint_;
    std::string id_;
    session_listener* listener_;
    session_monitor* sm_;

    lifecycle state_;
    call_state call_;
    boost::optional<std::string> tx_id_;

    boost::mutex op_guard_;
    boost::optional<std::string> current_operation_;

    rpc::attach_stream_ptr attached_;
    boost::atomic<bool> destroyed_;
};

}

#endif // QSESSION_SESSION_HPP
