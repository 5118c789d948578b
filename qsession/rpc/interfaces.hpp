#ifndef QSESSION_RPC_INTERFACES_HPP
#define QSESSION_RPC_INTERFACES_HPP

#include <qsession/rpc/types.hpp>
#include <qsession/endpoint.hpp>

#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>

#include <string>

namespace qsession { namespace rpc {

///
/// Long-lived keep-alive stream of a single session
///
struct attach_stream_iface : boost::noncopyable
{
    virtual ~attach_stream_iface() {}

    ///
    /// Terminate the stream. May be called several times, MUST never throw.
    ///
    virtual void cancel() = 0;
};

typedef boost::shared_ptr<attach_stream_iface> attach_stream_ptr;

///
/// Invoked once when the attach stream ends either by server decision or because of network failure.
/// May be invoked from any thread.
///
typedef boost::function<void(const status&)> attach_closed_callback;

struct attach_result
{
    status st;
    attach_stream_ptr stream;
};

///
/// Query service stub bound to a single endpoint. All calls are blocking and thread safe.
/// Failures are reported through status, transport failures use transport_unavailable code.
///
struct query_service_iface : boost::noncopyable
{
    virtual ~query_service_iface() {}

    ///
    /// Create new session on the server
    ///
    virtual create_session_result create_session() = 0;

    ///
    /// Delete session on the server. MUST never throw, failure is reported through status only.
    ///
    virtual status delete_session(const std::string& session_id) = 0;

    ///
    /// Open keep-alive stream for the session. Returns after the server confirmed the session is alive,
    /// \a on_closed is invoked when the stream ends afterwards.
    ///
    virtual attach_result attach_session(const std::string& session_id, const attach_closed_callback& on_closed) = 0;

    virtual begin_transaction_result begin_transaction(const std::string& session_id, const tx_settings& settings) = 0;
    virtual status commit_transaction(const std::string& session_id, const std::string& tx_id) = 0;
    virtual status rollback_transaction(const std::string& session_id, const std::string& tx_id) = 0;

    ///
    /// Execute query. Result payload is passed to the caller as is.
    ///
    virtual execute_result execute_query(const execute_request& req) = 0;
};

typedef boost::shared_ptr<query_service_iface> query_service_ptr;

///
/// Authenticated channel factory. Creates query service stubs for endpoints returned by discovery.
///
struct transport_iface : boost::noncopyable
{
    virtual ~transport_iface() {}

    virtual query_service_ptr connect(const endpoint& ep, const std::string& database) = 0;
};

}} // namespace qsession, rpc

#endif // QSESSION_RPC_INTERFACES_HPP
