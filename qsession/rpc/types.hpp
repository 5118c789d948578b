#ifndef QSESSION_RPC_TYPES_HPP
#define QSESSION_RPC_TYPES_HPP

#include <qsession/rpc/status.hpp>

#include <boost/optional.hpp>
#include <boost/any.hpp>
#include <boost/chrono/system_clocks.hpp>

#include <string>

namespace qsession { namespace rpc {

///
/// Settings of a transaction that is begun implicitly by the first query or explicitly by begin_transaction
///
struct tx_settings
{
    typedef enum {
        serializable_read_write,
        snapshot_read_only,
        online_read_only,
        stale_read_only
    } mode_type;

    explicit tx_settings(mode_type m = serializable_read_write) : mode(m) {}

    /// Settings used when caller asks for transaction without specifying them
    static tx_settings auto_begin()
    {
        return tx_settings(serializable_read_write);
    }

    friend bool operator==(const tx_settings& s1, const tx_settings& s2)
    {
        return s1.mode == s2.mode;
    }

    mode_type mode;
};

///
/// Transaction control sent along with a query. When tx_id is set query runs inside that transaction,
/// otherwise when begin_tx is set server starts a new transaction and reports its id in the result.
/// When both are empty query is executed without transaction.
///
struct tx_control
{
    tx_control() : commit_tx(false) {}

    boost::optional<std::string> tx_id;
    boost::optional<tx_settings> begin_tx;
    bool commit_tx;
};

struct execute_request
{
    std::string session_id;
    std::string query;
    tx_control tx;
    boost::optional<boost::chrono::steady_clock::time_point> deadline;
};

struct execute_result
{
    status st;
    /// Transaction the query was executed in, if any
    boost::optional<std::string> tx_id;
    /// Undecoded response payload
    boost::any data;
};

struct create_session_result
{
    status st;
    std::string session_id;
};

struct begin_transaction_result
{
    status st;
    std::string tx_id;
};

}} // namespace qsession, rpc

#endif // QSESSION_RPC_TYPES_HPP
