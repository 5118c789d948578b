#ifndef QSESSION_QUERY_CLIENT_HPP
#define QSESSION_QUERY_CLIENT_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/session_pool.hpp>
#include <qsession/retry_strategy.hpp>
#include <qsession/settings.hpp>
#include <qsession/context.hpp>

#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <boost/utility/result_of.hpp>
#include <boost/ref.hpp>
#include <boost/noncopyable.hpp>

namespace qsession {

class discovery;
class session_monitor;

/// \brief Options of query_client::run
struct run_options
{
    /// Parent context, background context is used when empty
    boost::optional<context> ctx;

    /// When set, first query of the callback begins transaction with these settings and the transaction
    /// is committed after the callback returns
    boost::optional<rpc::tx_settings> tx_settings;

    /// Bound of the whole call including retries
    boost::optional<int> timeout_ms;

    /// Caller`s assertion that the callback may be safely retried on a fresh session
    boost::optional<bool> idempotent;
};

namespace detail {
    template<typename Result, typename Fn> struct run_invoker;
}

/// \brief Executes user callbacks against pooled sessions with retries and transaction management
///
/// \code
/// int rows = client.run_tx(count_rows());      // count_rows::operator()(session&) returns int
/// \endcode
///
/// Open transaction is never left on a session: it is committed after successful callback when
/// transaction settings were given, and rolled back otherwise or on failure.
class QSESSION_API query_client : boost::noncopyable
{
public:
    query_client(
        discovery& disc
      , rpc::transport_iface& transport
      , const client_settings& settings
      , session_monitor* sm = 0
      );

    ///
    /// Same as above but retries are driven by externally supplied strategy. \a retrier must outlive the client.
    ///
    query_client(
        discovery& disc
      , rpc::transport_iface& transport
      , const client_settings& settings
      , retry_strategy& retrier
      , session_monitor* sm = 0
      );

    ///
    /// Run \a fn with acquired session inside retry loop and return its result.
    /// \a fn signature is R(session&), R may be void.
    ///
    template<typename Fn>
    typename boost::result_of<Fn(session&)>::type run(Fn fn, const run_options& opts = run_options());

    ///
    /// Same as run but transaction settings default to serializable read-write, so that the whole callback
    /// is executed in a single transaction
    ///
    template<typename Fn>
    typename boost::result_of<Fn(session&)>::type run_tx(Fn fn, const run_options& opts = run_options());

    /// Delete all pooled sessions
    void destroy();

    session_pool& pool()
    {
        return pool_;
    }

private:
    template<typename Result, typename Fn> friend struct detail::run_invoker;

    typedef boost::function<void(session&)> callback;

    void run_impl(const callback& fn, const run_options& opts);
    attempt_result attempt(const callback& fn, const run_options& opts, const context& ctx);

    session_pool pool_;
    retry_strategy own_retrier_;
    retry_strategy& retrier_;
    session_monitor* sm_;
};

/// \cond INTERNAL
namespace detail {

template<typename Result, typename Fn>
struct run_invoker
{
    struct keeper
    {
        keeper(Fn& fn, boost::optional<Result>& res) : fn_(fn), res_(res) {}

        void operator()(session& sess)
        {
            res_ = fn_(sess);
        }

        Fn& fn_;
        boost::optional<Result>& res_;
    };

    static Result run(query_client& client, Fn& fn, const run_options& opts)
    {
        boost::optional<Result> res;
        client.run_impl(keeper(fn, res), opts);
        return *res;
    }
};

template<typename Fn>
struct run_invoker<void, Fn>
{
    static void run(query_client& client, Fn& fn, const run_options& opts)
    {
        client.run_impl(boost::ref(fn), opts);
    }
};

}
/// \endcond

template<typename Fn>
typename boost::result_of<Fn(session&)>::type query_client::run(Fn fn, const run_options& opts)
{
    typedef typename boost::result_of<Fn(session&)>::type result_type;
    return detail::run_invoker<result_type, Fn>::run(*this, fn, opts);
}

template<typename Fn>
typename boost::result_of<Fn(session&)>::type query_client::run_tx(Fn fn, const run_options& opts)
{
    run_options tx_opts = opts;
    if (!tx_opts.tx_settings)
        tx_opts.tx_settings = rpc::tx_settings::auto_begin();

    return run(fn, tx_opts);
}

}

#endif // QSESSION_QUERY_CLIENT_HPP
