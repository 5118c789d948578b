#include <qsession/query_client.hpp>
#include <qsession/session_monitor.hpp>
#include <qsession/errors.hpp>

#include <boost/bind.hpp>

namespace qsession {

query_client::query_client(
    discovery& disc
  , rpc::transport_iface& transport
  , const client_settings& settings
  , session_monitor* sm
  )
  : pool_(disc, transport, settings.database, settings.pool, settings.create_retry, sm)
  , own_retrier_(settings.retry, sm)
  , retrier_(own_retrier_)
  , sm_(sm)
{
}

query_client::query_client(
    discovery& disc
  , rpc::transport_iface& transport
  , const client_settings& settings
  , retry_strategy& retrier
  , session_monitor* sm
  )
  : pool_(disc, transport, settings.database, settings.pool, settings.create_retry, sm)
  , own_retrier_(settings.retry, sm)
  , retrier_(retrier)
  , sm_(sm)
{
}

void query_client::destroy()
{
    pool_.destroy();
}

void query_client::run_impl(const callback& fn, const run_options& opts)
{
    context parent = opts.ctx ? *opts.ctx : context::background();
    context ctx = opts.timeout_ms ? parent.with_timeout(*opts.timeout_ms) : parent.with_cancel();

    retrier_.retry(ctx, boost::bind(&query_client::attempt, this, boost::cref(fn), boost::cref(opts), _1));
}

attempt_result query_client::attempt(const callback& fn, const run_options& opts, const context& ctx)
{
    session_ptr sess;
    try
    {
        sess = pool_.acquire(ctx);
    }
    catch (const qsession_error&)
    {
        return attempt_result(std::current_exception(), opts.idempotent);
    }

    sess->call_.ctx = ctx;
    if (opts.idempotent)
    {
        sess->call_.idempotent_at_do_level = true;
        sess->call_.idempotent = opts.idempotent;
    }

    std::exception_ptr error;
    bool broken = false;
    try
    {
        if (opts.tx_settings)
            sess->call_.tx_settings = opts.tx_settings;

        try
        {
            fn(*sess);
        }
        catch (const bad_session&)
        {
            throw;
        }
        catch (const session_busy&)
        {
            throw;
        }
        catch (...)
        {
            // session is still usable, don`t leave transaction open on it
            if (sess->transaction_id())
                sess->try_rollback();
            throw;
        }

        if (sess->transaction_id())
        {
            if (opts.tx_settings)
                sess->commit_transaction();     // transaction was begun on behalf of the caller
            else
                sess->rollback_transaction();   // caller opened transaction manually and didn`t close it
        }
    }
    catch (const bad_session&)
    {
        error = std::current_exception();
        broken = true;
    }
    catch (const session_busy&)
    {
        error = std::current_exception();
        broken = true;
    }
    catch (...)
    {
        error = std::current_exception();
    }

    boost::optional<bool> idempotent = sess->call_.idempotent;
    sess->reset_call_state();

    if (broken)
        sess->signal_broken();
    else
        sess->release();

    return error ? attempt_result(error, idempotent) : attempt_result();
}

}
