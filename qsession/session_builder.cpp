#include <qsession/session_builder.hpp>
#include <qsession/session_monitor.hpp>
#include <qsession/discovery.hpp>
#include <qsession/errors.hpp>

#include <boost/bind.hpp>

namespace qsession {

session_builder::session_builder(
    const endpoint& ep
  , const rpc::query_service_ptr& service
  , discovery& disc
  , retry_strategy& retrier
  , session_monitor* sm
  )
  : endpoint_(ep)
  , service_(service)
  , discovery_(disc)
  , retrier_(retrier)
  , sm_(sm)
{
}

session_ptr session_builder::create(const context& ctx, session_listener* listener)
{
    session_ptr result;
    retrier_.retry(ctx, boost::bind(&session_builder::create_attempt, this, listener, boost::ref(result)));
    return result;
}

attempt_result session_builder::create_attempt(session_listener* listener, session_ptr& result)
{
    try
    {
        rpc::create_session_result res = service_->create_session();
        rpc::throw_on_error(res.st, "create_session");

        session_ptr sess(new session(service_, endpoint_, res.session_id, listener, sm_));
        try
        {
            sess->attach();
        }
        catch (const qsession_error&)
        {
            // server side session exists already, don`t leak it
            sess->destroy();
            throw;
        }

        if (sm_)
            sm_->session_created(sess->id(), endpoint_);

        result = sess;
        return attempt_result();
    }
    catch (const transport_error& e)
    {
        discovery_.pessimize(endpoint_);
        if (sm_)
            sm_->session_create_failed(e.what());
        return attempt_result(std::current_exception(), true);
    }
    catch (const qsession_error& e)
    {
        if (sm_)
            sm_->session_create_failed(e.what());
        return attempt_result(std::current_exception(), true);
    }
}

}
