#include <qsession/rpc/status.hpp>
#include <qsession/errors.hpp>

#include <ostream>

namespace qsession { namespace rpc {

const char* status_name(status_code code)
{
    switch (code)
    {
    case success:               return "success";
    case bad_request:           return "bad_request";
    case unauthorized:          return "unauthorized";
    case internal_error:        return "internal_error";
    case aborted:               return "aborted";
    case unavailable:           return "unavailable";
    case overloaded:            return "overloaded";
    case scheme_error:          return "scheme_error";
    case generic_error:         return "generic_error";
    case timeout:               return "timeout";
    case bad_session:           return "bad_session";
    case precondition_failed:   return "precondition_failed";
    case not_found:             return "not_found";
    case session_expired:       return "session_expired";
    case cancelled:             return "cancelled";
    case undetermined:          return "undetermined";
    case unsupported:           return "unsupported";
    case session_busy:          return "session_busy";
    case transport_unavailable: return "transport_unavailable";
    }

    return "unknown_status";
}

std::ostream& operator<<(std::ostream& os, const status& st)
{
    os << status_name(st.code);
    if (!st.message.empty())
        os << ": " << st.message;
    return os;
}

void throw_on_error(const status& st, const char* call)
{
    switch (st.code)
    {
    case success:
        return;
    case bad_session:
        throw qsession::bad_session(st, call);
    case session_busy:
        throw qsession::session_busy(st, call);
    case session_expired:
        throw qsession::session_expired(st, call);
    case aborted:
        throw qsession::aborted(st, call);
    case unavailable:
        throw qsession::unavailable(st, call);
    case overloaded:
        throw qsession::overloaded(st, call);
    case undetermined:
        throw qsession::undetermined(st, call);
    case timeout:
        throw qsession::remote_timeout(st, call);
    case transport_unavailable:
        throw qsession::transport_error(st, call);
    default:
        throw remote_error(st, call);
    }
}

}} // namespace qsession, rpc
