#ifndef QSESSION_RPC_STATUS_HPP
#define QSESSION_RPC_STATUS_HPP

#include <qsession/detail/exports.hpp>

#include <string>
#include <iosfwd>

namespace qsession { namespace rpc {

///
/// Operation status reported by the query service or by the transport delivering the call
///
enum status_code
{
    success,
    bad_request,
    unauthorized,
    internal_error,
    aborted,
    unavailable,
    overloaded,
    scheme_error,
    generic_error,
    timeout,
    bad_session,
    precondition_failed,
    not_found,
    session_expired,
    cancelled,
    undetermined,
    unsupported,
    session_busy,
    transport_unavailable   ///< the call never reached the server
};

struct QSESSION_API status
{
    status() : code(success) {}
    status(status_code c, const std::string& msg = std::string()) : code(c), message(msg) {}

    bool ok() const
    {
        return code == success;
    }

    status_code code;
    std::string message;
};

QSESSION_API const char* status_name(status_code code);

QSESSION_API std::ostream& operator<<(std::ostream& os, const status& st);

///
/// Throw exception from qsession/errors.hpp matching the \a st code, do nothing if status is ok.
/// \a call is the name of the failed operation and becomes a part of the message
///
QSESSION_API void throw_on_error(const status& st, const char* call);

}} // namespace qsession, rpc

#endif // QSESSION_RPC_STATUS_HPP
