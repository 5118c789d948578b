#ifndef QSESSION_ERRORS_HPP
#define QSESSION_ERRORS_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/rpc/status.hpp>

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <string>

namespace qsession {

/// \brief This is the base error of all errors thrown by qsession.
class QSESSION_API qsession_error : public std::runtime_error
{
public:
    /// Create a qsession_error with error message \a v
    qsession_error(std::string const &v) : std::runtime_error(v) {}
};

/// \brief Some required part in connection string was ommited or has invalid value
class QSESSION_API invalid_connection_string : public qsession_error
{
public:
    invalid_connection_string(std::string const &v) : qsession_error(v) {}
};

/// \brief Operation is not allowed in the current session or pool state
class QSESSION_API invalid_session_state : public qsession_error
{
public:
    invalid_session_state(const char* method, const std::string& reason)
      : qsession_error(std::string("qsession::invalid_session_state ") + method + ": " + reason)
    {
    }
};

/// \brief No session became available within acquire timeout
class QSESSION_API session_pool_empty : public qsession_error
{
public:
    session_pool_empty(int timeout_ms)
      : qsession_error("qsession::session_pool_empty no session became available within timeout of " 
            + boost::lexical_cast<std::string>(timeout_ms) + " ms")
    {
    }
};

/// \brief Execution context was cancelled
class QSESSION_API operation_cancelled : public qsession_error
{
public:
    operation_cancelled() : qsession_error("qsession::operation_cancelled context was cancelled")
    {
    }
};

/// \brief Execution context deadline has passed
class QSESSION_API deadline_exceeded : public qsession_error
{
public:
    deadline_exceeded() : qsession_error("qsession::deadline_exceeded context deadline exceeded")
    {
    }
};

/// \brief Base for errors reported by the remote query service
class QSESSION_API remote_error : public qsession_error
{
public:
    remote_error(const rpc::status& st, const char* call)
      : qsession_error(std::string("qsession::") + rpc::status_name(st.code) + " " + call 
            + (st.message.empty() ? std::string() : ": " + st.message))
      , code_(st.code)
    {
    }

    /// Status code returned by the server
    rpc::status_code code() const
    {
        return code_;
    }

private:
    rpc::status_code code_;
};

/// \brief Server doesn`t know the session anymore, session must be discarded
class QSESSION_API bad_session : public remote_error
{
public:
    bad_session(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

/// \brief Server considers the session to be in the middle of another operation
class QSESSION_API session_busy : public remote_error
{
public:
    session_busy(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

class QSESSION_API session_expired : public remote_error
{
public:
    session_expired(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

/// \brief Transaction was aborted by the server, usually because of lock invalidation
class QSESSION_API aborted : public remote_error
{
public:
    aborted(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

class QSESSION_API unavailable : public remote_error
{
public:
    unavailable(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

class QSESSION_API overloaded : public remote_error
{
public:
    overloaded(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

/// \brief Outcome of the operation is unknown, it may or may not have been applied
class QSESSION_API undetermined : public remote_error
{
public:
    undetermined(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

class QSESSION_API remote_timeout : public remote_error
{
public:
    remote_timeout(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

/// \brief Call could not be delivered to the endpoint
class QSESSION_API transport_error : public remote_error
{
public:
    transport_error(const rpc::status& st, const char* call) : remote_error(st, call) {}
};

}

#endif // QSESSION_ERRORS_HPP
