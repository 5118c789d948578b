#ifndef QSESSION_DISCOVERY_HPP
#define QSESSION_DISCOVERY_HPP

#include <qsession/endpoint.hpp>

#include <boost/signals2/signal.hpp>
#include <boost/noncopyable.hpp>

namespace qsession {

///
/// \brief Source of endpoints to create sessions on
///
/// Implementations resolve service endpoints and balance load between them. Session pool subscribes to
/// endpoint removal to drop session builders for endpoints that are gone.
///
class discovery : boost::noncopyable
{
public:
    typedef boost::signals2::signal<void(const endpoint&)> endpoint_signal;

    virtual ~discovery() {}

    ///
    /// Return endpoint for the next session, may block while endpoints list is being resolved
    ///
    virtual endpoint get_endpoint() = 0;

    ///
    /// Lower priority of the endpoint after failure to reach it
    ///
    virtual void pessimize(const endpoint& ep) = 0;

    ///
    /// Subscribe to endpoint removal notifications
    ///
    boost::signals2::connection on_endpoint_removed(const endpoint_signal::slot_type& slot)
    {
        return endpoint_removed_.connect(slot);
    }

protected:
    void notify_endpoint_removed(const endpoint& ep)
    {
        endpoint_removed_(ep);
    }

private:
    endpoint_signal endpoint_removed_;
};

}

#endif // QSESSION_DISCOVERY_HPP
