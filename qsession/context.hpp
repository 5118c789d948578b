#ifndef QSESSION_CONTEXT_HPP
#define QSESSION_CONTEXT_HPP

#include <qsession/detail/exports.hpp>

#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>
#include <boost/function.hpp>
#include <boost/chrono/system_clocks.hpp>
#include <boost/signals2/connection.hpp>

namespace qsession {

/// \brief Execution context: optional deadline and cancellation flag
///
/// Context is a cheap copyable handle, all copies share the same state. Derived contexts inherit parent
/// deadline and are cancelled together with the parent, cancelling a derived context doesn`t affect parent.
class QSESSION_API context
{
public:
    typedef boost::chrono::steady_clock clock;
    typedef clock::time_point time_point;

    /// Create root context without deadline
    context();

    /// Same as default constructor, reads better at call sites
    static context background();

    /// Derive context that is cancelled at most \a timeout_ms milliseconds from now
    context with_timeout(int timeout_ms) const;

    /// Derive context that can be cancelled independently of this one
    context with_cancel() const;

    /// Cancel context and all contexts derived from it
    void cancel() const;

    bool is_cancelled() const;

    /// Return true if deadline has passed
    bool is_expired() const;

    /// Return true if context is cancelled or expired
    bool done() const;

    const boost::optional<time_point>& deadline() const;

    /// Throw operation_cancelled or deadline_exceeded if context is done
    void check() const;

    /// Sleep for \a ms milliseconds or until context is done. Return false if interrupted by context.
    bool sleep_for(int ms) const;

    /// Invoke \a slot when context is cancelled. Slot is not invoked when deadline passes.
    boost::signals2::connection on_cancel(const boost::function<void()>& slot) const;

private:
    struct data;

    explicit context(const boost::shared_ptr<data>& d);
    context derive(const boost::optional<time_point>& deadline) const;

    boost::shared_ptr<data> data_;
};

}

#endif // QSESSION_CONTEXT_HPP
