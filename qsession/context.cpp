#include <qsession/context.hpp>
#include <qsession/errors.hpp>

#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/signals2/signal.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/bind.hpp>

namespace qsession {

struct context::data
{
    data() : cancelled_(false) {}

    static void cancel_weak(const boost::weak_ptr<data>& weak)
    {
        if (boost::shared_ptr<data> d = weak.lock())
            d->cancel();
    }

    void cancel()
    {
        {
            boost::mutex::scoped_lock g(guard_);
            if (cancelled_)
                return;
            cancelled_ = true;
        }
        cv_.notify_all();
        cancelled_signal_();
    }

    boost::mutex guard_;
    boost::condition_variable cv_;
    bool cancelled_;
    boost::optional<time_point> deadline_;
    boost::signals2::signal<void()> cancelled_signal_;
    boost::signals2::scoped_connection parent_conn_;
};

context::context() : data_(new data)
{
}

context::context(const boost::shared_ptr<data>& d) : data_(d)
{
}

context context::background()
{
    return context();
}

context context::with_timeout(int timeout_ms) const
{
    time_point tp = clock::now() + boost::chrono::milliseconds(timeout_ms);
    if (data_->deadline_ && *data_->deadline_ < tp)
        tp = *data_->deadline_;

    return derive(tp);
}

context context::with_cancel() const
{
    return derive(data_->deadline_);
}

context context::derive(const boost::optional<time_point>& deadline) const
{
    boost::shared_ptr<data> child(new data);
    child->deadline_ = deadline;
    child->parent_conn_ = data_->cancelled_signal_.connect(
        boost::bind(&data::cancel_weak, boost::weak_ptr<data>(child))
        );

    // parent could be cancelled before connection was established
    if (is_cancelled())
        child->cancel();

    return context(child);
}

void context::cancel() const
{
    data_->cancel();
}

bool context::is_cancelled() const
{
    boost::mutex::scoped_lock g(data_->guard_);
    return data_->cancelled_;
}

bool context::is_expired() const
{
    return data_->deadline_ && clock::now() >= *data_->deadline_;
}

bool context::done() const
{
    return is_cancelled() || is_expired();
}

const boost::optional<context::time_point>& context::deadline() const
{
    return data_->deadline_;
}

void context::check() const
{
    if (is_cancelled())
        throw operation_cancelled();
    if (is_expired())
        throw deadline_exceeded();
}

bool context::sleep_for(int ms) const
{
    time_point until = clock::now() + boost::chrono::milliseconds(ms);
    bool full_sleep = true;
    if (data_->deadline_ && *data_->deadline_ < until)
    {
        until = *data_->deadline_;
        full_sleep = false;
    }

    boost::mutex::scoped_lock g(data_->guard_);
    while (!data_->cancelled_)
    {
        if (data_->cv_.wait_until(g, until) == boost::cv_status::timeout)
            return full_sleep && !data_->cancelled_;
    }

    return false;
}

boost::signals2::connection context::on_cancel(const boost::function<void()>& slot) const
{
    return data_->cancelled_signal_.connect(slot);
}

}
