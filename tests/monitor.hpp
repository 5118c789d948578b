#pragma once

#include <qsession/session_monitor.hpp>

#include <boost/test/unit_test_log.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/foreach.hpp>

#include <map>
#include <sstream>
#include <string>
#include <vector>

///
/// Session monitor that records events. Hooks are called from worker threads, so events are only
/// collected there and printed with dump() from the test thread.
///
struct monitor : qsession::session_monitor
{
    virtual void session_created(const std::string& session_id, const qsession::endpoint& ep)
    {
        std::ostringstream ss;
        ss << "created " << session_id << " on " << ep;
        record("session_created", ss.str());
    }

    virtual void session_create_failed(const char* what)
    {
        record("session_create_failed", what);
    }

    virtual void session_deleted(const std::string& session_id)
    {
        record("session_deleted", "deleted " + session_id);
    }

    virtual void session_delete_failed(const std::string& session_id, const char* what)
    {
        record("session_delete_failed", "delete of " + session_id + " failed: " + what);
    }

    virtual void session_broken(const std::string& session_id)
    {
        record("session_broken", "broken " + session_id);
    }

    virtual void query_executed(const std::string& query, bool ok, double execution_time)
    {
        std::ostringstream ss;
        ss << "query: " << query;
        if (ok)
            ss << " took " << execution_time << " sec";
        else
            ss << " FAILED";
        record("query_executed", ss.str());
    }

    virtual void transaction_started()
    {
        record("transaction_started", "Transaction started");
    }

    virtual void transaction_committed()
    {
        record("transaction_committed", "Transaction committed");
    }

    virtual void transaction_reverted()
    {
        record("transaction_reverted", "Transaction reverted");
    }

    virtual void transaction_rollback_failed(const char* what)
    {
        record("transaction_rollback_failed", std::string("Rollback failed: ") + what);
    }

    virtual void waiter_timed_out(int timeout_ms)
    {
        std::ostringstream ss;
        ss << "waiter timed out after " << timeout_ms << " ms";
        record("waiter_timed_out", ss.str());
    }

    virtual void attempt_failed(int attempt, const char* what, bool will_retry)
    {
        std::ostringstream ss;
        ss << "attempt " << attempt << " failed: " << what << (will_retry ? ", retrying" : ", giving up");
        record("attempt_failed", ss.str());
    }

    virtual void pool_destroyed(std::size_t sessions_deleted)
    {
        std::ostringstream ss;
        ss << "pool destroyed, " << sessions_deleted << " sessions deleted";
        record("pool_destroyed", ss.str());
    }

    int count(const std::string& hook)
    {
        boost::mutex::scoped_lock g(guard_);
        return counters_[hook];
    }

    void dump()
    {
        std::vector<std::string> events;
        {
            boost::mutex::scoped_lock g(guard_);
            events.swap(events_);
        }

        BOOST_FOREACH(const std::string& e, events)
            BOOST_TEST_MESSAGE("[SessionMonitor] " << e);
    }

private:
    void record(const std::string& hook, const std::string& message)
    {
        boost::mutex::scoped_lock g(guard_);
        ++counters_[hook];
        events_.push_back(message);
    }

    boost::mutex guard_;
    std::map<std::string, int> counters_;
    std::vector<std::string> events_;
};
