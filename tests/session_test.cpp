#include "monitor.hpp"
#include "fake_service.hpp"

#include <qsession/session_builder.hpp>
#include <qsession/transaction.hpp>
#include <qsession/errors.hpp>

#include <boost/make_shared.hpp>
#include <boost/ref.hpp>

#include <boost/test/unit_test.hpp>

using namespace qsession;

namespace {

retry_parameters create_retries(int max_retries)
{
    retry_parameters rp;
    rp.max_retries = max_retries;
    rp.backoff_slot_ms = 1;
    rp.idempotent = true;
    return rp;
}

struct session_fixture
{
    session_fixture()
      : svc(boost::make_shared<fake::query_service>())
      , retrier(create_retries(3), &m)
      , builder(disc.first(), svc, disc, retrier, &m)
    {
    }

    ~session_fixture()
    {
        m.dump();
    }

    session_ptr create()
    {
        return builder.create(context::background(), 0);
    }

    monitor m;
    fake::discovery disc;
    fake::query_service_ptr svc;
    retry_strategy retrier;
    session_builder builder;
};

/// Calls execute on the same session from inside of the running execute
struct nested_execute
{
    nested_execute() : s(0), armed(true), rejected(false) {}

    void operator()()
    {
        if (!armed)
            return;

        armed = false;
        try
        {
            s->execute("SELECT 2");
        }
        catch (const invalid_session_state&)
        {
            rejected = true;
        }
    }

    session* s;
    bool armed;
    bool rejected;
};

}

BOOST_FIXTURE_TEST_CASE(SessionBuilderCreatesAttachedSession, session_fixture)
{
    session_ptr sess = create();

    BOOST_CHECK_EQUAL(sess->id(), "session-1");
    BOOST_CHECK(sess->get_endpoint() == disc.first());
    BOOST_CHECK(sess->is_free());
    BOOST_CHECK(!sess->transaction_id());
    BOOST_CHECK_EQUAL(svc->count(svc->attaches), 1);
    BOOST_CHECK_EQUAL(m.count("session_created"), 1);
}

BOOST_FIXTURE_TEST_CASE(SessionBuilderDeletesSessionWhenAttachFails, session_fixture)
{
    svc->fail_next_attach(rpc::unavailable);

    session_ptr sess = create();

    BOOST_CHECK_EQUAL(sess->id(), "session-2");
    BOOST_CHECK_EQUAL(svc->count(svc->creates), 2);
    BOOST_REQUIRE_EQUAL(svc->deleted_ids().size(), 1u);
    BOOST_CHECK_EQUAL(svc->deleted_ids()[0], "session-1");
    BOOST_CHECK_EQUAL(m.count("session_create_failed"), 1);
}

BOOST_FIXTURE_TEST_CASE(SessionBuilderPessimizesUnreachableEndpoint, session_fixture)
{
    svc->fail_next_create(rpc::transport_unavailable);

    session_ptr sess = create();

    BOOST_REQUIRE_EQUAL(disc.pessimized().size(), 1u);
    BOOST_CHECK(disc.pessimized()[0] == disc.first());

    // other failures don`t
    svc->fail_next_create(rpc::overloaded);
    create();
    BOOST_CHECK_EQUAL(disc.pessimized().size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(SessionBuilderGivesUp, session_fixture)
{
    for (int i = 0; i < 4; ++i)
        svc->fail_next_create(rpc::unavailable);

    BOOST_CHECK_THROW(create(), unavailable);
    BOOST_CHECK_EQUAL(m.count("session_create_failed"), 4);

    // non-transient error is not retried even though creation is idempotent
    svc->fail_next_create(rpc::unauthorized);
    BOOST_CHECK_THROW(create(), remote_error);
    BOOST_CHECK_EQUAL(m.count("session_create_failed"), 5);
}

BOOST_FIXTURE_TEST_CASE(SessionExecuteWithinTransaction, session_fixture)
{
    session_ptr sess = create();

    sess->execute("SELECT 1");
    BOOST_CHECK(!sess->transaction_id());

    sess->begin_transaction();
    BOOST_REQUIRE(sess->transaction_id());
    BOOST_CHECK_THROW(sess->begin_transaction(), invalid_session_state);

    rpc::execute_result res = sess->execute("UPSERT INTO t (k) VALUES (1)");
    BOOST_CHECK_EQUAL(boost::any_cast<std::string>(res.data), "ok");

    std::vector<rpc::execute_request> reqs = svc->requests();
    BOOST_REQUIRE_EQUAL(reqs.size(), 2u);
    BOOST_CHECK_EQUAL(reqs[0].session_id, sess->id());
    BOOST_CHECK(!reqs[0].tx.tx_id && !reqs[0].tx.begin_tx);
    BOOST_CHECK(reqs[1].tx.tx_id == sess->transaction_id());
    BOOST_CHECK(!reqs[1].deadline);

    sess->commit_transaction();
    BOOST_CHECK(!sess->transaction_id());
    BOOST_CHECK_EQUAL(svc->count(svc->commits), 1);

    // nothing to commit or rollback
    sess->commit_transaction();
    sess->rollback_transaction();
    BOOST_CHECK_EQUAL(svc->count(svc->commits), 1);
    BOOST_CHECK_EQUAL(svc->count(svc->rollbacks), 0);

    BOOST_CHECK_EQUAL(m.count("transaction_started"), 1);
    BOOST_CHECK_EQUAL(m.count("transaction_committed"), 1);
    BOOST_CHECK_EQUAL(m.count("query_executed"), 2);
}

BOOST_FIXTURE_TEST_CASE(SessionRemoteErrors, session_fixture)
{
    session_ptr sess = create();

    svc->fail_next_execute(rpc::aborted);
    BOOST_CHECK_THROW(sess->execute("SELECT 1"), aborted);

    svc->fail_next_execute(rpc::bad_session);
    try
    {
        sess->execute("SELECT 1");
        BOOST_ERROR("bad_session expected");
    }
    catch (const remote_error& e)
    {
        BOOST_CHECK_EQUAL(e.code(), rpc::bad_session);
        BOOST_CHECK(dynamic_cast<const bad_session*>(&e));
    }

    // failed commit still closes transaction
    sess->begin_transaction();
    svc->fail_next_commit(rpc::undetermined);
    BOOST_CHECK_THROW(sess->commit_transaction(), undetermined);
    BOOST_CHECK(!sess->transaction_id());
}

BOOST_FIXTURE_TEST_CASE(SessionSingleOperationInFlight, session_fixture)
{
    session_ptr sess = create();

    nested_execute nested;
    nested.s = sess.get();
    svc->on_execute = boost::ref(nested);

    BOOST_CHECK_NO_THROW(sess->execute("SELECT 1"));
    BOOST_CHECK(nested.rejected);
    BOOST_CHECK_EQUAL(svc->count(svc->executes), 1);

    // guard is released after the operation
    BOOST_CHECK_NO_THROW(sess->execute("SELECT 3"));
}

BOOST_FIXTURE_TEST_CASE(SessionStreamClosedMarksClosing, session_fixture)
{
    session_ptr sess = create();

    svc->close_stream(sess->id());

    BOOST_CHECK(sess->is_closing());
    BOOST_CHECK(!sess->is_free());
    BOOST_CHECK(!sess->is_deleted());
    BOOST_CHECK_THROW(sess->release(), invalid_session_state);
}

BOOST_FIXTURE_TEST_CASE(TransactionGuard, session_fixture)
{
    session_ptr sess = create();

    {
        transaction tr(*sess);
        sess->execute("UPSERT INTO t (k) VALUES (1)");
    }
    BOOST_CHECK_EQUAL(svc->count(svc->rollbacks), 1);
    BOOST_CHECK(!sess->transaction_id());

    {
        transaction tr(*sess, rpc::tx_settings(rpc::tx_settings::snapshot_read_only));
        sess->execute("SELECT 1");
        tr.commit();
    }
    BOOST_CHECK_EQUAL(svc->count(svc->commits), 1);
    BOOST_CHECK_EQUAL(svc->count(svc->rollbacks), 1);

    // rollback failure in destructor is only reported
    svc->fail_next_rollback(rpc::internal_error);
    BOOST_CHECK_NO_THROW(transaction tr(*sess));
    BOOST_CHECK_EQUAL(m.count("transaction_rollback_failed"), 1);
    BOOST_CHECK(!sess->transaction_id());
}

BOOST_FIXTURE_TEST_CASE(TransactionGuardSurvivesThrowingStub, session_fixture)
{
    session_ptr sess = create();

    svc->rollback_throws = true;
    BOOST_CHECK_NO_THROW(transaction tr(*sess));
    BOOST_CHECK_EQUAL(svc->count(svc->rollbacks), 1);
    BOOST_CHECK_EQUAL(m.count("transaction_rollback_failed"), 1);
    BOOST_CHECK(!sess->transaction_id());
}
