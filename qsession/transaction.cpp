#include <qsession/transaction.hpp>

namespace qsession {

transaction::transaction(session& s, const rpc::tx_settings& settings) : s_(s), committed_(false)
{
    s_.begin_transaction(settings);
}

void transaction::commit()
{
    committed_ = true;
    s_.commit_transaction();
}

void transaction::rollback()
{
    if (!committed_)
        s_.rollback_transaction();
    committed_ = true;
}

transaction::~transaction()
{
    if (!committed_)
        s_.try_rollback();
}

}
