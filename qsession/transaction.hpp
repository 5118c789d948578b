#ifndef QSESSION_TRANSACTION_HPP
#define QSESSION_TRANSACTION_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/session.hpp>

#include <boost/noncopyable.hpp>

namespace qsession {

/// \brief The transaction guard
///
/// This class is RAII transaction guard that causes automatic transaction rollback on stack unwind, unless
/// the transaction is committed. Rollback failure in destructor is reported to session monitor only.
class QSESSION_API transaction : boost::noncopyable 
{
public:
    /// Begin a transaction on session \a s, calls s.begin_transaction()
    transaction(session& s, const rpc::tx_settings& settings = rpc::tx_settings::auto_begin());
   
    /// If the transaction wasn't committed or rolled back calls session::rollback_transaction()
    ~transaction();
    
    /// Commit a transaction on the session. Calls session::commit_transaction()
    void commit();

    /// Rollback a transaction on the session. Calls session::rollback_transaction()
    void rollback();

private:
    session& s_;
    bool committed_;
};

}

#endif // QSESSION_TRANSACTION_HPP
