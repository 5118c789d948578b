#ifndef QSESSION_QSESSION_HPP
#define QSESSION_QSESSION_HPP

#include <qsession/errors.hpp>
#include <qsession/conn_info.hpp>
#include <qsession/settings.hpp>
#include <qsession/context.hpp>
#include <qsession/discovery.hpp>
#include <qsession/session_monitor.hpp>
#include <qsession/session.hpp>
#include <qsession/session_pool.hpp>
#include <qsession/retry_strategy.hpp>
#include <qsession/query_client.hpp>
#include <qsession/transaction.hpp>

#endif // QSESSION_QSESSION_HPP
