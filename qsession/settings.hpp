#ifndef QSESSION_SETTINGS_HPP
#define QSESSION_SETTINGS_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/retry_strategy.hpp>

#include <string>

namespace qsession {

class conn_info;

/// \brief Session pool limits
struct QSESSION_API pool_settings
{
    static const int default_min_limit = 5;
    static const int default_max_limit = 20;

    pool_settings() : min_limit(default_min_limit), max_limit(default_max_limit) {}
    pool_settings(int min_lim, int max_lim) : min_limit(min_lim), max_limit(max_lim) {}

    /// Read \@min_limit and \@max_limit keys
    explicit pool_settings(const conn_info& ci);

    /// Throw invalid_connection_string if limits are inconsistent
    void validate() const;

    int min_limit;
    int max_limit;
};

/// \brief Everything query client needs to know besides its collaborators
struct QSESSION_API client_settings
{
    client_settings();

    /// Construct settings from connection string, see conn_info for format
    explicit client_settings(const conn_info& ci);

    std::string scheme;
    std::string database;
    pool_settings pool;

    /// Retry policy of query_client::run
    retry_parameters retry;

    /// Retry policy of session creation
    retry_parameters create_retry;
};

}

#endif // QSESSION_SETTINGS_HPP
