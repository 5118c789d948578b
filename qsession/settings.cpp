#include <qsession/settings.hpp>
#include <qsession/conn_info.hpp>
#include <qsession/errors.hpp>

#include <boost/lexical_cast.hpp>

namespace qsession {

namespace {

retry_parameters client_retry_defaults()
{
    retry_parameters rp;
    rp.max_retries = 0;
    return rp;
}

retry_parameters create_retry_defaults()
{
    retry_parameters rp;
    rp.idempotent = true;
    return rp;
}

}

const int pool_settings::default_min_limit;
const int pool_settings::default_max_limit;

pool_settings::pool_settings(const conn_info& ci)
  : min_limit(ci.get("@min_limit", default_min_limit))
  , max_limit(ci.get("@max_limit", default_max_limit))
{
    validate();
}

void pool_settings::validate() const
{
    if (min_limit <= 0 || max_limit <= 0)
        throw invalid_connection_string("invalid_connection_string: pool limits must be positive");

    if (min_limit > max_limit)
        throw invalid_connection_string("invalid_connection_string: @min_limit " 
            + boost::lexical_cast<std::string>(min_limit) + " exceeds @max_limit " 
            + boost::lexical_cast<std::string>(max_limit));
}

client_settings::client_settings()
  : scheme("grpc")
  , retry(client_retry_defaults())
  , create_retry(create_retry_defaults())
{
}

client_settings::client_settings(const conn_info& ci)
  : scheme(to_string(ci.scheme()))
  , database(ci.get_copy("database"))
  , pool(ci)
  , retry(client_retry_defaults())
  , create_retry(create_retry_defaults())
{
    if (scheme != "grpc" && scheme != "grpcs")
        throw invalid_connection_string("invalid_connection_string: unsupported scheme " + scheme);

    retry.max_retries = ci.get("@max_retries", retry.max_retries);
    retry.backoff_slot_ms = ci.get("@backoff_slot_ms", retry.backoff_slot_ms);
    retry.backoff_ceiling = ci.get("@backoff_ceiling", retry.backoff_ceiling);

    if (retry.max_retries < 0 || retry.backoff_slot_ms < 0 || retry.backoff_ceiling < 0)
        throw invalid_connection_string("invalid_connection_string: retry options must not be negative");
}

}
