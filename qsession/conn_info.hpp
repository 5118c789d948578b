#ifndef QSESSION_CONN_INFO_HPP
#define QSESSION_CONN_INFO_HPP

#include <qsession/detail/exports.hpp>
#include <qsession/string_ref.hpp>

#include <boost/shared_ptr.hpp>

#include <string>

namespace qsession {

/// \brief Parse a connection string \a cs into scheme name and list of properties
///
/// The connection string format is following:
///
/// \verbatim  scheme:[key=value;]*  \endverbatim 
///
/// Key values starting with \@ are reserved to be used as special qsession keys
/// For example:
///
/// \verbatim   grpcs:database=/ru/home/db; @max_limit=50; @max_retries=3 \endverbatim 
///
/// Where scheme is "grpcs", database is "/ru/home/db", pool is limited to 50 sessions
/// and query client retries failed operations up to 3 times.
class QSESSION_API conn_info
{
public:
    ///
    /// Split connection string to key-value pairs
    ///
    conn_info(const string_ref& conn_string);

    ///
    /// Return true if conn_info has specified key
    ///
    bool has(const char* key) const;

    ///
    /// Return value for specified key, if key not found return default value
    ///
    string_ref get(const char* key, const char* def = "") const;

    ///
    /// Return copy of value for specified key, if key not found return default value
    ///
    std::string get_copy(const char* key, const char* def = "") const;

    ///
    /// Return numeric value for specified key, if key not found or empty return default value.
    /// Throw invalid_connection_string if value is not a number.
    ///
    int get(const char* key, int def) const;

    ///
    /// Return connection string without qsession specific tags
    ///
    const std::string& conn_string() const;

    ///
    /// Return scheme name, part of the connection string before colon
    ///
    string_ref scheme() const;

private:
    struct data;
    boost::shared_ptr<data> data_;
};

}

#endif // QSESSION_CONN_INFO_HPP
