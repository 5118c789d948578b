#include <qsession/conn_info.hpp>
#include <qsession/errors.hpp>

#include <qsession/detail/utils.hpp>

#include <boost/typeof/typeof.hpp>
#include <boost/algorithm/string/find_iterator.hpp>
#include <boost/algorithm/string/finder.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <map>

using namespace std;

namespace qsession {

struct conn_info::data 
{
    typedef map<string, string_ref, string_ref_iless> rng_map;

    // conn_info is copyable and shares data, keep own copy of the source string so ranges stay valid
    string source_;
    rng_map pairs_;
    string scheme_;
    string clean_conn_string_;
};

conn_info::conn_info(const string_ref& conn_string) : data_(new data)
{
    using namespace boost;
    using namespace boost::algorithm;

    data_->source_.assign(conn_string.begin(), conn_string.end());
    string_ref src(data_->source_);

    // First get scheme name
    const char* colon_iter = std::find(src.begin(), src.end(), ':');
    if (colon_iter == src.end())
        throw invalid_connection_string("invalid_connection_string: " + data_->source_ + " - scheme was not specified");

    string_ref scheme_rng(src.begin(), colon_iter);
    detail::trim(scheme_rng);
    if (scheme_rng.empty())
        throw invalid_connection_string("invalid_connection_string: " + data_->source_ + " - scheme is empty");

    data_->scheme_.assign(scheme_rng.begin(), scheme_rng.end());

    // Iterate over all properties in connection string
    string_ref props(colon_iter + 1, src.end());
    BOOST_AUTO(si, (make_split_iterator(props, first_finder(";"))));
    BOOST_TYPEOF(si) end_si;

    for(;si != end_si; ++si) 
    {
        string_ref trimmed_pair = detail::trim(string_ref(si->begin(), si->end()));

        // split by '=' on key and value
        const char* eq_sign = std::find(trimmed_pair.begin(), trimmed_pair.end(), '=');
        string_ref key(trimmed_pair.begin(), eq_sign);
        string_ref val;
        if (eq_sign != trimmed_pair.end()) 
            val = string_ref(eq_sign + 1, trimmed_pair.end());

        // trim key and value
        detail::trim(key);
        detail::trim(val);

        if (key.empty()) 
            continue;

        data_->pairs_.insert(make_pair(to_string(key), val));

        // prepare clean connection string without qsession specific tags
        if('@' == key.front()) 
            continue;

        data_->clean_conn_string_.append(key.begin(), key.end());
        data_->clean_conn_string_.append("=");
        data_->clean_conn_string_.append(val.begin(), val.end());
        data_->clean_conn_string_.append("; ");
    }
}

bool conn_info::has(const char* key) const
{
    return data_->pairs_.find(key) != data_->pairs_.end();
}

string_ref conn_info::get(const char* key, const char* def) const
{
    data::rng_map::const_iterator res = data_->pairs_.find(key);
    return data_->pairs_.end() == res ? string_ref(def) : res->second;
}

string conn_info::get_copy(const char* key, const char* def) const
{
    return to_string(get(key, def));
}

int conn_info::get(const char* key, int def) const
{
    data::rng_map::const_iterator res = data_->pairs_.find(key);
    if (data_->pairs_.end() == res || res->second.empty()) 
        return def;

    try
    {
        return boost::lexical_cast<int>(res->second.begin(), res->second.size());
    }
    catch (const boost::bad_lexical_cast&)
    {
        throw invalid_connection_string("invalid_connection_string: value of " + string(key) 
            + " is not a number: " + to_string(res->second));
    }
}

const string& conn_info::conn_string() const
{
    return data_->clean_conn_string_;
}

string_ref conn_info::scheme() const
{
    return data_->scheme_;
}

}
