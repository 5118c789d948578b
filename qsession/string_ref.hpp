#ifndef QSESSION_STRING_REF_HPP
#define QSESSION_STRING_REF_HPP

#include <boost/range/iterator_range.hpp>
#include <boost/range/as_literal.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <string>
#include <ostream>

namespace qsession
{

/// Non-owning view over a character range. Used by connection string parsing to avoid copies.
class string_ref : public boost::iterator_range<const char*> 
{
public:
    string_ref() {}
    string_ref(const char* str) : boost::iterator_range<const char*>(boost::as_literal(str)) {} 
    string_ref(const std::string& str) : boost::iterator_range<const char*>(str.c_str(), str.c_str() + str.size()) {}
    string_ref(const boost::iterator_range<const char*>& r) : boost::iterator_range<const char*>(r) {}
    string_ref(const char* b, const char* e) : boost::iterator_range<const char*>(b, e) {}
};

inline std::ostream& operator<<(std::ostream& os, const string_ref& s)
{
    os.write(s.begin(), s.size());
    return os;
}

inline std::string to_string(const string_ref& s)
{
    return std::string(s.begin(), s.end());
}

struct string_ref_iless
{
    bool operator()(const string_ref& r1, const string_ref& r2) const
    {
        return boost::algorithm::ilexicographical_compare(r1, r2);
    }
};

}

#endif // QSESSION_STRING_REF_HPP
