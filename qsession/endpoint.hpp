#ifndef QSESSION_ENDPOINT_HPP
#define QSESSION_ENDPOINT_HPP

#include <boost/lexical_cast.hpp>

#include <string>
#include <ostream>

namespace qsession {

/// \brief Address of a single node of the query service as reported by discovery
struct endpoint
{
    endpoint() : port(0), node_id(0) {}

    endpoint(const std::string& h, unsigned short p, unsigned int node = 0)
      : host(h), port(p), node_id(node)
    {
    }

    /// Return "host:port" string
    std::string to_string() const
    {
        return host + ":" + boost::lexical_cast<std::string>(port);
    }

    friend bool operator==(const endpoint& e1, const endpoint& e2)
    {
        return e1.host == e2.host && e1.port == e2.port && e1.node_id == e2.node_id;
    }

    friend bool operator!=(const endpoint& e1, const endpoint& e2)
    {
        return !(e1 == e2);
    }

    friend bool operator<(const endpoint& e1, const endpoint& e2)
    {
        if (e1.host != e2.host)
            return e1.host < e2.host;
        if (e1.port != e2.port)
            return e1.port < e2.port;
        return e1.node_id < e2.node_id;
    }

    friend std::ostream& operator<<(std::ostream& os, const endpoint& e)
    {
        return os << e.to_string();
    }

    std::string host;
    unsigned short port;
    unsigned int node_id;
};

}

#endif // QSESSION_ENDPOINT_HPP
