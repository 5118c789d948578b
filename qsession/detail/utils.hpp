#ifndef QSESSION_DETAIL_UTILS_HPP
#define QSESSION_DETAIL_UTILS_HPP

#include <cctype>

namespace qsession { namespace detail {

template<typename IterRange>
void trim(IterRange& rng)
{
    while(!rng.empty() && isspace(static_cast<unsigned char>(rng.front())))
        rng.advance_begin(1);

    while(!rng.empty() && isspace(static_cast<unsigned char>(rng.back())))
        rng.advance_end(-1);
}

template<typename IterRange>
IterRange trim(const IterRange& rng)
{
    IterRange rng_copy = rng;
    trim(rng_copy);
    return rng_copy;
}

}} // namespace qsession, detail

#endif // QSESSION_DETAIL_UTILS_HPP
