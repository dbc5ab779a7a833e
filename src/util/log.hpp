#ifndef HEADER_util_log_hpp_ALREADY_INCLUDED
#define HEADER_util_log_hpp_ALREADY_INCLUDED

#include <ostream>

namespace util { namespace log {

    // 0: quiet, 1: per input, 2: per token
    void set_level(int level);
    int level();

    std::ostream &os(int level);
    std::ostream &error();
    std::ostream &warning();

}} // namespace util::log

#endif
