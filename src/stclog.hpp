#ifndef _STC_STCLOG_
#define _STC_STCLOG_

#include "pchheader.hpp"

/**
 * Log output setup. Everything logs through the plog LOG_* macros. Until init() is called
 * (unit tests, cli tooling) no logger instance exists and the macros write nothing.
 */
namespace stclog
{
    void init();

} // namespace stclog

#endif
