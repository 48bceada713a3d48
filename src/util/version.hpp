#ifndef _STC_UTIL_VERSION_
#define _STC_UTIL_VERSION_

#include "../pchheader.hpp"

namespace version
{
    // stridecore version. Written to new configs.
    constexpr const char *STC_VERSION = "1.2.0";

    // Minimum compatible config version (this will be used to validate configs).
    constexpr const char *MIN_CONFIG_VERSION = "1.0.0";

    // Settlement ledger storage schema version. Written into every new ledger db and checked on open.
    constexpr const char *LEDGER_VERSION = "1.1.0";

    int version_compare(const std::string &x, const std::string &y);

}

#endif
