#define BOOST_TEST_MODULE stridecore_tests
#include <boost/test/unit_test.hpp>

#include "../pchheader.hpp"
#include "../crypto.hpp"

struct crypto_setup
{
    crypto_setup()
    {
        if (crypto::init() != 0)
            throw std::runtime_error("crypto init failed");
    }
};

BOOST_GLOBAL_FIXTURE(crypto_setup);
