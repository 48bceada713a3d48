#ifndef _STC_TEST_TEST_HELPERS_
#define _STC_TEST_TEST_HELPERS_

#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../util/util.hpp"
#include "../ledger/ledger.hpp"

namespace stctest
{
    constexpr uint64_t T0 = 1700000000;
    constexpr uint64_t HOUR = 3600;
    constexpr uint64_t DAY = ledger::DAY_SECONDS;
    constexpr uint64_t UNIT = 1000000; // One stake unit in base amounts.

    struct keypair
    {
        std::string pubkey;
        std::string seckey;
    };

    inline keypair make_keypair()
    {
        keypair k;
        crypto::generate_signing_keys(k.pubkey, k.seckey);
        return k;
    }

    /**
     * Time source under test control. Copies of the clock function observe later changes.
     */
    class manual_clock
    {
    private:
        std::shared_ptr<std::atomic<uint64_t>> now = std::make_shared<std::atomic<uint64_t>>(T0);

    public:
        ledger::clock_fn fn() const
        {
            const auto n = now;
            return [n]() { return n->load(); };
        }

        void set(const uint64_t t)
        {
            *now = t;
        }

        uint64_t get() const
        {
            return *now;
        }
    };

    // Unique scratch file path. The caller removes the file.
    inline const std::string temp_path(std::string_view name)
    {
        std::string rand;
        crypto::random_bytes(rand, 8);
        return "/tmp/stc_" + std::string(name) + "_" + util::to_hex(rand);
    }

    template <typename T>
    size_t count_events(ledger::settlement_ledger &sl)
    {
        size_t count = 0;
        ledger::ledger_event ev;
        while (sl.try_pop_event(ev))
        {
            if (std::holds_alternative<T>(ev))
                count++;
        }
        return count;
    }

} // namespace stctest

#endif
