#include <boost/test/unit_test.hpp>
#include <fstream>

#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../util/util.hpp"
#include "../ledger/ledger.hpp"
#include "../ledger/settlement_msg.hpp"
#include "../oracle/attestation_service.hpp"
#include "../oracle/mileage_source.hpp"
#include "test_helpers.hpp"

using namespace stctest;

namespace
{
    constexpr uint32_t FETCH_TIMEOUT_MS = 200;

    /**
     * Mileage source with per correlation id figures, failures, delays and calls held until released.
     */
    class scripted_source : public oracle::mileage_source
    {
    private:
        std::mutex mutex;
        std::condition_variable release_cv;
        std::unordered_map<std::string, double> miles;
        std::unordered_map<std::string, uint64_t> delays;
        std::unordered_set<std::string> failing;
        std::unordered_set<std::string> held;
        std::unordered_map<std::string, uint32_t> calls;

    public:
        void set_miles(const std::string &correlation_id, const double value)
        {
            std::scoped_lock<std::mutex> lock(mutex);
            miles[correlation_id] = value;
        }

        void set_delay(const std::string &correlation_id, const uint64_t ms)
        {
            std::scoped_lock<std::mutex> lock(mutex);
            delays[correlation_id] = ms;
        }

        void set_failing(const std::string &correlation_id)
        {
            std::scoped_lock<std::mutex> lock(mutex);
            failing.emplace(correlation_id);
        }

        // Calls for this id block until release_all().
        void hold(const std::string &correlation_id)
        {
            std::scoped_lock<std::mutex> lock(mutex);
            held.emplace(correlation_id);
        }

        void release_all()
        {
            {
                std::scoped_lock<std::mutex> lock(mutex);
                held.clear();
            }
            release_cv.notify_all();
        }

        uint32_t call_count(const std::string &correlation_id)
        {
            std::scoped_lock<std::mutex> lock(mutex);
            return calls[correlation_id];
        }

        int fetch_mileage(std::string_view identity, std::string_view correlation_id,
                          const uint64_t window_start, const uint64_t window_end, oracle::mileage_reading &reading)
        {
            const std::string id(correlation_id);
            uint64_t delay = 0;
            {
                std::unique_lock<std::mutex> lock(mutex);
                calls[id]++;
                release_cv.wait(lock, [&] { return held.count(id) == 0; });

                const auto itr = delays.find(id);
                if (itr != delays.end())
                    delay = itr->second;
            }

            if (delay > 0)
                util::sleep(delay);

            std::scoped_lock<std::mutex> lock(mutex);
            if (failing.count(id) == 1)
                return -1;

            const auto itr = miles.find(id);
            reading.miles = itr == miles.end() ? 0 : itr->second;
            reading.sample_count = 1;
            return 0;
        }
    };

    struct oracle_fixture
    {
        manual_clock clock;
        keypair attester = make_keypair();
        keypair a = make_keypair();
        keypair b = make_keypair();
        keypair c = make_keypair();
        keypair outsider = make_keypair();
        ledger::settlement_ledger sl{clock.fn()};
        std::shared_ptr<scripted_source> source = std::make_shared<scripted_source>();
        oracle::attestation_service svc{sl, source, attester.seckey, clock.fn()};

        uint64_t start = T0 + DAY;
        uint64_t end = T0 + 8 * DAY;

        oracle_fixture()
        {
            BOOST_REQUIRE_EQUAL(sl.init(":memory:", attester.pubkey), 0);
            BOOST_REQUIRE_EQUAL(svc.init(":memory:", 3600, FETCH_TIMEOUT_MS), 0);
        }

        // a, b and c are eligible. They join in the given order using correlation ids run-a, run-b and run-c.
        uint64_t create_and_join(const std::vector<const keypair *> &joiners)
        {
            uint64_t id = 0;
            BOOST_REQUIRE_EQUAL(sl.create_challenge(a.pubkey, start, end, UNIT, {b.pubkey, c.pubkey}, id), ledger::OK);
            for (const keypair *k : joiners)
                BOOST_REQUIRE_EQUAL(sl.join(id, k->pubkey, correlation_of(*k), UNIT), ledger::OK);
            return id;
        }

        uint64_t create_and_join_all()
        {
            return create_and_join({&a, &b, &c});
        }

        const std::string correlation_of(const keypair &k) const
        {
            return &k == &a ? "run-a" : (&k == &b ? "run-b" : "run-c");
        }

        oracle::ORACLE_ERROR confirm(const uint64_t id, const keypair &k)
        {
            oracle::confirmation_stats stats;
            return svc.confirm(id, k.pubkey, settlement_msg::sign_confirmation(id, k.seckey), stats);
        }

        oracle::finalization_result finalize_request(const uint64_t id)
        {
            oracle::finalization_result result;
            BOOST_REQUIRE_EQUAL(svc.request_finalization(id, result), oracle::OK);
            return result;
        }
    };
} // namespace

BOOST_FIXTURE_TEST_SUITE(oracle_tests, oracle_fixture)

BOOST_AUTO_TEST_CASE(attests_once_everyone_confirmed)
{
    const uint64_t id = create_and_join_all();
    source->set_miles("run-a", 10.0);
    source->set_miles("run-b", 12.5);
    source->set_miles("run-c", 3.2);

    clock.set(start + HOUR);
    oracle::finalization_result result = finalize_request(id);
    BOOST_CHECK_EQUAL(result.status, oracle::NOT_ENDED);
    BOOST_CHECK_EQUAL(result.time_remaining, end - start - HOUR);

    clock.set(end);
    oracle::sync_result synced;
    BOOST_REQUIRE_EQUAL(svc.sync_challenge(id, synced), oracle::OK);
    BOOST_CHECK_EQUAL(synced.synced, 3);
    BOOST_CHECK_EQUAL(synced.total, 3);

    result = finalize_request(id);
    BOOST_CHECK_EQUAL(result.status, oracle::AWAITING_CONFIRMATIONS);
    BOOST_CHECK_EQUAL(result.stats.confirmed_count, 0);
    BOOST_CHECK_EQUAL(result.stats.total_participants, 3);
    BOOST_CHECK_EQUAL(result.time_remaining, oracle::GRACE_PERIOD);

    oracle::confirmation_stats stats;
    BOOST_CHECK_EQUAL(svc.confirm(id, a.pubkey, settlement_msg::sign_confirmation(id, a.seckey), stats), oracle::OK);
    BOOST_CHECK_EQUAL(stats.confirmed_count, 1);
    BOOST_CHECK_EQUAL(svc.confirm(id, c.pubkey, settlement_msg::sign_confirmation(id, c.seckey), stats), oracle::OK);
    BOOST_CHECK_EQUAL(stats.confirmed_count, 2);
    BOOST_CHECK(!stats.all_confirmed());
    BOOST_CHECK_EQUAL(finalize_request(id).status, oracle::AWAITING_CONFIRMATIONS);

    BOOST_CHECK_EQUAL(svc.confirm(id, b.pubkey, settlement_msg::sign_confirmation(id, b.seckey), stats), oracle::OK);
    BOOST_CHECK(stats.all_confirmed());

    result = finalize_request(id);
    BOOST_REQUIRE_EQUAL(result.status, oracle::ATTESTED);
    BOOST_CHECK_EQUAL(result.reason, oracle::ALL_CONFIRMED);
    BOOST_CHECK(result.attestation.winner == b.pubkey);
    BOOST_CHECK_EQUAL(result.attestation.challenge_id, id);
    BOOST_CHECK_EQUAL(result.attestation.signing_timestamp, end);
    BOOST_CHECK(result.attestation.result_hash == crypto::get_hash(result.results));
    BOOST_CHECK_EQUAL(settlement_msg::verify_finalization(result.attestation, attester.pubkey), 0);

    BOOST_REQUIRE_EQUAL(result.participants.size(), 3);
    BOOST_CHECK(result.participants[0].identity == a.pubkey);
    BOOST_CHECK_EQUAL(result.participants[0].centimiles, 1000);
    BOOST_CHECK(result.participants[1].identity == b.pubkey);
    BOOST_CHECK_EQUAL(result.participants[1].centimiles, 1250);
    BOOST_CHECK_EQUAL(result.participants[2].correlation_id, "run-c");
    BOOST_CHECK_EQUAL(result.participants[2].centimiles, 320);
    for (const oracle::participant_result &p : result.participants)
        BOOST_CHECK(p.confirmed);

    BOOST_CHECK_EQUAL(sl.claim_with_attestation(id, b.pubkey, result.attestation), ledger::OK);
    BOOST_CHECK_EQUAL(sl.released_balance(b.pubkey), 3 * UNIT);
    BOOST_CHECK_EQUAL(sl.claim_with_attestation(id, b.pubkey, result.attestation), ledger::CHALLENGE_SETTLED);
    BOOST_CHECK_EQUAL(sl.released_balance(b.pubkey), 3 * UNIT);
}

BOOST_AUTO_TEST_CASE(confirm_rejections)
{
    const uint64_t id = create_and_join_all();
    const uint64_t under_id = create_and_join({&a});
    oracle::confirmation_stats stats;

    BOOST_CHECK_EQUAL(confirm(42, a), oracle::CHALLENGE_NOT_FOUND);

    clock.set(start + HOUR);
    BOOST_CHECK_EQUAL(confirm(id, a), oracle::CHALLENGE_NOT_ENDED);
    BOOST_CHECK_EQUAL(confirm(under_id, a), oracle::CHALLENGE_CANCELLED);

    clock.set(end);
    BOOST_CHECK_EQUAL(confirm(id, outsider), oracle::NOT_PARTICIPANT);
    BOOST_CHECK_EQUAL(svc.confirm(id, a.pubkey, settlement_msg::sign_confirmation(id, b.seckey), stats), oracle::INVALID_SIGNATURE);
    BOOST_CHECK_EQUAL(svc.confirm(id, a.pubkey, settlement_msg::sign_confirmation(under_id, a.seckey), stats), oracle::INVALID_SIGNATURE);
    BOOST_CHECK_EQUAL(svc.confirm(id, a.pubkey, settlement_msg::sign_cancel_consent(id, a.seckey).signature, stats), oracle::INVALID_SIGNATURE);
    BOOST_CHECK_EQUAL(confirm(id, a), oracle::OK);
    BOOST_CHECK_EQUAL(confirm(id, a), oracle::ALREADY_CONFIRMED);

    BOOST_REQUIRE_EQUAL(svc.get_confirmation_stats(id, stats), oracle::OK);
    BOOST_CHECK_EQUAL(stats.confirmed_count, 1);
    BOOST_CHECK_EQUAL(stats.total_participants, 3);

    oracle::finalization_result result;
    BOOST_CHECK_EQUAL(svc.request_finalization(under_id, result), oracle::CHALLENGE_CANCELLED);
    BOOST_CHECK_EQUAL(svc.request_finalization(42, result), oracle::CHALLENGE_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(equal_mileage_goes_to_earliest_joiner)
{
    const uint64_t id = create_and_join({&c, &a, &b});
    source->set_miles("run-c", 5.0);
    source->set_miles("run-a", 5.0);
    source->set_miles("run-b", 4.99);

    clock.set(end);
    oracle::sync_result synced;
    BOOST_REQUIRE_EQUAL(svc.sync_challenge(id, synced), oracle::OK);
    BOOST_REQUIRE_EQUAL(confirm(id, a), oracle::OK);
    BOOST_REQUIRE_EQUAL(confirm(id, b), oracle::OK);
    BOOST_REQUIRE_EQUAL(confirm(id, c), oracle::OK);

    const oracle::finalization_result result = finalize_request(id);
    BOOST_REQUIRE_EQUAL(result.status, oracle::ATTESTED);
    BOOST_CHECK(result.attestation.winner == c.pubkey);

    // Results follow join order, not whitelist order.
    BOOST_REQUIRE_EQUAL(result.participants.size(), 3);
    BOOST_CHECK(result.participants[0].identity == c.pubkey);
    BOOST_CHECK(result.participants[1].identity == a.pubkey);
    BOOST_CHECK(result.participants[2].identity == b.pubkey);
    BOOST_CHECK_EQUAL(result.participants[2].centimiles, 499);
}

BOOST_AUTO_TEST_CASE(unconfirmed_leader_wins_after_grace_period)
{
    const uint64_t id = create_and_join_all();
    clock.set(end);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, a.pubkey, 8.0), oracle::OK);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, b.pubkey, 21.1), oracle::OK);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, c.pubkey, 2.0), oracle::OK);
    BOOST_REQUIRE_EQUAL(confirm(id, a), oracle::OK);

    clock.set(end + oracle::GRACE_PERIOD - 1);
    oracle::finalization_result result = finalize_request(id);
    BOOST_CHECK_EQUAL(result.status, oracle::AWAITING_CONFIRMATIONS);
    BOOST_CHECK_EQUAL(result.stats.confirmed_count, 1);
    BOOST_CHECK_EQUAL(result.time_remaining, 1);

    clock.set(end + oracle::GRACE_PERIOD);
    result = finalize_request(id);
    BOOST_REQUIRE_EQUAL(result.status, oracle::ATTESTED);
    BOOST_CHECK_EQUAL(result.reason, oracle::GRACE_PERIOD_EXPIRED);
    BOOST_CHECK(result.attestation.winner == b.pubkey);
    BOOST_REQUIRE_EQUAL(result.participants.size(), 3);
    BOOST_CHECK(result.participants[0].confirmed);
    BOOST_CHECK(!result.participants[1].confirmed);

    BOOST_CHECK_EQUAL(sl.claim_with_attestation(id, b.pubkey, result.attestation), ledger::OK);
    BOOST_CHECK_EQUAL(sl.released_balance(b.pubkey), 3 * UNIT);
}

BOOST_AUTO_TEST_CASE(first_decision_is_locked_in)
{
    const uint64_t id = create_and_join_all();
    clock.set(end + oracle::GRACE_PERIOD);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, a.pubkey, 3.0), oracle::OK);

    const oracle::finalization_result first = finalize_request(id);
    BOOST_REQUIRE_EQUAL(first.status, oracle::ATTESTED);
    BOOST_CHECK(first.attestation.winner == a.pubkey);

    // Later mileage does not change an existing decision.
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, c.pubkey, 100.0), oracle::OK);
    clock.set(end + oracle::GRACE_PERIOD + HOUR);

    const oracle::finalization_result second = finalize_request(id);
    BOOST_REQUIRE_EQUAL(second.status, oracle::ATTESTED);
    BOOST_CHECK(second.attestation.winner == a.pubkey);
    BOOST_CHECK(second.attestation.result_hash == first.attestation.result_hash);
    BOOST_CHECK_EQUAL(second.results, first.results);
    BOOST_CHECK_EQUAL(second.attestation.signing_timestamp, first.attestation.signing_timestamp + HOUR);
    BOOST_CHECK(second.attestation.signature != first.attestation.signature);

    BOOST_CHECK_EQUAL(sl.claim_with_attestation(id, c.pubkey, second.attestation), ledger::NOT_WINNER);
    BOOST_CHECK_EQUAL(sl.claim_with_attestation(id, a.pubkey, second.attestation), ledger::OK);
}

BOOST_AUTO_TEST_CASE(missing_mileage_counts_as_zero)
{
    const uint64_t id = create_and_join_all();
    clock.set(end + oracle::GRACE_PERIOD);

    oracle::finalization_result result;
    BOOST_CHECK_EQUAL(svc.request_finalization(id, result), oracle::NO_MILEAGE_DATA);

    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, c.pubkey, 0.5), oracle::OK);
    result = finalize_request(id);
    BOOST_REQUIRE_EQUAL(result.status, oracle::ATTESTED);
    BOOST_CHECK(result.attestation.winner == c.pubkey);
    BOOST_REQUIRE_EQUAL(result.participants.size(), 3);
    BOOST_CHECK_EQUAL(result.participants[0].centimiles, 0);
    BOOST_CHECK_EQUAL(result.participants[1].centimiles, 0);
    BOOST_CHECK_EQUAL(result.participants[2].centimiles, 50);
}

BOOST_AUTO_TEST_CASE(record_mileage_validation_and_leaderboard)
{
    const uint64_t id = create_and_join_all();

    BOOST_CHECK_EQUAL(svc.record_mileage(id, a.pubkey, -1.0), oracle::INVALID_MILEAGE);
    BOOST_CHECK_EQUAL(svc.record_mileage(id, a.pubkey, std::nan("")), oracle::INVALID_MILEAGE);
    BOOST_CHECK_EQUAL(svc.record_mileage(id, a.pubkey, std::numeric_limits<double>::infinity()), oracle::INVALID_MILEAGE);
    BOOST_CHECK_EQUAL(svc.record_mileage(id, outsider.pubkey, 1.0), oracle::NOT_PARTICIPANT);
    BOOST_CHECK_EQUAL(svc.record_mileage(42, a.pubkey, 1.0), oracle::CHALLENGE_NOT_FOUND);

    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, a.pubkey, 1.0), oracle::OK);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, c.pubkey, 4.0), oracle::OK);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, a.pubkey, 4.0), oracle::OK);

    std::vector<oracle::participant_result> leaderboard;
    BOOST_REQUIRE_EQUAL(svc.get_leaderboard(id, leaderboard), oracle::OK);
    BOOST_REQUIRE_EQUAL(leaderboard.size(), 3);
    BOOST_CHECK(leaderboard[0].identity == a.pubkey);
    BOOST_CHECK_EQUAL(leaderboard[0].centimiles, 400);
    BOOST_CHECK(leaderboard[1].identity == c.pubkey);
    BOOST_CHECK(leaderboard[2].identity == b.pubkey);
    BOOST_CHECK_EQUAL(leaderboard[2].centimiles, 0);
}

BOOST_AUTO_TEST_CASE(slow_and_failing_fetches_are_counted)
{
    const uint64_t id = create_and_join_all();
    source->set_miles("run-a", 7.25);
    source->set_failing("run-b");
    source->set_delay("run-c", 5 * FETCH_TIMEOUT_MS);

    clock.set(start + HOUR);
    const uint64_t began = util::get_epoch_milliseconds();
    oracle::sync_result result;
    BOOST_REQUIRE_EQUAL(svc.sync_challenge(id, result), oracle::OK);
    const uint64_t elapsed = util::get_epoch_milliseconds() - began;

    BOOST_CHECK_EQUAL(result.total, 3);
    BOOST_CHECK_EQUAL(result.synced, 1);
    BOOST_CHECK_EQUAL(result.errors, 1);
    BOOST_CHECK_EQUAL(result.timeouts, 1);
    BOOST_CHECK_LT(elapsed, 4 * FETCH_TIMEOUT_MS);

    std::vector<oracle::participant_result> leaderboard;
    BOOST_REQUIRE_EQUAL(svc.get_leaderboard(id, leaderboard), oracle::OK);
    BOOST_CHECK(leaderboard[0].identity == a.pubkey);
    BOOST_CHECK_EQUAL(leaderboard[0].centimiles, 725);
}

BOOST_AUTO_TEST_CASE(hung_fetch_is_not_repeated)
{
    const uint64_t id = create_and_join_all();
    source->set_miles("run-a", 1.0);
    source->set_miles("run-c", 3.0);
    source->hold("run-c");

    clock.set(start + HOUR);
    for (int i = 0; i < 4; i++)
    {
        oracle::sync_result result;
        BOOST_REQUIRE_EQUAL(svc.sync_challenge(id, result), oracle::OK);
        BOOST_CHECK_EQUAL(result.synced, 2);
        BOOST_CHECK_EQUAL(result.timeouts, 1);
        BOOST_CHECK_EQUAL(svc.outstanding_fetches(), 1);
    }
    BOOST_CHECK_EQUAL(source->call_count("run-c"), 1);
    BOOST_CHECK_EQUAL(source->call_count("run-a"), 4);

    source->release_all();
    for (int i = 0; i < 100 && svc.outstanding_fetches() > 0; i++)
        util::sleep(10);
    BOOST_REQUIRE_EQUAL(svc.outstanding_fetches(), 0);

    oracle::sync_result result;
    BOOST_REQUIRE_EQUAL(svc.sync_challenge(id, result), oracle::OK);
    BOOST_CHECK_EQUAL(result.synced, 3);
    BOOST_CHECK_EQUAL(source->call_count("run-c"), 2);

    std::vector<oracle::participant_result> leaderboard;
    BOOST_REQUIRE_EQUAL(svc.get_leaderboard(id, leaderboard), oracle::OK);
    BOOST_CHECK(leaderboard[0].identity == c.pubkey);
    BOOST_CHECK_EQUAL(leaderboard[0].centimiles, 300);
}

BOOST_AUTO_TEST_CASE(out_of_range_mileage_is_rejected)
{
    const uint64_t id = create_and_join_all();
    source->set_miles("run-a", 1e17);
    source->set_miles("run-b", 2.0);

    clock.set(start + HOUR);
    oracle::sync_result result;
    BOOST_REQUIRE_EQUAL(svc.sync_challenge(id, result), oracle::OK);
    BOOST_CHECK_EQUAL(result.synced, 2);
    BOOST_CHECK_EQUAL(result.errors, 1);

    BOOST_CHECK_EQUAL(svc.record_mileage(id, a.pubkey, 1e17), oracle::INVALID_MILEAGE);
    BOOST_CHECK_EQUAL(svc.record_mileage(id, a.pubkey, std::numeric_limits<double>::max()), oracle::INVALID_MILEAGE);
    BOOST_CHECK_EQUAL(svc.record_mileage(id, a.pubkey, 1e15), oracle::OK);

    BOOST_CHECK(oracle::is_valid_mileage(0));
    BOOST_CHECK(oracle::is_valid_mileage(9e16));
    BOOST_CHECK(!oracle::is_valid_mileage(9.3e16));
    BOOST_CHECK(!oracle::is_valid_mileage(-0.01));
}

BOOST_AUTO_TEST_CASE(concurrent_requests_agree_on_winner)
{
    const uint64_t id = create_and_join_all();
    clock.set(end + oracle::GRACE_PERIOD);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, a.pubkey, 10.0), oracle::OK);
    BOOST_REQUIRE_EQUAL(svc.record_mileage(id, b.pubkey, 9.0), oracle::OK);

    std::mutex results_mutex;
    std::vector<oracle::finalization_result> results;
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; i++)
    {
        threads.emplace_back([&, i]() {
            if (i % 2 == 1)
            {
                // Mileage keeps moving while decisions are requested.
                svc.record_mileage(id, (i % 4 == 1) ? b.pubkey : c.pubkey, 10.0 + i);
                return;
            }

            oracle::finalization_result result;
            if (svc.request_finalization(id, result) == oracle::OK)
            {
                std::scoped_lock<std::mutex> lock(results_mutex);
                results.push_back(result);
            }
        });
    }

    for (std::thread &t : threads)
        t.join();

    BOOST_REQUIRE_EQUAL(results.size(), 4);
    for (const oracle::finalization_result &r : results)
    {
        BOOST_CHECK_EQUAL(r.status, oracle::ATTESTED);
        BOOST_CHECK(r.attestation.winner == results[0].attestation.winner);
        BOOST_CHECK(r.attestation.result_hash == results[0].attestation.result_hash);
    }

    // Whatever was decided first stays decided.
    const oracle::finalization_result after = finalize_request(id);
    BOOST_CHECK(after.attestation.winner == results[0].attestation.winner);
}

BOOST_AUTO_TEST_CASE(sweep_covers_only_live_undecided_challenges)
{
    const uint64_t live_id = create_and_join_all();
    const uint64_t under_id = create_and_join({&a, &b});
    uint64_t future_id = 0;
    BOOST_REQUIRE_EQUAL(sl.create_challenge(b.pubkey, start + 2 * DAY, end, UNIT, {a.pubkey}, future_id), ledger::OK);
    source->set_miles("run-b", 2.0);

    clock.set(start + HOUR);
    std::vector<oracle::sync_result> results;
    BOOST_REQUIRE_EQUAL(svc.sync_active_challenges(results), oracle::OK);
    BOOST_REQUIRE_EQUAL(results.size(), 1);
    BOOST_CHECK_EQUAL(results[0].challenge_id, live_id);
    BOOST_CHECK_EQUAL(results[0].synced, 3);

    oracle::sync_result single;
    BOOST_CHECK_EQUAL(svc.sync_challenge(under_id, single), oracle::CHALLENGE_CANCELLED);

    // Decided challenges are no longer refreshed.
    clock.set(end + oracle::GRACE_PERIOD);
    BOOST_REQUIRE_EQUAL(finalize_request(live_id).status, oracle::ATTESTED);
    results.clear();
    BOOST_REQUIRE_EQUAL(svc.sync_active_challenges(results), oracle::OK);
    BOOST_CHECK(results.empty());
}

BOOST_AUTO_TEST_CASE(background_sweep_refreshes_mileage)
{
    const uint64_t id = create_and_join_all();
    source->set_miles("run-c", 1.5);
    clock.set(start + HOUR);

    svc.start_sweep();

    std::vector<oracle::participant_result> leaderboard;
    bool refreshed = false;
    for (int i = 0; i < 250 && !refreshed; i++)
    {
        util::sleep(20);
        BOOST_REQUIRE_EQUAL(svc.get_leaderboard(id, leaderboard), oracle::OK);
        refreshed = leaderboard[0].centimiles == 150;
    }
    BOOST_REQUIRE(refreshed);

    source->set_miles("run-a", 2.5);
    svc.trigger_sync();

    refreshed = false;
    for (int i = 0; i < 250 && !refreshed; i++)
    {
        util::sleep(20);
        BOOST_REQUIRE_EQUAL(svc.get_leaderboard(id, leaderboard), oracle::OK);
        refreshed = leaderboard[0].identity == a.pubkey && leaderboard[0].centimiles == 250;
    }
    BOOST_CHECK(refreshed);

    svc.deinit();
}

BOOST_AUTO_TEST_CASE(canonical_results_string)
{
    const std::vector<oracle::participant_result> results{
        {a.pubkey, "run-a", 1234, true},
        {b.pubkey, "run-b", 0, false}};

    const std::string str = oracle::serialize_results(results);
    BOOST_CHECK_EQUAL(str, "[{\"identity\":\"" + util::to_hex(a.pubkey) + "\",\"correlation_id\":\"run-a\",\"centimiles\":1234,\"confirmed\":true}," +
                               "{\"identity\":\"" + util::to_hex(b.pubkey) + "\",\"correlation_id\":\"run-b\",\"centimiles\":0,\"confirmed\":false}]");

    std::vector<oracle::participant_result> parsed;
    BOOST_REQUIRE_EQUAL(oracle::parse_results(str, parsed), 0);
    BOOST_REQUIRE_EQUAL(parsed.size(), 2);
    BOOST_CHECK(parsed[1].identity == b.pubkey);
    BOOST_CHECK(!parsed[1].confirmed);
    BOOST_CHECK_EQUAL(oracle::parse_results("not json", parsed), -1);

    BOOST_CHECK_EQUAL(oracle::to_centimiles(12.34), 1234);
    BOOST_CHECK_EQUAL(oracle::to_centimiles(3.456), 346);
    BOOST_CHECK_EQUAL(oracle::to_centimiles(0), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(file_mileage_source_tests)

BOOST_AUTO_TEST_CASE(reads_miles_by_correlation_id)
{
    const std::string path = temp_path("mileage") + ".json";
    {
        std::ofstream out(path);
        out << "{\"run-a\": 12.34, \"run-b\": {\"miles\": 3.5, \"samples\": 4}}";
    }

    oracle::file_mileage_source source(path);
    oracle::mileage_reading reading;

    BOOST_REQUIRE_EQUAL(source.fetch_mileage("", "run-a", T0, T0 + DAY, reading), 0);
    BOOST_CHECK_CLOSE(reading.miles, 12.34, 0.0001);
    BOOST_CHECK_EQUAL(reading.sample_count, 1);

    BOOST_REQUIRE_EQUAL(source.fetch_mileage("", "run-b", T0, T0 + DAY, reading), 0);
    BOOST_CHECK_CLOSE(reading.miles, 3.5, 0.0001);
    BOOST_CHECK_EQUAL(reading.sample_count, 4);

    BOOST_REQUIRE_EQUAL(source.fetch_mileage("", "run-z", T0, T0 + DAY, reading), 0);
    BOOST_CHECK_EQUAL(reading.miles, 0);
    BOOST_CHECK_EQUAL(reading.sample_count, 0);

    {
        std::ofstream out(path);
        out << "{broken";
    }
    BOOST_CHECK_EQUAL(source.fetch_mileage("", "run-a", T0, T0 + DAY, reading), -1);

    std::remove(path.c_str());
    BOOST_CHECK_EQUAL(source.fetch_mileage("", "run-a", T0, T0 + DAY, reading), -1);
}

BOOST_AUTO_TEST_SUITE_END()
