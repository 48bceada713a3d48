#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../ledger/settlement_msg.hpp"
#include "../util/sqlite.hpp"
#include "../util/util.hpp"
#include "attestation_service.hpp"
#include "oracle_store.hpp"

namespace oracle
{
    namespace sql = util::sqlite;

    constexpr uint64_t SWEEP_IDLE_WAIT = 500; // ms

    ORACLE_ERROR reject(const char *op, const uint64_t challenge_id, const ORACLE_ERROR error)
    {
        LOG_DEBUG << op << " rejected for challenge " << challenge_id << ": " << error_to_string(error);
        return error;
    }

    attestation_service::attestation_service(ledger::settlement_ledger &settlement, std::shared_ptr<mileage_source> source,
                                             std::string_view attester_seckey, ledger::clock_fn clock)
        : settlement(settlement),
          source(std::move(source)),
          attester_seckey(attester_seckey),
          clock(std::move(clock))
    {
    }

    attestation_service::~attestation_service()
    {
        deinit();
    }

    /**
     * Opens (or creates) the oracle db.
     * @param sync_interval Seconds between two background sweeps.
     * @param fetch_timeout Max milliseconds to wait for a single mileage fetch.
     * @return 0 on success. -1 on failure.
     */
    int attestation_service::init(std::string_view db_path, const uint32_t sync_interval, const uint32_t fetch_timeout)
    {
        if (sync_interval == 0 || fetch_timeout == 0)
        {
            LOG_ERROR << "Sync interval and fetch timeout must be non-zero.";
            return -1;
        }

        if (sql::open_db(db_path, &db) == -1)
        {
            LOG_ERROR << "Error opening oracle db " << db_path;
            return -1;
        }

        if (store::create_schema(db) == -1)
        {
            sql::close_db(&db);
            return -1;
        }

        this->sync_interval = sync_interval;
        this->fetch_timeout = fetch_timeout;
        init_success = true;
        return 0;
    }

    void attestation_service::deinit()
    {
        if (is_sweep_running)
        {
            is_shutting_down = true;
            sweep_thread.join();
            is_sweep_running = false;
        }

        {
            // Give outstanding fetches one fetch timeout to finish. Whatever is left is abandoned.
            std::unique_lock<std::mutex> lock(fetches->mutex);
            if (!fetches->cv.wait_for(lock, std::chrono::milliseconds(fetch_timeout), [&] { return fetches->in_flight.empty(); }))
                LOG_WARNING << "Abandoning " << fetches->in_flight.size() << " outstanding mileage fetches.";
        }

        if (init_success)
        {
            std::scoped_lock<std::mutex> lock(db_mutex);
            sql::close_db(&db);
            init_success = false;
        }
    }

    /**
     * Starts the background worker that refreshes the mileage of every live challenge each sync interval.
     */
    void attestation_service::start_sweep()
    {
        if (!init_success || is_sweep_running)
            return;

        is_shutting_down = false;
        sweep_thread = std::thread(&attestation_service::sweep_loop, this);
        is_sweep_running = true;
    }

    /**
     * Requests an out-of-schedule sweep. The sweep worker picks it up within its idle wait.
     */
    void attestation_service::trigger_sync()
    {
        sync_requested = true;
    }

    void attestation_service::sweep_loop()
    {
        util::mask_signal();

        LOG_INFO << "Mileage sweep: Worker started. Interval " << sync_interval << "s";

        uint64_t last_sweep = 0;
        while (!is_shutting_down)
        {
            const uint64_t time_now = util::get_epoch_milliseconds();
            if (sync_requested || last_sweep == 0 || (time_now - last_sweep) >= (uint64_t)sync_interval * 1000)
            {
                sync_requested = false;
                last_sweep = time_now;

                std::vector<sync_result> results;
                if (sync_active_challenges(results) != OK)
                    LOG_ERROR << "Mileage sweep: Sweep failed.";
            }
            else
            {
                util::sleep(SWEEP_IDLE_WAIT);
            }
        }

        LOG_INFO << "Mileage sweep: Worker stopped.";
    }

    struct fetch_outcome
    {
        int res = -1;
        mileage_reading reading;
        std::string error;
    };

    /**
     * Calls the mileage source on a separate thread and waits at most fetch_timeout for it. An abandoned call keeps
     * running in the background and its result is discarded. While it runs, no other fetch is started for the same
     * participant of the same challenge.
     */
    ORACLE_ERROR attestation_service::fetch_with_timeout(const uint64_t challenge_id, std::string_view identity, std::string_view correlation_id,
                                                         const uint64_t window_start, const uint64_t window_end, mileage_reading &reading)
    {
        std::string key = std::to_string(challenge_id);
        key.append("/").append(identity);

        {
            std::scoped_lock<std::mutex> lock(fetches->mutex);
            if (!fetches->in_flight.emplace(key).second)
            {
                LOG_WARNING << "Mileage fetch for " << correlation_id << " still outstanding. Skipped.";
                return FETCH_TIMEOUT;
            }
        }

        auto promise = std::make_shared<std::promise<fetch_outcome>>();
        std::future<fetch_outcome> future = promise->get_future();

        // The worker only touches what it captures. It must not log since it may outlive the logger.
        std::thread([promise, tracker = fetches, key, src = source, identity = std::string(identity),
                     correlation_id = std::string(correlation_id), window_start, window_end]() {
            fetch_outcome outcome;
            try
            {
                outcome.res = src->fetch_mileage(identity, correlation_id, window_start, window_end, outcome.reading);
            }
            catch (const std::exception &e)
            {
                outcome.res = -1;
                outcome.error = e.what();
            }

            {
                std::scoped_lock<std::mutex> lock(tracker->mutex);
                tracker->in_flight.erase(key);
            }
            tracker->cv.notify_all();
            promise->set_value(std::move(outcome));
        })
            .detach();

        if (future.wait_for(std::chrono::milliseconds(fetch_timeout)) != std::future_status::ready)
        {
            LOG_WARNING << "Mileage fetch timed out for " << correlation_id << " after " << fetch_timeout << "ms";
            return FETCH_TIMEOUT;
        }

        const fetch_outcome outcome = future.get();
        if (outcome.res == -1)
        {
            if (!outcome.error.empty())
                LOG_ERROR << "Mileage fetch threw for " << correlation_id << ". " << outcome.error;
            return FETCH_FAILED;
        }

        if (!is_valid_mileage(outcome.reading.miles))
        {
            LOG_WARNING << "Invalid mileage " << outcome.reading.miles << " reported for " << correlation_id;
            return INVALID_MILEAGE;
        }

        reading = outcome.reading;
        return OK;
    }

    size_t attestation_service::outstanding_fetches()
    {
        std::scoped_lock<std::mutex> lock(fetches->mutex);
        return fetches->in_flight.size();
    }

    std::shared_ptr<std::mutex> attestation_service::get_signing_lock(const uint64_t challenge_id)
    {
        std::scoped_lock<std::mutex> lock(signing_locks_mutex);
        std::shared_ptr<std::mutex> &signing_lock = signing_locks[challenge_id];
        if (!signing_lock)
            signing_lock = std::make_shared<std::mutex>();
        return signing_lock;
    }

    /**
     * Collects the confirmed participants of a challenge. Confirmations of identities that are not participants
     * are not counted.
     */
    ORACLE_ERROR attestation_service::load_confirmations(const uint64_t challenge_id, const std::vector<ledger::participant_record> &participants,
                                                         std::unordered_set<std::string> &confirmed, confirmation_stats &stats)
    {
        std::unordered_set<std::string> stored;
        {
            std::scoped_lock<std::mutex> lock(db_mutex);
            if (store::get_confirmed_identities(db, challenge_id, stored) == -1)
                return STORAGE_FAILURE;
        }

        stats = confirmation_stats{};
        stats.total_participants = participants.size();
        for (const ledger::participant_record &p : participants)
        {
            if (stored.count(p.identity) == 1)
            {
                confirmed.emplace(p.identity);
                stats.confirmed_count++;
            }
        }
        return OK;
    }

    ORACLE_ERROR attestation_service::confirm(const uint64_t challenge_id, std::string_view identity, std::string_view signature, confirmation_stats &stats)
    {
        ledger::challenge_record challenge;
        if (settlement.get_challenge(challenge_id, challenge) != ledger::OK)
            return reject("confirm", challenge_id, CHALLENGE_NOT_FOUND);

        const uint64_t now = clock();
        if (ledger::derive_state(challenge, now) == ledger::CANCELLED)
            return reject("confirm", challenge_id, CHALLENGE_CANCELLED);

        if (now < challenge.end_time)
            return reject("confirm", challenge_id, CHALLENGE_NOT_ENDED);

        ledger::participant_record participant;
        if (settlement.get_participant(challenge_id, identity, participant) != ledger::OK)
            return reject("confirm", challenge_id, NOT_PARTICIPANT);

        {
            std::unordered_set<std::string> stored;
            std::scoped_lock<std::mutex> lock(db_mutex);
            if (store::get_confirmed_identities(db, challenge_id, stored) == -1)
                return STORAGE_FAILURE;
            if (stored.count(participant.identity) == 1)
                return reject("confirm", challenge_id, ALREADY_CONFIRMED);
        }

        if (settlement_msg::verify_confirmation(challenge_id, identity, signature) == -1)
            return reject("confirm", challenge_id, INVALID_SIGNATURE);

        {
            std::scoped_lock<std::mutex> lock(db_mutex);
            const int res = store::insert_confirmation(db, challenge_id, identity, signature, now);
            if (res == -1)
                return STORAGE_FAILURE;
            else if (res == 1) // Lost a race with a concurrent confirmation.
                return reject("confirm", challenge_id, ALREADY_CONFIRMED);
        }

        LOG_INFO << "Challenge " << challenge_id << " confirmed by " << util::to_hex(identity);
        return get_confirmation_stats(challenge_id, stats);
    }

    ORACLE_ERROR attestation_service::get_confirmation_stats(const uint64_t challenge_id, confirmation_stats &stats)
    {
        std::vector<ledger::participant_record> participants;
        if (settlement.get_participants(challenge_id, participants) != ledger::OK)
            return CHALLENGE_NOT_FOUND;

        std::unordered_set<std::string> confirmed;
        return load_confirmations(challenge_id, participants, confirmed, stats);
    }

    /**
     * Stores a mileage figure for a participant directly, bypassing the mileage source.
     */
    ORACLE_ERROR attestation_service::record_mileage(const uint64_t challenge_id, std::string_view identity, const double miles)
    {
        if (!is_valid_mileage(miles))
            return reject("record_mileage", challenge_id, INVALID_MILEAGE);

        ledger::participant_record participant;
        const ledger::LEDGER_ERROR lerr = settlement.get_participant(challenge_id, identity, participant);
        if (lerr == ledger::CHALLENGE_NOT_FOUND)
            return reject("record_mileage", challenge_id, CHALLENGE_NOT_FOUND);
        else if (lerr != ledger::OK)
            return reject("record_mileage", challenge_id, NOT_PARTICIPANT);

        mileage_snapshot snapshot;
        snapshot.challenge_id = challenge_id;
        snapshot.identity = participant.identity;
        snapshot.correlation_id = participant.correlation_id;
        snapshot.centimiles = to_centimiles(miles);
        snapshot.sample_count = 1;
        snapshot.taken_at = clock();

        std::scoped_lock<std::mutex> lock(db_mutex);
        if (store::insert_snapshot(db, snapshot) == -1)
            return STORAGE_FAILURE;

        return OK;
    }

    /**
     * Fetches and stores the current mileage of every participant of a challenge. The fetch window runs from the
     * challenge start to the earlier of now and the challenge end. Failure to fetch one participant's mileage is
     * counted in the result and does not stop the sync.
     */
    ORACLE_ERROR attestation_service::sync_challenge(const uint64_t challenge_id, sync_result &result)
    {
        ledger::challenge_record challenge;
        std::vector<ledger::participant_record> participants;
        if (settlement.get_challenge(challenge_id, challenge) != ledger::OK ||
            settlement.get_participants(challenge_id, participants) != ledger::OK)
            return reject("sync_challenge", challenge_id, CHALLENGE_NOT_FOUND);

        const uint64_t now = clock();
        if (ledger::derive_state(challenge, now) == ledger::CANCELLED)
            return reject("sync_challenge", challenge_id, CHALLENGE_CANCELLED);

        const uint64_t window_start = challenge.start_time;
        const uint64_t window_end = std::max(window_start, std::min(now, challenge.end_time));

        result = sync_result{};
        result.challenge_id = challenge_id;
        result.total = participants.size();

        for (const ledger::participant_record &p : participants)
        {
            mileage_reading reading;
            const ORACLE_ERROR err = fetch_with_timeout(challenge_id, p.identity, p.correlation_id, window_start, window_end, reading);
            if (err == FETCH_TIMEOUT)
            {
                result.timeouts++;
                continue;
            }
            else if (err != OK)
            {
                result.errors++;
                continue;
            }

            mileage_snapshot snapshot;
            snapshot.challenge_id = challenge_id;
            snapshot.identity = p.identity;
            snapshot.correlation_id = p.correlation_id;
            snapshot.centimiles = to_centimiles(reading.miles);
            snapshot.sample_count = reading.sample_count;
            snapshot.taken_at = clock();

            std::scoped_lock<std::mutex> lock(db_mutex);
            if (store::insert_snapshot(db, snapshot) == -1)
                return STORAGE_FAILURE;
            result.synced++;
        }

        LOG_INFO << "Challenge " << challenge_id << " mileage synced: " << result.synced << "/" << result.total
                 << " (timeouts: " << result.timeouts << ", errors: " << result.errors << ")";
        return OK;
    }

    /**
     * Syncs every challenge that is running or awaiting finalization, is not yet decided, and whose stakes are not
     * yet open for emergency withdrawal.
     */
    ORACLE_ERROR attestation_service::sync_active_challenges(std::vector<sync_result> &results)
    {
        const uint64_t count = settlement.challenge_count();
        for (uint64_t id = 0; id < count; id++)
        {
            if (is_shutting_down)
                break;

            ledger::challenge_record challenge;
            if (settlement.get_challenge(id, challenge) != ledger::OK)
                continue;

            const uint64_t now = clock();
            const ledger::CHALLENGE_STATE state = ledger::derive_state(challenge, now);
            if ((state != ledger::ACTIVE && state != ledger::GRACE_PERIOD) ||
                now >= challenge.end_time + ledger::EMERGENCY_PERIOD)
                continue;

            decision_record decision;
            int decided;
            {
                std::scoped_lock<std::mutex> lock(db_mutex);
                decided = store::get_decision(db, id, decision);
            }
            if (decided == -1)
                return STORAGE_FAILURE;
            else if (decided == 1)
                continue;

            sync_result result;
            const ORACLE_ERROR err = sync_challenge(id, result);
            if (err == STORAGE_FAILURE)
                return err;
            else if (err == OK)
                results.push_back(result);
        }

        return OK;
    }

    /**
     * Current standing of the participants, highest mileage first. Equal mileage keeps join order.
     */
    ORACLE_ERROR attestation_service::get_leaderboard(const uint64_t challenge_id, std::vector<participant_result> &leaderboard)
    {
        std::vector<ledger::participant_record> participants;
        if (settlement.get_participants(challenge_id, participants) != ledger::OK)
            return CHALLENGE_NOT_FOUND;

        std::unordered_set<std::string> confirmed;
        confirmation_stats stats;
        if (load_confirmations(challenge_id, participants, confirmed, stats) != OK)
            return STORAGE_FAILURE;

        std::unordered_map<std::string, mileage_snapshot> snapshots;
        {
            std::scoped_lock<std::mutex> lock(db_mutex);
            if (store::get_latest_snapshots(db, challenge_id, snapshots) == -1)
                return STORAGE_FAILURE;
        }

        leaderboard.clear();
        for (const ledger::participant_record &p : participants)
        {
            const auto itr = snapshots.find(p.identity);
            leaderboard.push_back(participant_result{p.identity, p.correlation_id,
                                                     itr == snapshots.end() ? 0 : itr->second.centimiles,
                                                     confirmed.count(p.identity) == 1});
        }

        std::stable_sort(leaderboard.begin(), leaderboard.end(), [](const participant_result &a, const participant_result &b) {
            return a.centimiles > b.centimiles;
        });
        return OK;
    }

    /**
     * Decides the winner from the latest snapshots and locks the decision in. If a decision was already stored
     * the stored one is returned instead.
     * Participants without a snapshot have 0 miles. On equal mileage the participant who joined first wins.
     */
    ORACLE_ERROR attestation_service::make_decision(const ledger::challenge_record &challenge, const std::vector<ledger::participant_record> &participants,
                                                    const std::unordered_set<std::string> &confirmed, const FINALIZATION_REASON reason,
                                                    const uint64_t now, decision_record &decision)
    {
        std::unordered_map<std::string, mileage_snapshot> snapshots;
        {
            std::scoped_lock<std::mutex> lock(db_mutex);
            if (store::get_latest_snapshots(db, challenge.id, snapshots) == -1)
                return STORAGE_FAILURE;
        }

        if (snapshots.empty())
            return reject("request_finalization", challenge.id, NO_MILEAGE_DATA);

        // participants are in join order.
        std::vector<participant_result> results;
        size_t winner_idx = 0;
        for (const ledger::participant_record &p : participants)
        {
            const auto itr = snapshots.find(p.identity);
            results.push_back(participant_result{p.identity, p.correlation_id,
                                                 itr == snapshots.end() ? 0 : itr->second.centimiles,
                                                 confirmed.count(p.identity) == 1});

            if (results.back().centimiles > results[winner_idx].centimiles)
                winner_idx = results.size() - 1;
        }

        decision_record candidate;
        candidate.challenge_id = challenge.id;
        candidate.winner = results[winner_idx].identity;
        candidate.results = serialize_results(results);
        candidate.result_hash = crypto::get_hash(candidate.results);
        candidate.reason = reason;
        candidate.decided_at = now;

        std::scoped_lock<std::mutex> lock(db_mutex);
        if (store::save_decision(db, candidate) == -1 || store::get_decision(db, challenge.id, decision) != 1)
            return STORAGE_FAILURE;

        LOG_INFO << "Challenge " << challenge.id << " decided (" << reason_to_string(decision.reason) << "). Winner: "
                 << util::to_hex(decision.winner) << " with " << results[winner_idx].centimiles << " centimiles";
        return OK;
    }

    /**
     * Attests the result of an ended challenge if it may be attested now.
     * A challenge may be attested once every participant has confirmed, or once the grace period after its end
     * has passed. Otherwise result.status carries the refusal and OK is returned. Each attestation carries a
     * fresh signing timestamp but every attestation of a challenge names the same winner and result hash.
     */
    ORACLE_ERROR attestation_service::request_finalization(const uint64_t challenge_id, finalization_result &result)
    {
        ledger::challenge_record challenge;
        if (settlement.get_challenge(challenge_id, challenge) != ledger::OK)
            return reject("request_finalization", challenge_id, CHALLENGE_NOT_FOUND);

        const uint64_t now = clock();
        if (ledger::derive_state(challenge, now) == ledger::CANCELLED)
            return reject("request_finalization", challenge_id, CHALLENGE_CANCELLED);

        result = finalization_result{};
        if (now < challenge.end_time)
        {
            result.status = NOT_ENDED;
            result.time_remaining = challenge.end_time - now;
            return OK;
        }

        std::vector<ledger::participant_record> participants;
        if (settlement.get_participants(challenge_id, participants) != ledger::OK)
            return reject("request_finalization", challenge_id, CHALLENGE_NOT_FOUND);

        if (participants.empty())
            return reject("request_finalization", challenge_id, NO_PARTICIPANTS);

        std::unordered_set<std::string> confirmed;
        if (load_confirmations(challenge_id, participants, confirmed, result.stats) != OK)
            return STORAGE_FAILURE;

        const bool grace_expired = (now - challenge.end_time) >= GRACE_PERIOD;
        if (!result.stats.all_confirmed() && !grace_expired)
        {
            result.status = AWAITING_CONFIRMATIONS;
            result.time_remaining = challenge.end_time + GRACE_PERIOD - now;
            return OK;
        }

        const std::shared_ptr<std::mutex> signing_lock = get_signing_lock(challenge_id);
        std::scoped_lock<std::mutex> lock(*signing_lock);

        decision_record decision;
        int decided;
        {
            std::scoped_lock<std::mutex> db_lock(db_mutex);
            decided = store::get_decision(db, challenge_id, decision);
        }

        if (decided == -1)
            return STORAGE_FAILURE;

        if (decided == 0)
        {
            const FINALIZATION_REASON reason = result.stats.all_confirmed() ? ALL_CONFIRMED : GRACE_PERIOD_EXPIRED;
            const ORACLE_ERROR err = make_decision(challenge, participants, confirmed, reason, now, decision);
            if (err != OK)
                return err;
        }

        if (parse_results(decision.results, result.participants) == -1)
            return STORAGE_FAILURE;

        result.status = ATTESTED;
        result.reason = decision.reason;
        result.results = decision.results;
        result.attestation.challenge_id = challenge_id;
        result.attestation.winner = decision.winner;
        result.attestation.result_hash = decision.result_hash;
        result.attestation.signing_timestamp = now;
        result.attestation.signature = settlement_msg::sign_finalization(challenge_id, decision.winner, decision.result_hash, now, attester_seckey);

        LOG_INFO << "Challenge " << challenge_id << " attested at " << now;
        return OK;
    }

    /**
     * Canonical results string the result hash is computed over. A compact json array in join order, with
     * identities in hex and mileage in centimiles.
     */
    const std::string serialize_results(const std::vector<participant_result> &results)
    {
        jsoncons::ojson arr(jsoncons::json_array_arg);
        for (const participant_result &r : results)
        {
            jsoncons::ojson item;
            item.insert_or_assign("identity", util::to_hex(r.identity));
            item.insert_or_assign("correlation_id", r.correlation_id);
            item.insert_or_assign("centimiles", r.centimiles);
            item.insert_or_assign("confirmed", r.confirmed);
            arr.push_back(std::move(item));
        }

        std::string str;
        arr.dump(str);
        return str;
    }

    int parse_results(std::string_view results_str, std::vector<participant_result> &results)
    {
        try
        {
            const jsoncons::ojson arr = jsoncons::ojson::parse(results_str, jsoncons::strict_json_parsing());
            results.clear();
            for (const auto &item : arr.array_range())
            {
                results.push_back(participant_result{util::to_bin(item["identity"].as<std::string>()),
                                                     item["correlation_id"].as<std::string>(),
                                                     item["centimiles"].as<uint64_t>(),
                                                     item["confirmed"].as<bool>()});
            }
        }
        catch (const std::exception &e)
        {
            LOG_ERROR << "Invalid stored results. " << e.what();
            return -1;
        }

        return 0;
    }

} // namespace oracle
