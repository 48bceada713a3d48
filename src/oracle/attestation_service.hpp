#ifndef _STC_ORACLE_ATTESTATION_SERVICE_
#define _STC_ORACLE_ATTESTATION_SERVICE_

#include "../pchheader.hpp"
#include "../ledger/ledger.hpp"
#include "mileage_source.hpp"
#include "oracle_common.hpp"

namespace oracle
{
    /**
     * Off-ledger side of settlement. Collects mileage snapshots and participant confirmations, decides the winner
     * of an ended challenge and signs the attestation the ledger verifies.
     * The service only reads the ledger. It never holds a lock while talking to the mileage source.
     */
    class attestation_service
    {
    private:
        ledger::settlement_ledger &settlement;
        std::shared_ptr<mileage_source> source;
        const std::string attester_seckey;
        ledger::clock_fn clock;

        sqlite3 *db = NULL;
        std::mutex db_mutex; // Serializes use of the db connection.

        uint32_t sync_interval = 0; // Seconds.
        uint32_t fetch_timeout = 0; // Milliseconds.

        // Signing is serialized per challenge so two concurrent requests always see the same locked decision.
        std::mutex signing_locks_mutex;
        std::unordered_map<uint64_t, std::shared_ptr<std::mutex>> signing_locks;

        // Fetches still running on their own threads, keyed by challenge and identity. Shared with those threads so it
        // outlives the service when a mileage source never returns.
        struct fetch_tracker
        {
            std::mutex mutex;
            std::condition_variable cv;
            std::unordered_set<std::string> in_flight;
        };
        std::shared_ptr<fetch_tracker> fetches = std::make_shared<fetch_tracker>();

        std::thread sweep_thread;
        std::atomic<bool> is_shutting_down = false;
        std::atomic<bool> sync_requested = false;
        bool is_sweep_running = false;
        bool init_success = false;

        std::shared_ptr<std::mutex> get_signing_lock(const uint64_t challenge_id);

        void sweep_loop();

        ORACLE_ERROR fetch_with_timeout(const uint64_t challenge_id, std::string_view identity, std::string_view correlation_id,
                                        const uint64_t window_start, const uint64_t window_end, mileage_reading &reading);

        ORACLE_ERROR load_confirmations(const uint64_t challenge_id, const std::vector<ledger::participant_record> &participants,
                                        std::unordered_set<std::string> &confirmed, confirmation_stats &stats);

        ORACLE_ERROR make_decision(const ledger::challenge_record &challenge, const std::vector<ledger::participant_record> &participants,
                                   const std::unordered_set<std::string> &confirmed, const FINALIZATION_REASON reason,
                                   const uint64_t now, decision_record &decision);

    public:
        attestation_service(ledger::settlement_ledger &settlement, std::shared_ptr<mileage_source> source,
                            std::string_view attester_seckey, ledger::clock_fn clock = util::get_epoch_seconds);

        ~attestation_service();

        int init(std::string_view db_path, const uint32_t sync_interval, const uint32_t fetch_timeout);

        void deinit();

        void start_sweep();

        void trigger_sync();

        size_t outstanding_fetches();

        ORACLE_ERROR confirm(const uint64_t challenge_id, std::string_view identity, std::string_view signature, confirmation_stats &stats);

        ORACLE_ERROR get_confirmation_stats(const uint64_t challenge_id, confirmation_stats &stats);

        ORACLE_ERROR record_mileage(const uint64_t challenge_id, std::string_view identity, const double miles);

        ORACLE_ERROR sync_challenge(const uint64_t challenge_id, sync_result &result);

        ORACLE_ERROR sync_active_challenges(std::vector<sync_result> &results);

        ORACLE_ERROR get_leaderboard(const uint64_t challenge_id, std::vector<participant_result> &leaderboard);

        ORACLE_ERROR request_finalization(const uint64_t challenge_id, finalization_result &result);
    };

    const std::string serialize_results(const std::vector<participant_result> &results);

    int parse_results(std::string_view results_str, std::vector<participant_result> &results);

} // namespace oracle

#endif
