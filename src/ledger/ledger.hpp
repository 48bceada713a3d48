#ifndef _STC_LEDGER_LEDGER_
#define _STC_LEDGER_LEDGER_

#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "ledger_common.hpp"
#include "ledger_events.hpp"

namespace ledger
{
    // Source of the current time in epoch seconds.
    typedef std::function<uint64_t()> clock_fn;

    CHALLENGE_STATE derive_state(const challenge_record &challenge, const uint64_t now);

    /**
     * Escrow and lifecycle state machine of staked challenges.
     * Every operation recomputes the effective state from stored fields and the clock before deciding. Operations
     * on one challenge are serialized by that challenge's lock. A mutation is written to sqlite in one transaction
     * and the in-memory image is only updated after the commit succeeds, so a rejected or failed operation leaves
     * no trace.
     */
    class settlement_ledger
    {
    private:
        struct challenge_slot
        {
            std::mutex mutex;
            challenge_record record;
            std::vector<participant_record> participants;               // In join order.
            std::unordered_map<std::string, size_t> participant_index; // identity -> index in participants.
        };

        clock_fn clock;
        sqlite3 *db = NULL;
        bool init_success = false;

        std::shared_mutex challenges_mutex;
        std::vector<std::unique_ptr<challenge_slot>> challenges; // Indexed by challenge id.

        // Guards the db connection, balances and the attester slot.
        std::mutex write_mutex;
        std::unordered_map<std::string, fund_balance> balances;
        attester_config attester;

        moodycamel::ConcurrentQueue<ledger_event> event_queue;

        challenge_slot *get_slot(const uint64_t challenge_id);

        int write_transaction(const std::function<int()> &db_writes);

        const fund_balance get_balance(const std::string &identity) const;

        LEDGER_ERROR validate_attestation(const challenge_slot &slot, const attestation &att, std::string_view claimant, const uint64_t now);

        LEDGER_ERROR pay_out_pool(challenge_slot &slot, challenge_record &updated, std::string_view recipient, const bool is_finalizing);

        LEDGER_ERROR refund_stake(challenge_slot &slot, std::string_view caller, const bool materialize_cancel, const bool is_emergency);

    public:
        settlement_ledger(clock_fn clock = util::get_epoch_seconds);

        ~settlement_ledger();

        int init(std::string_view db_path, std::string_view initial_attester_key);

        void deinit();

        LEDGER_ERROR create_challenge(std::string_view creator, const uint64_t start_time, const uint64_t end_time, const uint64_t stake_amount,
                                      const std::vector<std::string> &other_eligible, uint64_t &challenge_id);

        LEDGER_ERROR effective_state(const uint64_t challenge_id, CHALLENGE_STATE &state);

        LEDGER_ERROR join(const uint64_t challenge_id, std::string_view caller, std::string_view correlation_id, const uint64_t stake_value);

        LEDGER_ERROR claim_with_attestation(const uint64_t challenge_id, std::string_view claimant, const attestation &att);

        LEDGER_ERROR finalize(const uint64_t challenge_id, const attestation &att);

        LEDGER_ERROR claim_prize(const uint64_t challenge_id, std::string_view caller);

        LEDGER_ERROR cancel_by_consent(const uint64_t challenge_id, const std::vector<consent_signature> &signatures);

        LEDGER_ERROR withdraw_from_cancelled(const uint64_t challenge_id, std::string_view caller);

        LEDGER_ERROR emergency_withdraw(const uint64_t challenge_id, std::string_view caller);

        LEDGER_ERROR update_attester_key(std::string_view caller, std::string_view new_key);

        uint64_t challenge_count();

        LEDGER_ERROR get_challenge(const uint64_t challenge_id, challenge_record &challenge);

        LEDGER_ERROR get_participant(const uint64_t challenge_id, std::string_view identity, participant_record &participant);

        LEDGER_ERROR get_participants(const uint64_t challenge_id, std::vector<participant_record> &participants);

        LEDGER_ERROR get_whitelist(const uint64_t challenge_id, std::vector<std::string> &whitelist);

        const attester_config get_attester();

        uint64_t released_balance(const std::string &identity);

        uint64_t deposited_balance(const std::string &identity);

        uint64_t total_deposited();

        uint64_t total_released();

        bool try_pop_event(ledger_event &ev);
    };

} // namespace ledger

#endif
