#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../util/sqlite.hpp"
#include "../util/util.hpp"
#include "ledger.hpp"
#include "ledger_store.hpp"
#include "settlement_msg.hpp"

namespace ledger
{
    namespace sql = util::sqlite;

    /**
     * Logs the rejection of a ledger operation and passes the error through.
     */
    LEDGER_ERROR reject(const char *op, const uint64_t challenge_id, const LEDGER_ERROR error)
    {
        LOG_DEBUG << op << " rejected for challenge " << challenge_id << ": " << error_to_string(error);
        return error;
    }

    LEDGER_ERROR reject(const char *op, const LEDGER_ERROR error)
    {
        LOG_DEBUG << op << " rejected: " << error_to_string(error);
        return error;
    }

    /**
     * Effective lifecycle state of a challenge at the given time. Depends on nothing but its arguments.
     */
    CHALLENGE_STATE derive_state(const challenge_record &challenge, const uint64_t now)
    {
        // Recorded terminal states never change with time.
        if (is_terminal(challenge.state))
            return challenge.state;

        // Under-subscribed when the start arrives.
        if (challenge.state == PENDING && now >= challenge.start_time && challenge.participant_count < challenge.whitelist.size())
            return CANCELLED;

        if (now >= challenge.end_time)
            return GRACE_PERIOD;

        if (now >= challenge.start_time)
            return ACTIVE;

        return PENDING;
    }

    settlement_ledger::settlement_ledger(clock_fn clock) : clock(std::move(clock))
    {
    }

    settlement_ledger::~settlement_ledger()
    {
        deinit();
    }

    /**
     * Opens (or creates) the ledger db and loads the full ledger image into memory.
     * @param db_path Path to the sqlite db. ":memory:" gives a throwaway ledger.
     * @param initial_attester_key Attester registered when the ledger is created. Ignored for an existing ledger,
     *                             whose attester slot is owned by the ledger itself.
     * @return 0 on success. -1 on failure.
     */
    int settlement_ledger::init(std::string_view db_path, std::string_view initial_attester_key)
    {
        if (sql::open_db(db_path, &db) == -1)
        {
            LOG_ERROR << "Error opening ledger db " << db_path;
            return -1;
        }

        if (!sql::is_table_exists(db, "meta"))
        {
            if (!crypto::is_valid_pubkey(initial_attester_key))
            {
                LOG_ERROR << "Invalid initial attester key for new ledger.";
                sql::close_db(&db);
                return -1;
            }

            attester.pubkey = initial_attester_key;
            attester.version = 1;
            if (write_transaction([&]() {
                    return (store::create_schema(db) == -1 || store::save_attester(db, attester) == -1) ? -1 : 0;
                }) == -1)
            {
                LOG_ERROR << "Error creating ledger schema.";
                sql::close_db(&db);
                return -1;
            }

            LOG_INFO << "New settlement ledger created. Attester: " << util::to_hex(attester.pubkey);
        }
        else
        {
            std::vector<challenge_record> records;
            if (store::check_version(db) == -1 ||
                store::load_attester(db, attester) != 1 ||
                store::load_challenges(db, records) == -1 ||
                store::load_balances(db, balances) == -1)
            {
                LOG_ERROR << "Error loading settlement ledger.";
                sql::close_db(&db);
                return -1;
            }

            for (challenge_record &record : records)
            {
                auto slot = std::make_unique<challenge_slot>();
                if (store::load_participants(db, record.id, slot->participants) == -1)
                {
                    LOG_ERROR << "Error loading participants of challenge " << record.id;
                    sql::close_db(&db);
                    return -1;
                }

                for (size_t i = 0; i < slot->participants.size(); i++)
                    slot->participant_index.emplace(slot->participants[i].identity, i);

                slot->record = std::move(record);
                challenges.push_back(std::move(slot));
            }

            if (attester.pubkey != initial_attester_key)
                LOG_INFO << "Ledger attester key (v" << attester.version << ") differs from configured key. Using ledger key.";

            LOG_INFO << "Settlement ledger loaded. Challenges: " << challenges.size();
        }

        init_success = true;
        return 0;
    }

    void settlement_ledger::deinit()
    {
        if (db != NULL)
            sql::close_db(&db);
        init_success = false;
    }

    settlement_ledger::challenge_slot *settlement_ledger::get_slot(const uint64_t challenge_id)
    {
        std::shared_lock lock(challenges_mutex);
        if (challenge_id >= challenges.size())
            return NULL;

        // Slots are never removed so the pointer outlives the lock.
        return challenges[challenge_id].get();
    }

    /**
     * Runs the given db writes inside one sqlite transaction. write_mutex must be held by the caller
     * (except during init, before the ledger is shared).
     * @return 0 if all writes were committed. -1 if rolled back.
     */
    int settlement_ledger::write_transaction(const std::function<int()> &db_writes)
    {
        if (sql::begin_transaction(db) == -1)
            return -1;

        if (db_writes() == -1 || sql::commit_transaction(db) == -1)
        {
            if (sql::rollback_transaction(db) == -1)
                LOG_ERROR << "Ledger transaction rollback failed.";
            return -1;
        }

        return 0;
    }

    // write_mutex must be held.
    const fund_balance settlement_ledger::get_balance(const std::string &identity) const
    {
        const auto itr = balances.find(identity);
        return itr == balances.end() ? fund_balance{} : itr->second;
    }

    LEDGER_ERROR settlement_ledger::create_challenge(std::string_view creator, const uint64_t start_time, const uint64_t end_time, const uint64_t stake_amount,
                                                     const std::vector<std::string> &other_eligible, uint64_t &challenge_id)
    {
        const uint64_t now = clock();

        if (!crypto::is_valid_pubkey(creator) ||
            start_time <= now ||
            end_time <= start_time ||
            end_time > std::numeric_limits<uint64_t>::max() - EMERGENCY_PERIOD ||
            stake_amount == 0 ||
            other_eligible.empty())
            return reject("create_challenge", INVALID_PARAMETERS);

        challenge_record record;
        record.creator = creator;
        record.start_time = start_time;
        record.end_time = end_time;
        record.stake_amount = stake_amount;
        record.state = PENDING;
        record.whitelist.reserve(other_eligible.size() + 1);
        record.whitelist.push_back(record.creator);

        std::unordered_set<std::string> seen{record.creator};
        for (const std::string &identity : other_eligible)
        {
            if (!crypto::is_valid_pubkey(identity) || !seen.emplace(identity).second)
                return reject("create_challenge", INVALID_PARAMETERS);
            record.whitelist.push_back(identity);
        }

        // The pool of a fully subscribed challenge must fit in 64 bits.
        if (stake_amount > std::numeric_limits<uint64_t>::max() / record.whitelist.size())
            return reject("create_challenge", INVALID_PARAMETERS);

        std::unique_lock challenges_lock(challenges_mutex);
        std::scoped_lock<std::mutex> lock(write_mutex);

        record.id = challenges.size();
        if (write_transaction([&]() { return store::insert_challenge(db, record); }) == -1)
            return STORAGE_FAILURE;

        auto slot = std::make_unique<challenge_slot>();
        slot->record = record;
        challenges.push_back(std::move(slot));

        challenge_id = record.id;
        event_queue.enqueue(challenge_created_event{record.id, record.creator, start_time, end_time, stake_amount});
        LOG_INFO << "Challenge " << record.id << " created. Stake: " << stake_amount << " Eligible: " << record.whitelist.size();
        return OK;
    }

    /**
     * Reads the effective state of a challenge. Never writes.
     */
    LEDGER_ERROR settlement_ledger::effective_state(const uint64_t challenge_id, CHALLENGE_STATE &state)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return CHALLENGE_NOT_FOUND;

        std::scoped_lock<std::mutex> lock(slot->mutex);
        state = derive_state(slot->record, clock());
        return OK;
    }

    LEDGER_ERROR settlement_ledger::join(const uint64_t challenge_id, std::string_view caller, std::string_view correlation_id, const uint64_t stake_value)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("join", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);
        const uint64_t now = clock();
        challenge_record &challenge = slot->record;

        if (std::find(challenge.whitelist.begin(), challenge.whitelist.end(), caller) == challenge.whitelist.end())
            return reject("join", challenge_id, NOT_ELIGIBLE);

        if (derive_state(challenge, now) != PENDING)
            return reject("join", challenge_id, NOT_ACCEPTING_PARTICIPANTS);

        if (now >= challenge.start_time)
            return reject("join", challenge_id, REGISTRATION_CLOSED);

        if (stake_value != challenge.stake_amount)
            return reject("join", challenge_id, WRONG_STAKE_AMOUNT);

        const std::string identity(caller);
        if (slot->participant_index.count(identity) == 1)
            return reject("join", challenge_id, ALREADY_JOINED);

        if (correlation_id.empty())
            return reject("join", challenge_id, INVALID_CORRELATION_ID);

        participant_record participant;
        participant.identity = identity;
        participant.correlation_id = correlation_id;
        participant.stake = stake_value;
        participant.joined = true;
        participant.join_seq = challenge.participant_count;
        participant.joined_at = now;

        challenge_record updated = challenge;
        updated.participant_count++;
        updated.total_staked += stake_value;

        std::scoped_lock<std::mutex> write_lock(write_mutex);
        fund_balance balance = get_balance(identity);
        balance.deposited += stake_value;

        if (write_transaction([&]() {
                return (store::insert_participant(db, challenge_id, participant) == -1 ||
                        store::update_challenge(db, updated) == -1 ||
                        store::save_balance(db, identity, balance) == -1)
                           ? -1
                           : 0;
            }) == -1)
            return STORAGE_FAILURE;

        challenge = std::move(updated);
        slot->participant_index.emplace(identity, slot->participants.size());
        slot->participants.push_back(participant);
        balances[identity] = balance;

        event_queue.enqueue(participant_joined_event{challenge_id, identity, participant.correlation_id, stake_value});
        LOG_INFO << "Participant " << util::to_hex(identity).substr(0, 10) << " joined challenge " << challenge_id
                 << " (" << challenge.participant_count << "/" << challenge.whitelist.size() << ")";
        return OK;
    }

    /**
     * Checks an attestation against the challenge. A non empty claimant must be the attested winner.
     */
    LEDGER_ERROR settlement_ledger::validate_attestation(const challenge_slot &slot, const attestation &att, std::string_view claimant, const uint64_t now)
    {
        const challenge_record &challenge = slot.record;
        const CHALLENGE_STATE state = derive_state(challenge, now);

        if (is_terminal(state))
            return CHALLENGE_SETTLED;

        if (state != GRACE_PERIOD)
            return NOT_IN_GRACE_PERIOD;

        if (now >= challenge.end_time + EMERGENCY_PERIOD)
            return CLAIM_WINDOW_CLOSED;

        if (!claimant.empty() && claimant != att.winner)
            return NOT_WINNER;

        if (slot.participant_index.count(att.winner) == 0)
            return NOT_PARTICIPANT;

        if (att.result_hash.empty())
            return INVALID_RESULT_HASH;

        if (att.signing_timestamp > now)
            return ATTESTATION_FROM_FUTURE;

        if (now - att.signing_timestamp >= ATTESTATION_MAX_AGE)
            return ATTESTATION_EXPIRED;

        // The signature must bind this ledger's challenge id, whatever id the attestation claims.
        attestation bound = att;
        bound.challenge_id = challenge.id;

        std::string attester_key;
        {
            std::scoped_lock<std::mutex> lock(write_mutex);
            attester_key = attester.pubkey;
        }

        if (settlement_msg::verify_finalization(bound, attester_key) == -1)
            return INVALID_SIGNATURE;

        return OK;
    }

    /**
     * Moves the whole pool to the recipient and marks the challenge COMPLETED. 'updated' carries any other field
     * changes (winner, result hash) that must be written in the same transaction. Slot lock must be held.
     * @param is_finalizing Whether this payout also records the attested result (combined claim).
     */
    LEDGER_ERROR settlement_ledger::pay_out_pool(challenge_slot &slot, challenge_record &updated, std::string_view recipient, const bool is_finalizing)
    {
        const uint64_t prize = updated.total_staked;
        updated.total_staked = 0;
        updated.state = COMPLETED;

        const std::string identity(recipient);

        std::scoped_lock<std::mutex> lock(write_mutex);
        fund_balance balance = get_balance(identity);
        balance.released += prize;

        if (write_transaction([&]() {
                if (store::update_challenge(db, updated) == -1)
                    return -1;

                for (const participant_record &p : slot.participants)
                {
                    if (p.stake > 0 && store::update_participant_stake(db, updated.id, p.identity, 0) == -1)
                        return -1;
                }

                return store::save_balance(db, identity, balance);
            }) == -1)
            return STORAGE_FAILURE;

        slot.record = updated;
        for (participant_record &p : slot.participants)
            p.stake = 0;
        balances[identity] = balance;

        if (is_finalizing)
            event_queue.enqueue(challenge_finalized_event{updated.id, updated.winner, updated.result_hash});
        event_queue.enqueue(challenge_completed_event{updated.id, identity, prize});
        LOG_INFO << "Challenge " << updated.id << " completed. Prize " << prize << " paid to " << util::to_hex(identity).substr(0, 10);
        return OK;
    }

    /**
     * Finalizes and pays out in one step. The attestation is the only authorization needed.
     */
    LEDGER_ERROR settlement_ledger::claim_with_attestation(const uint64_t challenge_id, std::string_view claimant, const attestation &att)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("claim_with_attestation", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);

        if (claimant.empty())
            return reject("claim_with_attestation", challenge_id, NOT_WINNER);

        const LEDGER_ERROR res = validate_attestation(*slot, att, claimant, clock());
        if (res != OK)
            return reject("claim_with_attestation", challenge_id, res);

        challenge_record updated = slot->record;
        updated.winner = att.winner;
        updated.result_hash = att.result_hash;

        return pay_out_pool(*slot, updated, claimant, true);
    }

    /**
     * Records the attested winner without paying out. Anyone may submit the attestation.
     */
    LEDGER_ERROR settlement_ledger::finalize(const uint64_t challenge_id, const attestation &att)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("finalize", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);

        const LEDGER_ERROR res = validate_attestation(*slot, att, {}, clock());
        if (res != OK)
            return reject("finalize", challenge_id, res);

        challenge_record updated = slot->record;
        updated.state = FINALIZED;
        updated.winner = att.winner;
        updated.result_hash = att.result_hash;

        {
            std::scoped_lock<std::mutex> write_lock(write_mutex);
            if (write_transaction([&]() { return store::update_challenge(db, updated); }) == -1)
                return STORAGE_FAILURE;
        }

        slot->record = std::move(updated);
        event_queue.enqueue(challenge_finalized_event{challenge_id, att.winner, att.result_hash});
        LOG_INFO << "Challenge " << challenge_id << " finalized. Winner: " << util::to_hex(att.winner).substr(0, 10);
        return OK;
    }

    LEDGER_ERROR settlement_ledger::claim_prize(const uint64_t challenge_id, std::string_view caller)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("claim_prize", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);
        const CHALLENGE_STATE state = derive_state(slot->record, clock());

        if (state == COMPLETED || state == CANCELLED)
            return reject("claim_prize", challenge_id, CHALLENGE_SETTLED);

        if (state != FINALIZED)
            return reject("claim_prize", challenge_id, NOT_FINALIZED);

        if (caller.empty() || caller != slot->record.winner)
            return reject("claim_prize", challenge_id, NOT_WINNER);

        challenge_record updated = slot->record;
        return pay_out_pool(*slot, updated, caller, false);
    }

    /**
     * Cancels the challenge with one valid consent signature from every joined participant.
     */
    LEDGER_ERROR settlement_ledger::cancel_by_consent(const uint64_t challenge_id, const std::vector<consent_signature> &signatures)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("cancel_by_consent", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);
        const CHALLENGE_STATE state = derive_state(slot->record, clock());

        if ((state != PENDING && state != ACTIVE && state != GRACE_PERIOD) || slot->record.participant_count == 0)
            return reject("cancel_by_consent", challenge_id, CANNOT_CANCEL);

        if (signatures.size() != slot->record.participant_count)
            return reject("cancel_by_consent", challenge_id, WRONG_SIGNATURE_COUNT);

        for (size_t i = 0; i < signatures.size(); i++)
        {
            const consent_signature &consent = signatures[i];

            if (slot->participant_index.count(consent.signer) == 0 ||
                settlement_msg::verify_cancel_consent(challenge_id, consent) == -1)
                return reject("cancel_by_consent", challenge_id, INVALID_SIGNATURE);

            for (size_t j = 0; j < i; j++)
            {
                if (signatures[j].signer == consent.signer)
                    return reject("cancel_by_consent", challenge_id, DUPLICATE_SIGNER);
            }
        }

        challenge_record updated = slot->record;
        updated.state = CANCELLED;

        {
            std::scoped_lock<std::mutex> write_lock(write_mutex);
            if (write_transaction([&]() { return store::update_challenge(db, updated); }) == -1)
                return STORAGE_FAILURE;
        }

        slot->record = std::move(updated);
        event_queue.enqueue(challenge_cancelled_event{challenge_id});
        LOG_INFO << "Challenge " << challenge_id << " cancelled by consent of " << signatures.size() << " participants.";
        return OK;
    }

    /**
     * Returns the caller's stake to their released balance. Slot lock must be held.
     * @param materialize_cancel Whether to record CANCELLED in the same write (first withdrawal from an
     *                           under-subscribed challenge).
     */
    LEDGER_ERROR settlement_ledger::refund_stake(challenge_slot &slot, std::string_view caller, const bool materialize_cancel, const bool is_emergency)
    {
        const uint64_t challenge_id = slot.record.id;
        const auto itr = slot.participant_index.find(std::string(caller));
        if (itr == slot.participant_index.end() || slot.participants[itr->second].stake == 0)
            return reject(is_emergency ? "emergency_withdraw" : "withdraw_from_cancelled", challenge_id, NO_STAKE_TO_WITHDRAW);

        participant_record &participant = slot.participants[itr->second];
        const uint64_t amount = participant.stake;

        challenge_record updated = slot.record;
        updated.total_staked -= amount;
        if (materialize_cancel)
            updated.state = CANCELLED;

        std::scoped_lock<std::mutex> lock(write_mutex);
        fund_balance balance = get_balance(participant.identity);
        balance.released += amount;

        if (write_transaction([&]() {
                return (store::update_challenge(db, updated) == -1 ||
                        store::update_participant_stake(db, challenge_id, participant.identity, 0) == -1 ||
                        store::save_balance(db, participant.identity, balance) == -1)
                           ? -1
                           : 0;
            }) == -1)
            return STORAGE_FAILURE;

        slot.record = std::move(updated);
        participant.stake = 0;
        balances[participant.identity] = balance;

        if (materialize_cancel)
        {
            event_queue.enqueue(challenge_cancelled_event{challenge_id});
            LOG_INFO << "Challenge " << challenge_id << " cancelled. Under-subscribed at start.";
        }

        if (is_emergency)
        {
            event_queue.enqueue(emergency_withdrawal_event{challenge_id, participant.identity, amount});
            LOG_INFO << "Emergency withdrawal of " << amount << " from challenge " << challenge_id;
        }
        else
        {
            event_queue.enqueue(stake_withdrawn_event{challenge_id, participant.identity, amount});
            LOG_INFO << "Stake " << amount << " withdrawn from cancelled challenge " << challenge_id;
        }

        return OK;
    }

    LEDGER_ERROR settlement_ledger::withdraw_from_cancelled(const uint64_t challenge_id, std::string_view caller)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("withdraw_from_cancelled", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);

        if (derive_state(slot->record, clock()) != CANCELLED)
            return reject("withdraw_from_cancelled", challenge_id, NOT_CANCELLED);

        return refund_stake(*slot, caller, slot->record.state != CANCELLED, false);
    }

    /**
     * Unilateral stake recovery once the emergency period has opened. Needs no attester and no other participant.
     */
    LEDGER_ERROR settlement_ledger::emergency_withdraw(const uint64_t challenge_id, std::string_view caller)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return reject("emergency_withdraw", challenge_id, CHALLENGE_NOT_FOUND);

        std::scoped_lock<std::mutex> lock(slot->mutex);
        const uint64_t now = clock();

        if (is_terminal(derive_state(slot->record, now)))
            return reject("emergency_withdraw", challenge_id, CHALLENGE_SETTLED);

        if (now < slot->record.end_time + EMERGENCY_PERIOD)
            return reject("emergency_withdraw", challenge_id, EMERGENCY_PERIOD_NOT_REACHED);

        return refund_stake(*slot, caller, false, true);
    }

    /**
     * Replaces the attester key. Only the holder of the current key may do this.
     */
    LEDGER_ERROR settlement_ledger::update_attester_key(std::string_view caller, std::string_view new_key)
    {
        std::scoped_lock<std::mutex> lock(write_mutex);

        if (caller.empty() || caller != attester.pubkey)
            return reject("update_attester_key", UNAUTHORIZED);

        if (!crypto::is_valid_pubkey(new_key))
            return reject("update_attester_key", INVALID_PARAMETERS);

        attester_config updated;
        updated.pubkey = new_key;
        updated.version = attester.version + 1;

        if (write_transaction([&]() { return store::save_attester(db, updated); }) == -1)
            return STORAGE_FAILURE;

        const std::string old_key = attester.pubkey;
        attester = std::move(updated);

        event_queue.enqueue(attester_key_updated_event{old_key, attester.pubkey, attester.version});
        LOG_INFO << "Attester key updated to " << util::to_hex(attester.pubkey) << " (v" << attester.version << ")";
        return OK;
    }

    uint64_t settlement_ledger::challenge_count()
    {
        std::shared_lock lock(challenges_mutex);
        return challenges.size();
    }

    LEDGER_ERROR settlement_ledger::get_challenge(const uint64_t challenge_id, challenge_record &challenge)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return CHALLENGE_NOT_FOUND;

        std::scoped_lock<std::mutex> lock(slot->mutex);
        challenge = slot->record;
        return OK;
    }

    LEDGER_ERROR settlement_ledger::get_participant(const uint64_t challenge_id, std::string_view identity, participant_record &participant)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return CHALLENGE_NOT_FOUND;

        std::scoped_lock<std::mutex> lock(slot->mutex);
        const auto itr = slot->participant_index.find(std::string(identity));
        if (itr == slot->participant_index.end())
            return NOT_PARTICIPANT;

        participant = slot->participants[itr->second];
        return OK;
    }

    LEDGER_ERROR settlement_ledger::get_participants(const uint64_t challenge_id, std::vector<participant_record> &participants)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return CHALLENGE_NOT_FOUND;

        std::scoped_lock<std::mutex> lock(slot->mutex);
        participants = slot->participants;
        return OK;
    }

    LEDGER_ERROR settlement_ledger::get_whitelist(const uint64_t challenge_id, std::vector<std::string> &whitelist)
    {
        challenge_slot *slot = get_slot(challenge_id);
        if (slot == NULL)
            return CHALLENGE_NOT_FOUND;

        std::scoped_lock<std::mutex> lock(slot->mutex);
        whitelist = slot->record.whitelist;
        return OK;
    }

    const attester_config settlement_ledger::get_attester()
    {
        std::scoped_lock<std::mutex> lock(write_mutex);
        return attester;
    }

    uint64_t settlement_ledger::released_balance(const std::string &identity)
    {
        std::scoped_lock<std::mutex> lock(write_mutex);
        return get_balance(identity).released;
    }

    uint64_t settlement_ledger::deposited_balance(const std::string &identity)
    {
        std::scoped_lock<std::mutex> lock(write_mutex);
        return get_balance(identity).deposited;
    }

    uint64_t settlement_ledger::total_deposited()
    {
        std::scoped_lock<std::mutex> lock(write_mutex);
        uint64_t total = 0;
        for (const auto &[identity, balance] : balances)
            total += balance.deposited;
        return total;
    }

    uint64_t settlement_ledger::total_released()
    {
        std::scoped_lock<std::mutex> lock(write_mutex);
        uint64_t total = 0;
        for (const auto &[identity, balance] : balances)
            total += balance.released;
        return total;
    }

    /**
     * Pops the next recorded ledger event, if any.
     */
    bool settlement_ledger::try_pop_event(ledger_event &ev)
    {
        return event_queue.try_dequeue(ev);
    }

} // namespace ledger
