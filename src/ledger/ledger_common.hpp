#ifndef _STC_LEDGER_LEDGER_COMMON_
#define _STC_LEDGER_LEDGER_COMMON_

#include "../pchheader.hpp"

namespace ledger
{
    constexpr const char *LEDGER_DB = "ledger.sqlite";

    constexpr uint64_t DAY_SECONDS = 24 * 60 * 60;

    // Once end + EMERGENCY_PERIOD is reached, any participant may pull back their own stake unilaterally.
    constexpr uint64_t EMERGENCY_PERIOD = 14 * DAY_SECONDS;

    // Attestations signed longer ago than this are rejected.
    constexpr uint64_t ATTESTATION_MAX_AGE = 30 * DAY_SECONDS;

    /**
     * Lifecycle states of a challenge. PENDING, ACTIVE and GRACE_PERIOD are projections of time and participant
     * count. FINALIZED, COMPLETED and CANCELLED are only ever reached by a recorded write and stay put afterwards.
     * Numeric values are persisted.
     */
    enum CHALLENGE_STATE
    {
        PENDING = 0,
        ACTIVE = 1,
        GRACE_PERIOD = 2,
        FINALIZED = 3,
        CANCELLED = 4,
        COMPLETED = 5
    };

    /**
     * Result codes of settlement ledger operations. Every rejection names the precondition that failed.
     */
    enum LEDGER_ERROR
    {
        OK = 0,
        INVALID_PARAMETERS,
        CHALLENGE_NOT_FOUND,
        NOT_ELIGIBLE,
        NOT_ACCEPTING_PARTICIPANTS,
        REGISTRATION_CLOSED,
        WRONG_STAKE_AMOUNT,
        ALREADY_JOINED,
        INVALID_CORRELATION_ID,
        CHALLENGE_SETTLED,
        NOT_IN_GRACE_PERIOD,
        CLAIM_WINDOW_CLOSED,
        NOT_WINNER,
        NOT_PARTICIPANT,
        INVALID_RESULT_HASH,
        ATTESTATION_FROM_FUTURE,
        ATTESTATION_EXPIRED,
        INVALID_SIGNATURE,
        NOT_FINALIZED,
        CANNOT_CANCEL,
        WRONG_SIGNATURE_COUNT,
        DUPLICATE_SIGNER,
        NOT_CANCELLED,
        NO_STAKE_TO_WITHDRAW,
        EMERGENCY_PERIOD_NOT_REACHED,
        UNAUTHORIZED,
        STORAGE_FAILURE
    };

    /**
     * A competition instance. Parameters are fixed at creation. 'state' is the last recorded state and is only
     * authoritative when it is terminal. Use effective state for every decision.
     */
    struct challenge_record
    {
        uint64_t id = 0;
        std::string creator;               // Creator binary pubkey.
        uint64_t start_time = 0;           // Epoch seconds.
        uint64_t end_time = 0;             // Epoch seconds.
        uint64_t stake_amount = 0;         // Fixed stake per participant in base units.
        uint64_t total_staked = 0;         // Sum of live stakes held in escrow.
        CHALLENGE_STATE state = PENDING;   // Recorded state.
        std::string winner;                // Empty until settled.
        std::string result_hash;           // Empty until attested.
        uint64_t participant_count = 0;    // No. of identities that have joined.
        std::vector<std::string> whitelist; // Creator first, then the other eligible identities in given order.
    };

    /**
     * One identity's relationship to one challenge. The record is kept after the stake is paid out or withdrawn.
     */
    struct participant_record
    {
        std::string identity;       // Participant binary pubkey.
        std::string correlation_id; // Activity service id supplied at join.
        uint64_t stake = 0;         // Stake currently held. 0 once withdrawn or paid out.
        bool joined = false;
        uint64_t join_seq = 0;      // Position in the challenge join order (0 based).
        uint64_t joined_at = 0;     // Epoch seconds.
    };

    /**
     * Signed off-ledger statement naming a winner and a result commitment. Consumed by claim/finalize.
     */
    struct attestation
    {
        uint64_t challenge_id = 0;
        std::string winner;            // Winner binary pubkey.
        std::string result_hash;       // Commitment to the full result set.
        uint64_t signing_timestamp = 0; // Epoch seconds at signing.
        std::string signature;         // Attester signature over the finalize message.
    };

    /**
     * One participant's signature over the cancellation message. ed25519 signatures cannot be recovered to a
     * key, so the signer pubkey travels with the signature.
     */
    struct consent_signature
    {
        std::string signer;
        std::string signature;
    };

    /**
     * Single slot holding the currently registered attester key. The version is bumped on each update.
     */
    struct attester_config
    {
        std::string pubkey;
        uint64_t version = 0;
    };

    /**
     * Funds held on behalf of one identity across all challenges. Deposits are stakes paid in at join. Released
     * funds are stakes or prizes paid back out of escrow.
     */
    struct fund_balance
    {
        uint64_t deposited = 0;
        uint64_t released = 0;
    };

    const char *error_to_string(const LEDGER_ERROR error);

    const char *state_to_string(const CHALLENGE_STATE state);

    bool is_terminal(const CHALLENGE_STATE state);

} // namespace ledger

#endif
