#ifndef _STC_ORACLE_ORACLE_COMMON_
#define _STC_ORACLE_ORACLE_COMMON_

#include "../pchheader.hpp"
#include "../ledger/ledger_common.hpp"

namespace oracle
{
    constexpr const char *ORACLE_DB = "oracle.sqlite";

    // After end + GRACE_PERIOD the result may be attested without every participant's confirmation.
    constexpr uint64_t GRACE_PERIOD = 7 * ledger::DAY_SECONDS;

    // Mileage is held as integer hundredths of a mile.
    constexpr uint64_t CENTIMILES_PER_MILE = 100;

    /**
     * Result codes of attestation service operations. A "not yet" answer from request_finalization is not an
     * error. FETCH_TIMEOUT, FETCH_FAILED and NO_MILEAGE_DATA are transient and may be retried.
     */
    enum ORACLE_ERROR
    {
        OK = 0,
        CHALLENGE_NOT_FOUND,
        CHALLENGE_CANCELLED,
        CHALLENGE_NOT_ENDED,
        NOT_PARTICIPANT,
        NO_PARTICIPANTS,
        ALREADY_CONFIRMED,
        INVALID_SIGNATURE,
        INVALID_MILEAGE,
        NO_MILEAGE_DATA,
        FETCH_TIMEOUT,
        FETCH_FAILED,
        STORAGE_FAILURE
    };

    enum FINALIZATION_STATUS
    {
        ATTESTED,
        NOT_ENDED,
        AWAITING_CONFIRMATIONS
    };

    enum FINALIZATION_REASON
    {
        ALL_CONFIRMED,
        GRACE_PERIOD_EXPIRED
    };

    struct mileage_snapshot
    {
        uint64_t challenge_id = 0;
        std::string identity;
        std::string correlation_id;
        uint64_t centimiles = 0;
        uint64_t sample_count = 0;
        uint64_t taken_at = 0;
    };

    // One participant's line in the attested result set.
    struct participant_result
    {
        std::string identity;
        std::string correlation_id;
        uint64_t centimiles = 0;
        bool confirmed = false;
    };

    struct confirmation_stats
    {
        uint64_t confirmed_count = 0;
        uint64_t total_participants = 0;

        bool all_confirmed() const
        {
            return total_participants > 0 && confirmed_count == total_participants;
        }
    };

    struct sync_result
    {
        uint64_t challenge_id = 0;
        uint64_t synced = 0;   // Participants with a new snapshot.
        uint64_t timeouts = 0; // Fetches abandoned after the fetch timeout.
        uint64_t errors = 0;   // Other fetch failures.
        uint64_t total = 0;
    };

    /**
     * The first winner decision made for a challenge. Every later attestation re-signs this decision.
     */
    struct decision_record
    {
        uint64_t challenge_id = 0;
        std::string winner;
        std::string result_hash;
        std::string results; // Canonical results string the hash was computed over.
        FINALIZATION_REASON reason = GRACE_PERIOD_EXPIRED;
        uint64_t decided_at = 0;
    };

    /**
     * Answer to a finalization request. When status is not ATTESTED, only the refusal fields are populated.
     */
    struct finalization_result
    {
        FINALIZATION_STATUS status = NOT_ENDED;

        // Refusal details.
        uint64_t time_remaining = 0; // Seconds until end (NOT_ENDED) or until grace expiry (AWAITING_CONFIRMATIONS).
        confirmation_stats stats;

        // Attestation details.
        ledger::attestation attestation;
        std::vector<participant_result> participants; // Join order.
        FINALIZATION_REASON reason = GRACE_PERIOD_EXPIRED;
        std::string results;
    };

    const char *error_to_string(const ORACLE_ERROR error);

    const char *reason_to_string(const FINALIZATION_REASON reason);

    bool is_valid_mileage(const double miles);

    uint64_t to_centimiles(const double miles);

} // namespace oracle

#endif
