#ifndef _STC_LEDGER_LEDGER_EVENTS_
#define _STC_LEDGER_LEDGER_EVENTS_

#include "../pchheader.hpp"

namespace ledger
{
    struct challenge_created_event
    {
        uint64_t challenge_id = 0;
        std::string creator;
        uint64_t start_time = 0;
        uint64_t end_time = 0;
        uint64_t stake_amount = 0;
    };

    struct participant_joined_event
    {
        uint64_t challenge_id = 0;
        std::string identity;
        std::string correlation_id;
        uint64_t stake = 0;
    };

    struct challenge_finalized_event
    {
        uint64_t challenge_id = 0;
        std::string winner;
        std::string result_hash;
    };

    // Prize paid out to the winner.
    struct challenge_completed_event
    {
        uint64_t challenge_id = 0;
        std::string winner;
        uint64_t prize = 0;
    };

    // Emitted exactly once per challenge, when CANCELLED is first written.
    struct challenge_cancelled_event
    {
        uint64_t challenge_id = 0;
    };

    struct stake_withdrawn_event
    {
        uint64_t challenge_id = 0;
        std::string identity;
        uint64_t amount = 0;
    };

    struct emergency_withdrawal_event
    {
        uint64_t challenge_id = 0;
        std::string identity;
        uint64_t amount = 0;
    };

    struct attester_key_updated_event
    {
        std::string old_key;
        std::string new_key;
        uint64_t version = 0;
    };

    // Represents any kind of settlement fact recorded by the ledger.
    typedef std::variant<challenge_created_event, participant_joined_event, challenge_finalized_event,
                         challenge_completed_event, challenge_cancelled_event, stake_withdrawn_event,
                         emergency_withdrawal_event, attester_key_updated_event>
        ledger_event;

} // namespace ledger

#endif
