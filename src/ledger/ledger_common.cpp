#include "ledger_common.hpp"

namespace ledger
{
    const char *error_to_string(const LEDGER_ERROR error)
    {
        switch (error)
        {
        case OK:
            return "ok";
        case INVALID_PARAMETERS:
            return "invalid_parameters";
        case CHALLENGE_NOT_FOUND:
            return "challenge_not_found";
        case NOT_ELIGIBLE:
            return "not_eligible";
        case NOT_ACCEPTING_PARTICIPANTS:
            return "not_accepting_participants";
        case REGISTRATION_CLOSED:
            return "registration_closed";
        case WRONG_STAKE_AMOUNT:
            return "wrong_stake_amount";
        case ALREADY_JOINED:
            return "already_joined";
        case INVALID_CORRELATION_ID:
            return "invalid_correlation_id";
        case CHALLENGE_SETTLED:
            return "challenge_settled";
        case NOT_IN_GRACE_PERIOD:
            return "not_in_grace_period";
        case CLAIM_WINDOW_CLOSED:
            return "claim_window_closed";
        case NOT_WINNER:
            return "not_winner";
        case NOT_PARTICIPANT:
            return "not_participant";
        case INVALID_RESULT_HASH:
            return "invalid_result_hash";
        case ATTESTATION_FROM_FUTURE:
            return "attestation_from_future";
        case ATTESTATION_EXPIRED:
            return "attestation_expired";
        case INVALID_SIGNATURE:
            return "invalid_signature";
        case NOT_FINALIZED:
            return "not_finalized";
        case CANNOT_CANCEL:
            return "cannot_cancel";
        case WRONG_SIGNATURE_COUNT:
            return "wrong_signature_count";
        case DUPLICATE_SIGNER:
            return "duplicate_signer";
        case NOT_CANCELLED:
            return "not_cancelled";
        case NO_STAKE_TO_WITHDRAW:
            return "no_stake_to_withdraw";
        case EMERGENCY_PERIOD_NOT_REACHED:
            return "emergency_period_not_reached";
        case UNAUTHORIZED:
            return "unauthorized";
        case STORAGE_FAILURE:
            return "storage_failure";
        }
        return "unknown";
    }

    const char *state_to_string(const CHALLENGE_STATE state)
    {
        switch (state)
        {
        case PENDING:
            return "pending";
        case ACTIVE:
            return "active";
        case GRACE_PERIOD:
            return "grace_period";
        case FINALIZED:
            return "finalized";
        case CANCELLED:
            return "cancelled";
        case COMPLETED:
            return "completed";
        }
        return "unknown";
    }

    bool is_terminal(const CHALLENGE_STATE state)
    {
        return state == FINALIZED || state == COMPLETED || state == CANCELLED;
    }

} // namespace ledger
