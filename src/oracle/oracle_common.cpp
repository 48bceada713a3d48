#include "oracle_common.hpp"

namespace oracle
{
    const char *error_to_string(const ORACLE_ERROR error)
    {
        switch (error)
        {
        case OK:
            return "ok";
        case CHALLENGE_NOT_FOUND:
            return "challenge_not_found";
        case CHALLENGE_CANCELLED:
            return "challenge_cancelled";
        case CHALLENGE_NOT_ENDED:
            return "challenge_not_ended";
        case NOT_PARTICIPANT:
            return "not_participant";
        case NO_PARTICIPANTS:
            return "no_participants";
        case ALREADY_CONFIRMED:
            return "already_confirmed";
        case INVALID_SIGNATURE:
            return "invalid_signature";
        case INVALID_MILEAGE:
            return "invalid_mileage";
        case NO_MILEAGE_DATA:
            return "no_mileage_data";
        case FETCH_TIMEOUT:
            return "fetch_timeout";
        case FETCH_FAILED:
            return "fetch_failed";
        case STORAGE_FAILURE:
            return "storage_failure";
        }
        return "unknown";
    }

    const char *reason_to_string(const FINALIZATION_REASON reason)
    {
        return reason == ALL_CONFIRMED ? "all_confirmed" : "grace_period_expired";
    }

    /**
     * A mileage figure is accepted when it is finite, non-negative and still fits a signed 64-bit count of hundredths.
     */
    bool is_valid_mileage(const double miles)
    {
        return std::isfinite(miles) && miles >= 0 &&
               miles * CENTIMILES_PER_MILE < static_cast<double>(std::numeric_limits<int64_t>::max());
    }

    /**
     * Rounds miles to the nearest hundredth. Caller must pass a value accepted by is_valid_mileage().
     */
    uint64_t to_centimiles(const double miles)
    {
        return static_cast<uint64_t>(std::llround(miles * CENTIMILES_PER_MILE));
    }

} // namespace oracle
