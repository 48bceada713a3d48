#ifndef _STC_LEDGER_SETTLEMENT_MSG_
#define _STC_LEDGER_SETTLEMENT_MSG_

#include "../pchheader.hpp"
#include "ledger_common.hpp"

/**
 * Domain separated messages signed across the ledger boundary. Each message kind starts with its own fixed prefix
 * so a signature produced for one kind can never verify as another. The signed payload is the blake3 digest of
 * the prefixed message.
 */
namespace settlement_msg
{
    constexpr const char *FINALIZE_PREFIX = "FINALIZE_CHALLENGE_";
    constexpr const char *CANCEL_PREFIX = "CANCEL_CHALLENGE_";
    constexpr const char *CONFIRM_PREFIX = "CONFIRM_CHALLENGE_";

    const std::string finalize_digest(const uint64_t challenge_id, std::string_view winner, std::string_view result_hash, const uint64_t signing_timestamp);

    const std::string cancel_digest(const uint64_t challenge_id);

    const std::string confirm_digest(const uint64_t challenge_id);

    const std::string sign_finalization(const uint64_t challenge_id, std::string_view winner, std::string_view result_hash,
                                        const uint64_t signing_timestamp, std::string_view seckey);

    const ledger::consent_signature sign_cancel_consent(const uint64_t challenge_id, std::string_view seckey);

    const std::string sign_confirmation(const uint64_t challenge_id, std::string_view seckey);

    int verify_finalization(const ledger::attestation &att, std::string_view attester_key);

    int verify_cancel_consent(const uint64_t challenge_id, const ledger::consent_signature &consent);

    int verify_confirmation(const uint64_t challenge_id, std::string_view identity, std::string_view signature);

} // namespace settlement_msg

#endif
