#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../util/util.hpp"
#include "settlement_msg.hpp"

namespace settlement_msg
{
    /**
     * Digest of the finalize message.
     * Layout: "FINALIZE_CHALLENGE_" | challenge id (8 bytes BE) | winner | result hash | signing timestamp (8 bytes BE)
     * The timestamp is the only field after the variable length result hash and it has a fixed width, so the
     * concatenation cannot be re-split into a different tuple.
     */
    const std::string finalize_digest(const uint64_t challenge_id, std::string_view winner, std::string_view result_hash, const uint64_t signing_timestamp)
    {
        const std::string id_bytes = util::uint64_to_string_bytes(challenge_id);
        const std::string ts_bytes = util::uint64_to_string_bytes(signing_timestamp);
        return crypto::get_hash({FINALIZE_PREFIX, id_bytes, winner, result_hash, ts_bytes});
    }

    const std::string cancel_digest(const uint64_t challenge_id)
    {
        const std::string id_bytes = util::uint64_to_string_bytes(challenge_id);
        return crypto::get_hash({CANCEL_PREFIX, id_bytes});
    }

    const std::string confirm_digest(const uint64_t challenge_id)
    {
        const std::string id_bytes = util::uint64_to_string_bytes(challenge_id);
        return crypto::get_hash({CONFIRM_PREFIX, id_bytes});
    }

    const std::string sign_finalization(const uint64_t challenge_id, std::string_view winner, std::string_view result_hash,
                                        const uint64_t signing_timestamp, std::string_view seckey)
    {
        return crypto::sign(finalize_digest(challenge_id, winner, result_hash, signing_timestamp), seckey);
    }

    /**
     * Produces a participant's cancellation consent. The signer key travels with the signature.
     */
    const ledger::consent_signature sign_cancel_consent(const uint64_t challenge_id, std::string_view seckey)
    {
        ledger::consent_signature consent;
        consent.signer = crypto::get_pubkey(seckey);
        consent.signature = crypto::sign(cancel_digest(challenge_id), seckey);
        return consent;
    }

    const std::string sign_confirmation(const uint64_t challenge_id, std::string_view seckey)
    {
        return crypto::sign(confirm_digest(challenge_id), seckey);
    }

    /**
     * Verifies an attestation signature against the given attester key.
     * @return 0 if the signature is valid. -1 otherwise.
     */
    int verify_finalization(const ledger::attestation &att, std::string_view attester_key)
    {
        const std::string digest = finalize_digest(att.challenge_id, att.winner, att.result_hash, att.signing_timestamp);
        return crypto::verify(digest, att.signature, attester_key);
    }

    int verify_cancel_consent(const uint64_t challenge_id, const ledger::consent_signature &consent)
    {
        return crypto::verify(cancel_digest(challenge_id), consent.signature, consent.signer);
    }

    int verify_confirmation(const uint64_t challenge_id, std::string_view identity, std::string_view signature)
    {
        return crypto::verify(confirm_digest(challenge_id), signature, identity);
    }

} // namespace settlement_msg
