#include <boost/test/unit_test.hpp>

#include "../pchheader.hpp"
#include "../crypto.hpp"
#include "../ledger/settlement_msg.hpp"
#include "test_helpers.hpp"

using namespace stctest;

BOOST_AUTO_TEST_SUITE(settlement_msg_tests)

BOOST_AUTO_TEST_CASE(message_kinds_do_not_share_digests)
{
    BOOST_CHECK(settlement_msg::cancel_digest(4) != settlement_msg::confirm_digest(4));
    BOOST_CHECK(settlement_msg::cancel_digest(4) != settlement_msg::cancel_digest(5));
    BOOST_CHECK_EQUAL(settlement_msg::cancel_digest(4).size(), crypto::HASH_BYTES);

    const std::string hash = crypto::get_hash("results");
    BOOST_CHECK(settlement_msg::finalize_digest(4, "w", hash, T0) != settlement_msg::finalize_digest(4, "w", hash, T0 + 1));
    BOOST_CHECK(settlement_msg::finalize_digest(4, "w", hash, T0) == settlement_msg::finalize_digest(4, "w", hash, T0));
}

BOOST_AUTO_TEST_CASE(signatures_verify_only_for_their_own_kind)
{
    const keypair k = make_keypair();
    const keypair other = make_keypair();

    const ledger::consent_signature consent = settlement_msg::sign_cancel_consent(3, k.seckey);
    BOOST_CHECK(consent.signer == k.pubkey);
    BOOST_CHECK_EQUAL(settlement_msg::verify_cancel_consent(3, consent), 0);
    BOOST_CHECK_EQUAL(settlement_msg::verify_cancel_consent(2, consent), -1);

    const std::string confirmation = settlement_msg::sign_confirmation(3, k.seckey);
    BOOST_CHECK_EQUAL(settlement_msg::verify_confirmation(3, k.pubkey, confirmation), 0);
    BOOST_CHECK_EQUAL(settlement_msg::verify_confirmation(3, other.pubkey, confirmation), -1);

    // A confirmation is not a cancel consent and the other way around.
    BOOST_CHECK_EQUAL(settlement_msg::verify_cancel_consent(3, ledger::consent_signature{k.pubkey, confirmation}), -1);
    BOOST_CHECK_EQUAL(settlement_msg::verify_confirmation(3, k.pubkey, consent.signature), -1);

    ledger::attestation att;
    att.challenge_id = 3;
    att.winner = other.pubkey;
    att.result_hash = crypto::get_hash("results");
    att.signing_timestamp = T0;
    att.signature = settlement_msg::sign_finalization(3, att.winner, att.result_hash, T0, k.seckey);
    BOOST_CHECK_EQUAL(settlement_msg::verify_finalization(att, k.pubkey), 0);
    BOOST_CHECK_EQUAL(settlement_msg::verify_finalization(att, other.pubkey), -1);

    att.signature = consent.signature;
    BOOST_CHECK_EQUAL(settlement_msg::verify_finalization(att, k.pubkey), -1);

    att.signature = "short";
    BOOST_CHECK_EQUAL(settlement_msg::verify_finalization(att, k.pubkey), -1);
}

BOOST_AUTO_TEST_SUITE_END()
