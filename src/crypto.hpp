#ifndef _STC_CRYPTO_
#define _STC_CRYPTO_

#include "pchheader.hpp"

/**
 * Offers convenience functions for cryptographic operations wrapping libsodium and blake3.
 * These functions are used for attestation, consent and confirmation signatures and result commitments.
 */
namespace crypto
{

    // Prefix byte to append to ed25519 keys.
    constexpr const unsigned char KEYPFX_ed25519 = 0xED;

    // Prefixed public key length. Participant identities and attester keys are of this size.
    constexpr const size_t PFXD_PUBKEY_BYTES = crypto_sign_ed25519_PUBLICKEYBYTES + 1;

    constexpr const size_t PFXD_SECKEY_BYTES = crypto_sign_ed25519_SECRETKEYBYTES + 1;

    constexpr const size_t SIGNATURE_BYTES = crypto_sign_ed25519_BYTES;

    constexpr const size_t HASH_BYTES = BLAKE3_OUT_LEN;

    int init();

    void generate_signing_keys(std::string &pubkey, std::string &seckey);

    const std::string get_pubkey(std::string_view seckey);

    bool is_valid_pubkey(std::string_view pubkey);

    const std::string sign(std::string_view msg, std::string_view seckey);

    int verify(std::string_view msg, std::string_view sig, std::string_view pubkey);

    void random_bytes(std::string &result, const size_t len);

    const std::string get_hash(std::string_view data);

    const std::string get_hash(const std::vector<std::string_view> &sw_vect);

} // namespace crypto

#endif
