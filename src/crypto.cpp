#include "pchheader.hpp"
#include "crypto.hpp"

namespace crypto
{

    /**
     * Initializes the crypto subsystem. Must be called once during application startup.
     * @return 0 for successful initialization. -1 for failure.
     */
    int init()
    {
        if (sodium_init() < 0)
        {
            std::cerr << "sodium_init failed.\n";
            return -1;
        }

        return 0;
    }

    /**
     * Generates a signing key pair using libsodium and assigns them to the provided strings.
     */
    void generate_signing_keys(std::string &pubkey, std::string &seckey)
    {
        // Generate key pair using libsodium default algorithm.
        // Currently using ed25519. So append prefix byte to represent that.

        pubkey.resize(PFXD_PUBKEY_BYTES);
        pubkey[0] = KEYPFX_ed25519;

        seckey.resize(PFXD_SECKEY_BYTES);
        seckey[0] = KEYPFX_ed25519;

        crypto_sign_ed25519_keypair(
            reinterpret_cast<unsigned char *>(pubkey.data() + 1),  // +1 to skip the prefix byte.
            reinterpret_cast<unsigned char *>(seckey.data() + 1)); // +1 to skip the prefix byte.
    }

    /**
     * Extracts the prefixed public key embedded in a prefixed ed25519 secret key.
     * @return Prefixed public key bytes. Empty if the secret key is malformed.
     */
    const std::string get_pubkey(std::string_view seckey)
    {
        if (seckey.size() != PFXD_SECKEY_BYTES || (unsigned char)seckey[0] != KEYPFX_ed25519)
            return "";

        std::string pubkey;
        pubkey.resize(PFXD_PUBKEY_BYTES);
        pubkey[0] = KEYPFX_ed25519;

        crypto_sign_ed25519_sk_to_pk(
            reinterpret_cast<unsigned char *>(pubkey.data() + 1),
            reinterpret_cast<const unsigned char *>(seckey.data() + 1));

        return pubkey;
    }

    /**
     * Checks whether the given bytes look like a prefixed ed25519 public key.
     * An all-zero key is treated as the null identity and rejected.
     */
    bool is_valid_pubkey(std::string_view pubkey)
    {
        if (pubkey.size() != PFXD_PUBKEY_BYTES || (unsigned char)pubkey[0] != KEYPFX_ed25519)
            return false;

        return !sodium_is_zero(reinterpret_cast<const unsigned char *>(pubkey.data() + 1), pubkey.size() - 1);
    }

    /**
     * Returns the signature bytes for a message.
     * 
     * @param msg Message bytes to sign.
     * @param seckey Prefixed secret key bytes.
     * @return Signature bytes.
     */
    const std::string sign(std::string_view msg, std::string_view seckey)
    {
        //Generate the signature using libsodium.

        std::string sig;
        sig.resize(SIGNATURE_BYTES);
        crypto_sign_ed25519_detached(
            reinterpret_cast<unsigned char *>(sig.data()),
            NULL,
            reinterpret_cast<const unsigned char *>(msg.data()),
            msg.length(),
            reinterpret_cast<const unsigned char *>(seckey.data() + 1)); // +1 to skip the prefix byte.

        return sig;
    }

    /**
     * Verifies the given signature bytes for the message.
     * 
     * @param msg Message bytes.
     * @param sig Signature bytes.
     * @param pubkey Prefixed public key bytes.
     * @return 0 for successful verification. -1 for failure.
     */
    int verify(std::string_view msg, std::string_view sig, std::string_view pubkey)
    {
        if (sig.size() != SIGNATURE_BYTES || pubkey.size() != PFXD_PUBKEY_BYTES)
            return -1;

        return crypto_sign_ed25519_verify_detached(
            reinterpret_cast<const unsigned char *>(sig.data()),
            reinterpret_cast<const unsigned char *>(msg.data()),
            msg.length(),
            reinterpret_cast<const unsigned char *>(pubkey.data() + 1)); // +1 to skip prefix byte.
    }

    /**
     * Generate random bytes of specified length.
     */
    void random_bytes(std::string &result, const size_t len)
    {
        result.resize(len);
        randombytes_buf(result.data(), len);
    }

    /**
     * Generate blake3 hash for a given message.
     * @param data String to hash.
     * @return The blake3 hash of the given string.
     */
    const std::string get_hash(std::string_view data)
    {
        std::string hash;
        hash.resize(BLAKE3_OUT_LEN);

        // Initialize the hasher.
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        blake3_hasher_update(&hasher, reinterpret_cast<const unsigned char *>(data.data()), data.length());

        blake3_hasher_finalize(&hasher, reinterpret_cast<unsigned char *>(hash.data()), hash.length());

        return hash;
    }

    /**
     * Generates blake3 hash for the given string view vector using stream hashing.
     */
    const std::string get_hash(const std::vector<std::string_view> &sw_vect)
    {
        std::string hash;
        hash.resize(BLAKE3_OUT_LEN);

        // Init stream hashing.
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        for (std::string_view sw : sw_vect)
            blake3_hasher_update(&hasher, reinterpret_cast<const unsigned char *>(sw.data()), sw.length());

        // Get the final hash.
        blake3_hasher_finalize(&hasher, reinterpret_cast<unsigned char *>(hash.data()), hash.length());

        return hash;
    }

} // namespace crypto
