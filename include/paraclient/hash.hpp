#ifndef PARACLIENT_HASH_HPP
#define PARACLIENT_HASH_HPP

#include <array>
#include <memory>
#include <string>

#include "bytes.hpp"

struct evp_md_ctx_st;

namespace ParaClient {

    // SHA-512/256 digest, the protocol's generic hash.
    using Hash = std::array<uint8_t, 32>;

    /**
     * @brief Incremental SHA-512/256 (OpenSSL EVP).
     */
    class Sha512_256 {
    public:
        Sha512_256();
        ~Sha512_256();

        Sha512_256(const Sha512_256&) = delete;
        Sha512_256& operator=(const Sha512_256&) = delete;

        Sha512_256& update(const uint8_t* data, size_t size);
        Sha512_256& update(const byte_vector& data);
        Sha512_256& update(const std::string& data);

        /**
         * @brief Produces the digest. The hasher cannot be updated afterwards.
         */
        Hash finalize();

    private:
        std::unique_ptr<evp_md_ctx_st, void (*)(evp_md_ctx_st*)> ctx_;
    };

    Hash sha512_256(const byte_vector& data);

    // SHA-512/256 over the concatenation of the two parts.
    Hash sha512_256(const byte_vector& first, const byte_vector& second);

    std::array<uint8_t, 64> sha512(const byte_vector& data);

    /**
     * @brief HMAC with SHA-512/256.
     */
    Hash hmac_sha512_256(const byte_vector& key, const byte_vector& message);

    /**
     * @brief Legacy Keccak-256 as used by Ethereum (not SHA3-256).
     */
    Hash keccak256(const byte_vector& data);

} // namespace ParaClient

#endif // PARACLIENT_HASH_HPP
