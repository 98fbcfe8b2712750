#include "paraclient/hash.hpp"

#include <algorithm>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "keccak.hpp"
#include "paraclient/errors.hpp"

namespace ParaClient {

    Sha512_256::Sha512_256() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha512_256(), nullptr) != 1) {
            throw RuntimeError("Failed to initialize SHA-512/256.");
        }
    }

    Sha512_256::~Sha512_256() = default;

    Sha512_256& Sha512_256::update(const uint8_t* data, size_t size) {
        if (size > 0 && EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw RuntimeError("SHA-512/256 update failed.");
        }
        return *this;
    }

    Sha512_256& Sha512_256::update(const byte_vector& data) {
        return update(data.data(), data.size());
    }

    Sha512_256& Sha512_256::update(const std::string& data) {
        return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    Hash Sha512_256::finalize() {
        Hash out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
            throw RuntimeError("SHA-512/256 finalization failed.");
        }
        return out;
    }

    Hash sha512_256(const byte_vector& data) {
        return Sha512_256().update(data).finalize();
    }

    Hash sha512_256(const byte_vector& first, const byte_vector& second) {
        return Sha512_256().update(first).update(second).finalize();
    }

    std::array<uint8_t, 64> sha512(const byte_vector& data) {
        std::array<uint8_t, 64> out{};
        unsigned int len = 0;
        if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha512(), nullptr) != 1 ||
            len != out.size()) {
            throw RuntimeError("SHA-512 failed.");
        }
        return out;
    }

    Hash hmac_sha512_256(const byte_vector& key, const byte_vector& message) {
        Hash out{};
        unsigned int len = 0;
        if (HMAC(EVP_sha512_256(), key.data(), static_cast<int>(key.size()), message.data(), message.size(),
                 out.data(), &len) == nullptr ||
            len != out.size()) {
            throw RuntimeError("HMAC-SHA-512/256 failed.");
        }
        return out;
    }

    Hash keccak256(const byte_vector& data) {
        constexpr size_t RATE = 136;
        std::array<uint8_t, 200> state{};

        size_t offset = 0;
        while (data.size() - offset >= RATE) {
            for (size_t i = 0; i < RATE; ++i) {
                state[i] ^= data[offset + i];
            }
            detail::keccak_f1600(state);
            offset += RATE;
        }

        const size_t remaining = data.size() - offset;
        for (size_t i = 0; i < remaining; ++i) {
            state[i] ^= data[offset + i];
        }
        // Original Keccak padding (0x01), not the SHA-3 domain byte (0x06).
        state[remaining] ^= 0x01;
        state[RATE - 1] ^= 0x80;
        detail::keccak_f1600(state);

        Hash out{};
        std::copy(state.begin(), state.begin() + out.size(), out.begin());
        return out;
    }

} // namespace ParaClient
