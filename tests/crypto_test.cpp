#include "paraclient/crypto.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "paraclient/bytes.hpp"
#include "paraclient/deoxysii.hpp"
#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"

TEST(HashTest, Sha512_256KnownAnswers) {
    ASSERT_EQ(ParaClient::to_hex(ParaClient::sha512_256(ParaClient::byte_vector{})),
              "c672b8d1ef56ed28ab87c3622c5114069bdd3ad7b8f9737498d0c01ecef0967a");
    ASSERT_EQ(ParaClient::to_hex(ParaClient::sha512_256(ParaClient::to_bytes("abc"))),
              "53048e2681941ef99b2e29b76b4c7dabe4c2d0c634fc6d46e0e2f13107e7af23");

    // Incremental hashing matches the one-shot helper.
    auto h = ParaClient::Sha512_256().update(std::string("a")).update(std::string("bc")).finalize();
    ASSERT_EQ(h, ParaClient::sha512_256(ParaClient::to_bytes("abc")));
    ASSERT_EQ(ParaClient::sha512_256(ParaClient::to_bytes("a"), ParaClient::to_bytes("bc")), h);
}

TEST(HashTest, Keccak256KnownAnswer) {
    ASSERT_EQ(ParaClient::to_hex(ParaClient::keccak256({})),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(DeoxysIITest, SealAndOpen) {
    // 1. Setup key and nonce
    ParaClient::byte_vector key(ParaClient::DeoxysII::KEY_SIZE, 0x42);
    ParaClient::DeoxysII aead(key);
    ParaClient::DeoxysII::Nonce nonce{};
    nonce[0] = 1;

    // 2. Seal a message spanning several blocks
    ParaClient::byte_vector plaintext = ParaClient::to_bytes("This message is longer than a single sixteen byte block.");
    ParaClient::byte_vector ad = ParaClient::to_bytes("header");
    auto ciphertext = aead.seal(nonce, plaintext, ad);
    ASSERT_EQ(ciphertext.size(), plaintext.size() + ParaClient::DeoxysII::TAG_SIZE);
    ASSERT_NE(ParaClient::byte_vector(ciphertext.begin(), ciphertext.begin() + plaintext.size()), plaintext);

    // 3. Open it again
    ASSERT_EQ(aead.open(nonce, ciphertext, ad), plaintext);

    // 4. Sealing is deterministic for a given nonce
    ASSERT_EQ(aead.seal(nonce, plaintext, ad), ciphertext);
}

TEST(DeoxysIITest, TamperingIsDetected) {
    ParaClient::DeoxysII aead(ParaClient::byte_vector(ParaClient::DeoxysII::KEY_SIZE, 0x07));
    ParaClient::DeoxysII::Nonce nonce{};
    auto ciphertext = aead.seal(nonce, ParaClient::to_bytes("payload"), {});

    auto flipped = ciphertext;
    flipped[0] ^= 0x01;
    ASSERT_THROW(aead.open(nonce, flipped, {}), ParaClient::CodecError);

    ASSERT_THROW(aead.open(nonce, ciphertext, ParaClient::to_bytes("ad")), ParaClient::CodecError);

    ParaClient::DeoxysII::Nonce other_nonce{};
    other_nonce[14] = 1;
    ASSERT_THROW(aead.open(other_nonce, ciphertext, {}), ParaClient::CodecError);

    // Shorter than a tag
    ASSERT_THROW(aead.open(nonce, ParaClient::byte_vector(3, 0), {}), ParaClient::CodecError);
}

TEST(DeoxysIITest, RejectsBadKeySize) {
    ASSERT_THROW({ ParaClient::DeoxysII aead(ParaClient::byte_vector(16, 0)); }, ParaClient::InvalidArgument);
}

TEST(CryptoTest, BoxSealAndOpen) {
    // 1. Initialize the crypto library
    ASSERT_EQ(ParaClient::Crypto::init(), 0);

    // 2. Setup two parties
    auto client = ParaClient::Crypto::generate_x25519_keypair();
    auto runtime = ParaClient::Crypto::generate_x25519_keypair();

    // 3. Both sides derive the same symmetric key
    ASSERT_EQ(ParaClient::Crypto::derive_symmetric_key(runtime.publicKey, client.privateKey),
              ParaClient::Crypto::derive_symmetric_key(client.publicKey, runtime.privateKey));

    // 4. Seal on the client, open on the runtime
    auto nonce = ParaClient::Crypto::random_nonce();
    ParaClient::byte_vector message = ParaClient::to_bytes("confidential call");
    auto sealed = ParaClient::Crypto::box_seal(nonce, message, {}, runtime.publicKey, client.privateKey);

    ParaClient::byte_vector opened;
    ASSERT_NO_THROW({ opened = ParaClient::Crypto::box_open(nonce, sealed, {}, client.publicKey, runtime.privateKey); });
    ASSERT_EQ(opened, message);

    // 5. A third party cannot open it
    auto intruder = ParaClient::Crypto::generate_x25519_keypair();
    ASSERT_THROW(ParaClient::Crypto::box_open(nonce, sealed, {}, client.publicKey, intruder.privateKey),
                 ParaClient::CodecError);
}

TEST(CryptoTest, KeypairFromPrivateKey) {
    ASSERT_EQ(ParaClient::Crypto::init(), 0);

    auto generated = ParaClient::Crypto::generate_x25519_keypair();
    auto restored = ParaClient::Crypto::x25519_keypair_from_private(generated.privateKey);
    ASSERT_EQ(restored.publicKey, generated.publicKey);
}

TEST(CryptoTest, RandomBytes) {
    ASSERT_EQ(ParaClient::Crypto::init(), 0);

    auto a = ParaClient::Crypto::random_bytes(32);
    auto b = ParaClient::Crypto::random_bytes(32);
    ASSERT_EQ(a.size(), 32u);
    ASSERT_NE(a, b);
}
