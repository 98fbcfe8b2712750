#include <iostream>
#include <string>

#include "paraclient/callformat.hpp"
#include "paraclient/cbor.hpp"
#include "paraclient/crypto.hpp"
#include "paraclient/errors.hpp"

int main() {
    // 1. Initialize the crypto library
    if (ParaClient::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    try {
        // 2. The runtime publishes its call data public key
        auto runtime_keys = ParaClient::Crypto::generate_x25519_keypair();
        ParaClient::EncodeConfig config;
        config.public_key = runtime_keys.publicKey;
        config.epoch = 42;

        // 3. The client encrypts a query
        ParaClient::Call call;
        call.method = "evm.SimulateCall";
        call.body = ParaClient::CborValue::text("balance of 0xdead").encode();
        call.read_only = true;

        auto encoded = ParaClient::encode_call(call, ParaClient::CallFormat::EncryptedX25519DeoxysII, config);
        std::cout << "[CLIENT] Sending call in format " << ParaClient::to_string(encoded.call.format)
                  << ", method '" << encoded.call.method << "'." << std::endl;

        // 4. The runtime opens it, executes and seals the result
        auto decoded = ParaClient::decode_call(encoded.call, runtime_keys.privateKey);
        std::cout << "[RUNTIME] Received call to " << decoded.call.method << std::endl;

        auto output = ParaClient::CallResult::ok(ParaClient::CborValue::uint64(1000).encode());
        auto sealed = ParaClient::encode_result(output, decoded, runtime_keys.privateKey, 17, 0);
        std::cout << "[RUNTIME] Result sealed: unknown=" << std::boolalpha << sealed.is_unknown() << std::endl;

        // 5. The client decrypts the result with the metadata kept from step 3
        auto result = ParaClient::decode_result(sealed, encoded.metadata.get());
        auto balance = ParaClient::CborValue::decode(result.value()).as_uint();
        std::cout << "[CLIENT] Balance: " << balance << std::endl;

        // 6. Metadata of another call cannot open it
        auto another = ParaClient::encode_call(call, ParaClient::CallFormat::EncryptedX25519DeoxysII, config);
        try {
            ParaClient::decode_result(sealed, another.metadata.get());
            std::cerr << "Result opened with the wrong key!" << std::endl;
            return 1;
        } catch (const ParaClient::CodecError& e) {
            std::cout << "[CLIENT] Wrong metadata rejected: " << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
