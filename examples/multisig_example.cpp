#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "paraclient/address.hpp"
#include "paraclient/context.hpp"
#include "paraclient/crypto.hpp"
#include "paraclient/ed25519.hpp"
#include "paraclient/errors.hpp"
#include "paraclient/multisig.hpp"
#include "paraclient/sr25519.hpp"
#include "paraclient/transaction.hpp"

int main() {
    // 1. Initialize the crypto library
    if (ParaClient::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    try {
        // 2. A 2-of-3 policy where the treasurer alone suffices
        auto clerk1 = ParaClient::Ed25519Signer::from_seed(ParaClient::Crypto::random_bytes(32));
        auto clerk2 = ParaClient::Ed25519Signer::from_seed(ParaClient::Crypto::random_bytes(32));
        auto treasurer = ParaClient::Sr25519Signer::from_seed(ParaClient::Crypto::random_bytes(32));

        ParaClient::MultisigConfig config;
        config.signers = {
            {clerk1.public_key(), 1},
            {clerk2.public_key(), 1},
            {treasurer.public_key(), 2},
        };
        config.threshold = 2;
        config.validate_basic();
        std::cout << "Multisig account: " << ParaClient::Address::from_multisig(config).to_bech32() << std::endl;

        // 3. Sparse verification of a detached message
        auto context = ParaClient::Context::raw("example/multisig: v0");
        auto message = ParaClient::to_bytes("release funds");
        ParaClient::MultisigAuthenticator authenticator(config);

        std::vector<ParaClient::MultisigAuthenticator::IndexedSignature> one_clerk = {
            {0, clerk1.context_sign(context, message)},
        };
        std::cout << "One clerk satisfies: " << std::boolalpha
                  << authenticator.is_satisfied(context, message, one_clerk) << std::endl;

        auto both_clerks = one_clerk;
        both_clerks.emplace_back(1, clerk2.context_sign(context, message));
        authenticator.verify(context, message, both_clerks);
        std::cout << "Both clerks satisfy: true" << std::endl;

        // 4. A transaction authorized by the treasurer only
        ParaClient::Transaction tx("accounts.Transfer", ParaClient::CborValue::map().encode());
        tx.append_auth_multisig(config, 3);

        auto tx_context = ParaClient::Context::for_transactions(
            ParaClient::Namespace::from_hex("00000000000000000000000000000000000000000000000072c8215e60d5bca7"),
            "5ba68bc5e01e06f755c4c044dd11ec508e4c17f1faf40c0e67874388437a9e55");
        auto signer = tx.prepare_for_signing();
        signer.append_sign(tx_context, std::move(treasurer));

        const auto& ut = signer.unverified_transaction();
        const auto& proof = ut.auth_proofs.front();
        size_t present = 0;
        for (const auto& signature : *proof.multisig) {
            if (signature) {
                ++present;
            }
        }
        std::cout << "Proof carries " << present << " of " << proof.multisig->size() << " signatures." << std::endl;

        auto verified = ut.verify(tx_context);
        std::cout << "Verified transaction with nonce " << verified.auth_info.signer_info.front().nonce << std::endl;
    } catch (const ParaClient::MultisigError& e) {
        std::cerr << "Multisig error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
