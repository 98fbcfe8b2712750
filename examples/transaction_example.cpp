#include <cstdio>
#include <iostream>
#include <string>

#include "paraclient/address.hpp"
#include "paraclient/context.hpp"
#include "paraclient/crypto.hpp"
#include "paraclient/ed25519.hpp"
#include "paraclient/errors.hpp"
#include "paraclient/secp256k1.hpp"
#include "paraclient/transaction.hpp"

void print_bytes(const std::string& title, const ParaClient::byte_vector& bytes) {
    std::cout << title << " (" << bytes.size() << " bytes): ";
    for (size_t i = 0; i < bytes.size() && i < 24; ++i) {
        printf("%02x", bytes[i]);
    }
    if (bytes.size() > 24) {
        std::cout << "...";
    }
    std::cout << std::endl;
}

int main() {
    // 1. Initialize the crypto library
    if (ParaClient::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    try {
        // 2. Two accounts: an ed25519 sender paying the fee and a secp256k1 co-signer
        auto alice = ParaClient::Ed25519Signer::from_seed(ParaClient::Crypto::random_bytes(32));
        auto bob = ParaClient::Secp256k1Signer::from_private_key(ParaClient::Crypto::random_bytes(32));
        auto alice_spec = ParaClient::SignatureAddressSpec::ed25519(alice.public_key());
        auto bob_spec = ParaClient::SignatureAddressSpec::secp256k1eth(bob.public_key());
        std::cout << "Alice: " << ParaClient::Address::from_spec(alice_spec).to_bech32() << std::endl;
        std::cout << "Bob:   " << ParaClient::Address::from_spec(bob_spec).to_bech32() << std::endl;

        // 3. A transfer to the common pool
        ParaClient::BaseUnits amount{ParaClient::Quantity(1000000000), ""};
        auto body = ParaClient::CborValue::map();
        body.set("to", ParaClient::common_pool_address().to_cbor());
        body.set("amount", amount.to_cbor());

        ParaClient::Transaction tx("accounts.Transfer", body.encode());
        tx.auth_info.fee.amount = ParaClient::BaseUnits{ParaClient::Quantity(20000), ""};
        tx.auth_info.fee.gas = 2000;
        tx.append_auth_signature(alice_spec, 0);
        tx.append_auth_signature(bob_spec, 7);
        std::cout << "Gas price: " << tx.auth_info.fee.gas_price().to_string() << std::endl;

        // 4. Both signers sign under the runtime's transaction context
        auto runtime_id = ParaClient::Namespace::from_hex(
            "000000000000000000000000000000000000000000000000e2eaa99fc008f87f");
        auto context = ParaClient::Context::for_transactions(
            runtime_id, "53852332637bacb61b91b6411ab4095168ba02a50be4c3f82448438826f23898");
        std::cout << "Signing context: " << context.str() << std::endl;

        auto signer = tx.prepare_for_signing();
        signer.append_sign(context, alice);
        signer.append_sign(context, bob);

        const auto& ut = signer.unverified_transaction();
        print_bytes("Signed transaction", ut.encode());
        std::cout << "Transaction hash: " << ParaClient::to_hex(ut.hash()) << std::endl;

        // 5. The runtime's view: decode and verify
        auto received = ParaClient::UnverifiedTransaction::decode(ut.encode());
        auto verified = received.verify(context);
        std::cout << "Verified call to " << verified.call.method << " with "
                  << verified.auth_info.signer_info.size() << " signers." << std::endl;

        // 6. A different chain context must not verify
        auto other = ParaClient::Context::for_transactions(
            runtime_id, "5ba68bc5e01e06f755c4c044dd11ec508e4c17f1faf40c0e67874388437a9e55");
        try {
            received.verify(other);
            std::cerr << "Transaction verified under the wrong chain!" << std::endl;
            return 1;
        } catch (const ParaClient::TransactionError& e) {
            std::cout << "Rejected under another chain: " << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
