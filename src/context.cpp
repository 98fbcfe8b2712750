#include "paraclient/context.hpp"

#include <algorithm>

#include "paraclient/errors.hpp"
#include "paraclient/hash.hpp"

namespace ParaClient {

    Namespace::Namespace(const byte_vector& bytes) {
        if (bytes.size() != SIZE) {
            throw AddressError("Runtime identifier must be 32 bytes.");
        }
        std::copy(bytes.begin(), bytes.end(), data_.begin());
    }

    Namespace Namespace::from_hex(const std::string& hex) {
        if (hex.size() != SIZE * 2) {
            throw AddressError("Runtime identifier must be 64 hex characters.");
        }
        try {
            return Namespace(ParaClient::from_hex(hex));
        } catch (const InvalidArgument& e) {
            throw AddressError(std::string("Malformed runtime identifier: ") + e.what());
        }
    }

    std::string Namespace::to_hex() const {
        return ParaClient::to_hex(data_);
    }

    std::string derive_chain_context(const Namespace& runtime_id, const std::string& consensus_chain_context) {
        if (consensus_chain_context.empty()) {
            throw AddressError("Consensus chain context must not be empty.");
        }
        Hash h = Sha512_256()
                     .update(runtime_id.bytes().data(), runtime_id.bytes().size())
                     .update(consensus_chain_context)
                     .finalize();
        return to_hex(h);
    }

    Context Context::raw(const std::string& value) {
        return Context(to_bytes(value));
    }

    Context Context::raw(const byte_vector& value) {
        return Context(value);
    }

    Context Context::derive(const std::string& base, const std::string& derived_chain_context) {
        return Context(to_bytes(base + CHAIN_CONTEXT_SEPARATOR + derived_chain_context));
    }

    Context Context::for_runtime(const std::string& base,
                                 const Namespace& runtime_id,
                                 const std::string& consensus_chain_context) {
        return derive(base, derive_chain_context(runtime_id, consensus_chain_context));
    }

    Context Context::for_transactions(const Namespace& runtime_id, const std::string& consensus_chain_context) {
        return for_runtime(TRANSACTION_SIGNATURE_CONTEXT_BASE, runtime_id, consensus_chain_context);
    }

} // namespace ParaClient
