#ifndef PARACLIENT_CONTEXT_HPP
#define PARACLIENT_CONTEXT_HPP

#include <array>
#include <string>

#include "bytes.hpp"

namespace ParaClient {

    // Transaction signature domain separation context base.
    constexpr char TRANSACTION_SIGNATURE_CONTEXT_BASE[] = "oasis-runtime-sdk/tx: v0";

    // Separator between a context base and the derived chain context.
    constexpr char CHAIN_CONTEXT_SEPARATOR[] = " for chain ";

    /**
     * @brief A 32-byte runtime identifier.
     */
    class Namespace {
    public:
        static constexpr size_t SIZE = 32;

        Namespace() = default;

        /**
         * @throws ParaClient::AddressError if the input is not SIZE bytes.
         */
        explicit Namespace(const byte_vector& bytes);

        /**
         * @brief Parses the 64-character hex form.
         * @throws ParaClient::AddressError on malformed input.
         */
        static Namespace from_hex(const std::string& hex);

        std::string to_hex() const;
        const std::array<uint8_t, SIZE>& bytes() const { return data_; }

        bool operator==(const Namespace& other) const { return data_ == other.data_; }
        bool operator!=(const Namespace& other) const { return data_ != other.data_; }

    private:
        std::array<uint8_t, SIZE> data_{};
    };

    /**
     * @brief Combines a runtime identifier and a consensus chain context.
     *
     * The result is the hex-encoded SHA-512/256 of the runtime identifier
     * followed by the chain context string.
     *
     * @param runtime_id The runtime's identifier.
     * @param consensus_chain_context The consensus network's chain context.
     * @return 64 lower-case hex characters.
     * @throws ParaClient::AddressError if the chain context is empty.
     */
    std::string derive_chain_context(const Namespace& runtime_id, const std::string& consensus_chain_context);

    /**
     * @brief An immutable signature domain separation context.
     */
    class Context {
    public:
        /**
         * @brief Wraps context bytes that are used for signing as they are.
         */
        static Context raw(const std::string& value);
        static Context raw(const byte_vector& value);

        /**
         * @brief Builds "<base> for chain <derived_chain_context>".
         */
        static Context derive(const std::string& base, const std::string& derived_chain_context);

        /**
         * @brief Derives the chain context for a runtime and appends it to the base.
         */
        static Context for_runtime(const std::string& base,
                                   const Namespace& runtime_id,
                                   const std::string& consensus_chain_context);

        /**
         * @brief The transaction signing context for a runtime.
         */
        static Context for_transactions(const Namespace& runtime_id, const std::string& consensus_chain_context);

        const byte_vector& bytes() const { return value_; }
        std::string str() const { return std::string(value_.begin(), value_.end()); }
        bool empty() const { return value_.empty(); }

        bool operator==(const Context& other) const { return value_ == other.value_; }
        bool operator!=(const Context& other) const { return value_ != other.value_; }

    private:
        explicit Context(byte_vector value) : value_(std::move(value)) {}

        byte_vector value_;
    };

} // namespace ParaClient

#endif // PARACLIENT_CONTEXT_HPP
