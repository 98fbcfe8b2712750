#ifndef PARACLIENT_CBOR_HPP
#define PARACLIENT_CBOR_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "bytes.hpp"

namespace ParaClient {

    /**
     * @brief A dynamically typed CBOR data item.
     *
     * Encoding is canonical: minimal-length heads, definite lengths and map
     * entries ordered by their encoded keys (shorter keys first). Floats, tags
     * and indefinite lengths are not part of the wire format and are rejected
     * when decoding.
     */
    class CborValue {
    public:
        enum class Type {
            Unsigned,
            Negative,
            Bytes,
            Text,
            Array,
            Map,
            Bool,
            Null,
            Raw
        };

        using Array = std::vector<CborValue>;
        using Map = std::vector<std::pair<CborValue, CborValue>>;

        // A null item.
        CborValue();

        static CborValue uint64(uint64_t value);
        static CborValue integer(int64_t value);
        static CborValue bytes(byte_vector value);
        static CborValue text(std::string value);
        static CborValue boolean(bool value);
        static CborValue null();
        static CborValue array(Array items = {});
        static CborValue map();

        /**
         * @brief Embeds an already encoded item verbatim.
         * @param encoded A complete CBOR item. An empty vector encodes as null.
         * @throws ParaClient::CodecError if the bytes are not a single well-formed item.
         */
        static CborValue raw(const byte_vector& encoded);

        Type type() const { return type_; }
        bool is_null() const { return type_ == Type::Null; }
        bool is_map() const { return type_ == Type::Map; }

        /**
         * @brief Typed accessors.
         * @throws ParaClient::CodecError if the item has a different type.
         */
        uint64_t as_uint() const;
        int64_t as_int() const;
        bool as_bool() const;
        const byte_vector& as_bytes() const;
        const std::string& as_text() const;
        const Array& as_array() const;
        const Map& as_map() const;

        /**
         * @brief Inserts or replaces a text-keyed map entry.
         * @return *this, for chaining.
         */
        CborValue& set(const std::string& key, CborValue value);

        // Appends a map entry with an arbitrary key, without replacing.
        CborValue& insert(CborValue key, CborValue value);

        // Appends an array element.
        CborValue& push(CborValue value);

        /**
         * @brief Looks up a text-keyed map entry.
         * @return The entry's value, or nullptr when absent.
         */
        const CborValue* find(const std::string& key) const;

        /**
         * @brief Looks up a mandatory text-keyed map entry.
         * @throws ParaClient::CodecError if the entry is missing.
         */
        const CborValue& at(const std::string& key) const;

        byte_vector encode() const;

        /**
         * @brief Decodes exactly one item spanning all of the input.
         * @throws ParaClient::CodecError on malformed, non-minimal or trailing data.
         */
        static CborValue decode(const byte_vector& data);

        bool operator==(const CborValue& other) const;
        bool operator!=(const CborValue& other) const { return !(*this == other); }

    private:
        void encode_into(byte_vector& out) const;

        Type type_ = Type::Null;
        uint64_t number_ = 0;  // Unsigned value, negative argument (-1 - n) or bool
        byte_vector bytes_;    // Bytes payload or pre-encoded raw item
        std::string text_;
        Array items_;
        Map entries_;
    };

} // namespace ParaClient

#endif // PARACLIENT_CBOR_HPP
