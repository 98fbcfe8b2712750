#include "paraclient/cbor.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "paraclient/errors.hpp"

namespace ParaClient {

    namespace {

        constexpr uint8_t MAJOR_UNSIGNED = 0;
        constexpr uint8_t MAJOR_NEGATIVE = 1;
        constexpr uint8_t MAJOR_BYTES = 2;
        constexpr uint8_t MAJOR_TEXT = 3;
        constexpr uint8_t MAJOR_ARRAY = 4;
        constexpr uint8_t MAJOR_MAP = 5;
        constexpr uint8_t MAJOR_TAG = 6;
        constexpr uint8_t MAJOR_SIMPLE = 7;

        constexpr uint8_t SIMPLE_FALSE = 20;
        constexpr uint8_t SIMPLE_TRUE = 21;
        constexpr uint8_t SIMPLE_NULL = 22;

        constexpr size_t MAX_DEPTH = 64;

        void write_head(byte_vector& out, uint8_t major, uint64_t arg) {
            const uint8_t mt = static_cast<uint8_t>(major << 5);
            if (arg < 24) {
                out.push_back(static_cast<uint8_t>(mt | arg));
            } else if (arg <= 0xff) {
                out.push_back(mt | 24);
                out.push_back(static_cast<uint8_t>(arg));
            } else if (arg <= 0xffff) {
                out.push_back(mt | 25);
                out.push_back(static_cast<uint8_t>(arg >> 8));
                out.push_back(static_cast<uint8_t>(arg));
            } else if (arg <= 0xffffffffULL) {
                out.push_back(mt | 26);
                for (int shift = 24; shift >= 0; shift -= 8) {
                    out.push_back(static_cast<uint8_t>(arg >> shift));
                }
            } else {
                out.push_back(mt | 27);
                for (int shift = 56; shift >= 0; shift -= 8) {
                    out.push_back(static_cast<uint8_t>(arg >> shift));
                }
            }
        }

        // Canonical map key order: shorter encodings first, then bytewise.
        bool canonical_less(const byte_vector& a, const byte_vector& b) {
            if (a.size() != b.size()) {
                return a.size() < b.size();
            }
            return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
        }

        // Well-formed UTF-8 only: no overlong forms, surrogates or code points above U+10FFFF.
        bool is_valid_utf8(const byte_vector& text) {
            size_t i = 0;
            while (i < text.size()) {
                const uint8_t c = text[i];
                size_t extra;
                uint32_t min;
                uint32_t cp;
                if (c < 0x80) {
                    ++i;
                    continue;
                } else if ((c & 0xe0) == 0xc0) {
                    extra = 1;
                    min = 0x80;
                    cp = c & 0x1f;
                } else if ((c & 0xf0) == 0xe0) {
                    extra = 2;
                    min = 0x800;
                    cp = c & 0x0f;
                } else if ((c & 0xf8) == 0xf0) {
                    extra = 3;
                    min = 0x10000;
                    cp = c & 0x07;
                } else {
                    return false;
                }
                if (text.size() - i <= extra) {
                    return false;
                }
                for (size_t j = 1; j <= extra; ++j) {
                    const uint8_t cc = text[i + j];
                    if ((cc & 0xc0) != 0x80) {
                        return false;
                    }
                    cp = (cp << 6) | (cc & 0x3f);
                }
                if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
                    return false;
                }
                i += extra + 1;
            }
            return true;
        }

        class Decoder {
        public:
            explicit Decoder(const byte_vector& data) : data_(data) {}

            CborValue read_item(size_t depth) {
                if (depth > MAX_DEPTH) {
                    throw CodecError("CBOR nesting too deep.");
                }
                const uint8_t initial = next_byte();
                const uint8_t major = initial >> 5;
                const uint8_t info = initial & 0x1f;

                if (major == MAJOR_SIMPLE) {
                    switch (info) {
                        case SIMPLE_FALSE:
                            return CborValue::boolean(false);
                        case SIMPLE_TRUE:
                            return CborValue::boolean(true);
                        case SIMPLE_NULL:
                            return CborValue::null();
                        default:
                            throw CodecError("Unsupported CBOR simple value or float.");
                    }
                }
                if (major == MAJOR_TAG) {
                    throw CodecError("CBOR tags are not supported.");
                }

                const uint64_t arg = read_argument(info);
                switch (major) {
                    case MAJOR_UNSIGNED:
                        return CborValue::uint64(arg);
                    case MAJOR_NEGATIVE: {
                        if (arg > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                            throw CodecError("CBOR negative integer out of range.");
                        }
                        return CborValue::integer(-1 - static_cast<int64_t>(arg));
                    }
                    case MAJOR_BYTES:
                        return CborValue::bytes(read_span(arg));
                    case MAJOR_TEXT: {
                        byte_vector raw = read_span(arg);
                        if (!is_valid_utf8(raw)) {
                            throw CodecError("Invalid UTF-8 in CBOR text string.");
                        }
                        return CborValue::text(std::string(raw.begin(), raw.end()));
                    }
                    case MAJOR_ARRAY: {
                        ensure_available(arg);
                        CborValue::Array items;
                        items.reserve(static_cast<size_t>(arg));
                        for (uint64_t i = 0; i < arg; ++i) {
                            items.push_back(read_item(depth + 1));
                        }
                        return CborValue::array(std::move(items));
                    }
                    case MAJOR_MAP: {
                        ensure_available(arg);
                        CborValue map = CborValue::map();
                        std::set<byte_vector> seen_keys;
                        for (uint64_t i = 0; i < arg; ++i) {
                            CborValue key = read_item(depth + 1);
                            if (!seen_keys.insert(key.encode()).second) {
                                throw CodecError("Duplicate CBOR map key.");
                            }
                            CborValue value = read_item(depth + 1);
                            map.insert(std::move(key), std::move(value));
                        }
                        return map;
                    }
                    default:
                        throw CodecError("Unknown CBOR major type.");
                }
            }

            bool at_end() const { return offset_ == data_.size(); }

            size_t offset() const { return offset_; }

        private:
            uint8_t next_byte() {
                if (offset_ >= data_.size()) {
                    throw CodecError("Truncated CBOR data.");
                }
                return data_[offset_++];
            }

            uint64_t read_argument(uint8_t info) {
                if (info < 24) {
                    return info;
                }
                size_t width = 0;
                uint64_t minimum = 0;
                switch (info) {
                    case 24:
                        width = 1;
                        minimum = 24;
                        break;
                    case 25:
                        width = 2;
                        minimum = 0x100;
                        break;
                    case 26:
                        width = 4;
                        minimum = 0x10000;
                        break;
                    case 27:
                        width = 8;
                        minimum = 0x100000000ULL;
                        break;
                    default:
                        throw CodecError("Indefinite or reserved CBOR length.");
                }
                uint64_t value = 0;
                for (size_t i = 0; i < width; ++i) {
                    value = (value << 8) | next_byte();
                }
                if (value < minimum) {
                    throw CodecError("Non-minimal CBOR integer encoding.");
                }
                return value;
            }

            void ensure_available(uint64_t count) const {
                if (count > data_.size() - offset_) {
                    throw CodecError("Truncated CBOR data.");
                }
            }

            byte_vector read_span(uint64_t length) {
                ensure_available(length);
                byte_vector out(data_.begin() + offset_, data_.begin() + offset_ + static_cast<size_t>(length));
                offset_ += static_cast<size_t>(length);
                return out;
            }

            const byte_vector& data_;
            size_t offset_ = 0;
        };

    } // namespace

    CborValue::CborValue() = default;

    CborValue CborValue::uint64(uint64_t value) {
        CborValue v;
        v.type_ = Type::Unsigned;
        v.number_ = value;
        return v;
    }

    CborValue CborValue::integer(int64_t value) {
        if (value >= 0) {
            return uint64(static_cast<uint64_t>(value));
        }
        CborValue v;
        v.type_ = Type::Negative;
        v.number_ = static_cast<uint64_t>(-1 - value);
        return v;
    }

    CborValue CborValue::bytes(byte_vector value) {
        CborValue v;
        v.type_ = Type::Bytes;
        v.bytes_ = std::move(value);
        return v;
    }

    CborValue CborValue::text(std::string value) {
        CborValue v;
        v.type_ = Type::Text;
        v.text_ = std::move(value);
        return v;
    }

    CborValue CborValue::boolean(bool value) {
        CborValue v;
        v.type_ = Type::Bool;
        v.number_ = value ? 1 : 0;
        return v;
    }

    CborValue CborValue::null() {
        return CborValue();
    }

    CborValue CborValue::array(Array items) {
        CborValue v;
        v.type_ = Type::Array;
        v.items_ = std::move(items);
        return v;
    }

    CborValue CborValue::map() {
        CborValue v;
        v.type_ = Type::Map;
        return v;
    }

    CborValue CborValue::raw(const byte_vector& encoded) {
        if (encoded.empty()) {
            return null();
        }
        // Validate that this is exactly one well-formed item.
        Decoder decoder(encoded);
        decoder.read_item(0);
        if (!decoder.at_end()) {
            throw CodecError("Trailing bytes after raw CBOR item.");
        }
        CborValue v;
        v.type_ = Type::Raw;
        v.bytes_ = encoded;
        return v;
    }

    uint64_t CborValue::as_uint() const {
        if (type_ != Type::Unsigned) {
            throw CodecError("CBOR item is not an unsigned integer.");
        }
        return number_;
    }

    int64_t CborValue::as_int() const {
        if (type_ == Type::Unsigned && number_ <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(number_);
        }
        if (type_ == Type::Negative) {
            return -1 - static_cast<int64_t>(number_);
        }
        throw CodecError("CBOR item is not a representable integer.");
    }

    bool CborValue::as_bool() const {
        if (type_ != Type::Bool) {
            throw CodecError("CBOR item is not a boolean.");
        }
        return number_ != 0;
    }

    const byte_vector& CborValue::as_bytes() const {
        if (type_ != Type::Bytes) {
            throw CodecError("CBOR item is not a byte string.");
        }
        return bytes_;
    }

    const std::string& CborValue::as_text() const {
        if (type_ != Type::Text) {
            throw CodecError("CBOR item is not a text string.");
        }
        return text_;
    }

    const CborValue::Array& CborValue::as_array() const {
        if (type_ != Type::Array) {
            throw CodecError("CBOR item is not an array.");
        }
        return items_;
    }

    const CborValue::Map& CborValue::as_map() const {
        if (type_ != Type::Map) {
            throw CodecError("CBOR item is not a map.");
        }
        return entries_;
    }

    CborValue& CborValue::set(const std::string& key, CborValue value) {
        if (type_ != Type::Map) {
            throw LogicError("CBOR set() on a non-map item.");
        }
        for (auto& entry : entries_) {
            if (entry.first.type_ == Type::Text && entry.first.text_ == key) {
                entry.second = std::move(value);
                return *this;
            }
        }
        entries_.emplace_back(text(key), std::move(value));
        return *this;
    }

    CborValue& CborValue::insert(CborValue key, CborValue value) {
        if (type_ != Type::Map) {
            throw LogicError("CBOR insert() on a non-map item.");
        }
        entries_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    CborValue& CborValue::push(CborValue value) {
        if (type_ != Type::Array) {
            throw LogicError("CBOR push() on a non-array item.");
        }
        items_.push_back(std::move(value));
        return *this;
    }

    const CborValue* CborValue::find(const std::string& key) const {
        for (const auto& entry : as_map()) {
            if (entry.first.type_ == Type::Text && entry.first.text_ == key) {
                return &entry.second;
            }
        }
        return nullptr;
    }

    const CborValue& CborValue::at(const std::string& key) const {
        const CborValue* value = find(key);
        if (value == nullptr) {
            throw CodecError("Missing CBOR map field: " + key);
        }
        return *value;
    }

    byte_vector CborValue::encode() const {
        byte_vector out;
        encode_into(out);
        return out;
    }

    void CborValue::encode_into(byte_vector& out) const {
        switch (type_) {
            case Type::Unsigned:
                write_head(out, MAJOR_UNSIGNED, number_);
                break;
            case Type::Negative:
                write_head(out, MAJOR_NEGATIVE, number_);
                break;
            case Type::Bytes:
                write_head(out, MAJOR_BYTES, bytes_.size());
                out.insert(out.end(), bytes_.begin(), bytes_.end());
                break;
            case Type::Text:
                write_head(out, MAJOR_TEXT, text_.size());
                out.insert(out.end(), text_.begin(), text_.end());
                break;
            case Type::Array:
                write_head(out, MAJOR_ARRAY, items_.size());
                for (const auto& item : items_) {
                    item.encode_into(out);
                }
                break;
            case Type::Map: {
                std::vector<std::pair<byte_vector, byte_vector>> encoded;
                encoded.reserve(entries_.size());
                for (const auto& entry : entries_) {
                    encoded.emplace_back(entry.first.encode(), entry.second.encode());
                }
                std::sort(encoded.begin(), encoded.end(),
                          [](const auto& a, const auto& b) { return canonical_less(a.first, b.first); });
                for (size_t i = 1; i < encoded.size(); ++i) {
                    if (encoded[i - 1].first == encoded[i].first) {
                        throw CodecError("Duplicate CBOR map key.");
                    }
                }
                write_head(out, MAJOR_MAP, encoded.size());
                for (const auto& entry : encoded) {
                    out.insert(out.end(), entry.first.begin(), entry.first.end());
                    out.insert(out.end(), entry.second.begin(), entry.second.end());
                }
                break;
            }
            case Type::Bool:
                out.push_back(static_cast<uint8_t>((MAJOR_SIMPLE << 5) | (number_ ? SIMPLE_TRUE : SIMPLE_FALSE)));
                break;
            case Type::Null:
                out.push_back(static_cast<uint8_t>((MAJOR_SIMPLE << 5) | SIMPLE_NULL));
                break;
            case Type::Raw:
                out.insert(out.end(), bytes_.begin(), bytes_.end());
                break;
        }
    }

    CborValue CborValue::decode(const byte_vector& data) {
        Decoder decoder(data);
        CborValue value = decoder.read_item(0);
        if (!decoder.at_end()) {
            throw CodecError("Trailing bytes after CBOR item.");
        }
        return value;
    }

    bool CborValue::operator==(const CborValue& other) const {
        return encode() == other.encode();
    }

} // namespace ParaClient
