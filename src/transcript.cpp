#include "transcript.hpp"

namespace ParaClient {
namespace detail {

    namespace {

        constexpr char MERLIN_PROTOCOL_LABEL[] = "Merlin v1.0";

        const uint8_t* label_bytes(const std::string& label) {
            return reinterpret_cast<const uint8_t*>(label.data());
        }

    } // namespace

    Transcript::Transcript(const std::string& label)
        : strobe_(reinterpret_cast<const uint8_t*>(MERLIN_PROTOCOL_LABEL), sizeof(MERLIN_PROTOCOL_LABEL) - 1) {
        append_message("dom-sep", label_bytes(label), label.size());
    }

    void Transcript::append_message(const std::string& label, const uint8_t* message, size_t size) {
        const auto length = encode_le32(static_cast<uint32_t>(size));
        strobe_.meta_ad(label_bytes(label), label.size(), false);
        strobe_.meta_ad(length.data(), length.size(), true);
        strobe_.ad(message, size, false);
    }

    void Transcript::append_message(const std::string& label, const byte_vector& message) {
        append_message(label, message.data(), message.size());
    }

    void Transcript::challenge_bytes(const std::string& label, uint8_t* out, size_t size) {
        const auto length = encode_le32(static_cast<uint32_t>(size));
        strobe_.meta_ad(label_bytes(label), label.size(), false);
        strobe_.meta_ad(length.data(), length.size(), true);
        strobe_.prf(out, size, false);
    }

} // namespace detail
} // namespace ParaClient
