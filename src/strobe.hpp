#ifndef PARACLIENT_SRC_STROBE_HPP
#define PARACLIENT_SRC_STROBE_HPP

#include <array>
#include <cstdint>
#include <cstddef>

namespace ParaClient {
namespace detail {

    /**
     * Strobe-128/1600 restricted to the operations a Merlin transcript needs
     * (meta-AD, AD and PRF).
     */
    class Strobe128 {
    public:
        explicit Strobe128(const uint8_t* protocol_label, size_t size);

        void meta_ad(const uint8_t* data, size_t size, bool more);
        void ad(const uint8_t* data, size_t size, bool more);
        void prf(uint8_t* out, size_t size, bool more);

    private:
        static constexpr uint8_t STROBE_R = 166;

        static constexpr uint8_t FLAG_I = 0x01;
        static constexpr uint8_t FLAG_A = 0x02;
        static constexpr uint8_t FLAG_C = 0x04;
        static constexpr uint8_t FLAG_T = 0x08;
        static constexpr uint8_t FLAG_M = 0x10;
        static constexpr uint8_t FLAG_K = 0x20;

        void run_f();
        void absorb(const uint8_t* data, size_t size);
        void squeeze(uint8_t* out, size_t size);
        void begin_op(uint8_t flags, bool more);

        std::array<uint8_t, 200> state_{};
        uint8_t pos_ = 0;
        uint8_t pos_begin_ = 0;
        uint8_t cur_flags_ = 0;
    };

} // namespace detail
} // namespace ParaClient

#endif // PARACLIENT_SRC_STROBE_HPP
