#include "strobe.hpp"

#include <cstring>

#include "keccak.hpp"
#include "paraclient/errors.hpp"

namespace ParaClient {
namespace detail {

    Strobe128::Strobe128(const uint8_t* protocol_label, size_t size) {
        const uint8_t init[6] = {1, STROBE_R + 2, 1, 0, 1, 96};
        static const char version[] = "STROBEv1.0.2";
        std::memcpy(state_.data(), init, sizeof(init));
        std::memcpy(state_.data() + sizeof(init), version, sizeof(version) - 1);
        keccak_f1600(state_);
        meta_ad(protocol_label, size, false);
    }

    void Strobe128::run_f() {
        state_[pos_] ^= pos_begin_;
        state_[pos_ + 1] ^= 0x04;
        state_[STROBE_R + 1] ^= 0x80;
        keccak_f1600(state_);
        pos_ = 0;
        pos_begin_ = 0;
    }

    void Strobe128::absorb(const uint8_t* data, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            state_[pos_] ^= data[i];
            ++pos_;
            if (pos_ == STROBE_R) {
                run_f();
            }
        }
    }

    void Strobe128::squeeze(uint8_t* out, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            out[i] = state_[pos_];
            state_[pos_] = 0;
            ++pos_;
            if (pos_ == STROBE_R) {
                run_f();
            }
        }
    }

    void Strobe128::begin_op(uint8_t flags, bool more) {
        if (more) {
            if (cur_flags_ != flags) {
                throw LogicError("Strobe operation continued with different flags.");
            }
            return;
        }
        if (flags & FLAG_T) {
            throw LogicError("Strobe transport operations are not supported.");
        }

        const uint8_t old_begin = pos_begin_;
        pos_begin_ = static_cast<uint8_t>(pos_ + 1);
        cur_flags_ = flags;

        const uint8_t header[2] = {old_begin, flags};
        absorb(header, sizeof(header));

        const bool force_f = (flags & (FLAG_C | FLAG_K)) != 0;
        if (force_f && pos_ != 0) {
            run_f();
        }
    }

    void Strobe128::meta_ad(const uint8_t* data, size_t size, bool more) {
        begin_op(FLAG_M | FLAG_A, more);
        absorb(data, size);
    }

    void Strobe128::ad(const uint8_t* data, size_t size, bool more) {
        begin_op(FLAG_A, more);
        absorb(data, size);
    }

    void Strobe128::prf(uint8_t* out, size_t size, bool more) {
        begin_op(FLAG_I | FLAG_A | FLAG_C, more);
        squeeze(out, size);
    }

} // namespace detail
} // namespace ParaClient
