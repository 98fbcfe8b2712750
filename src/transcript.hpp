#ifndef PARACLIENT_SRC_TRANSCRIPT_HPP
#define PARACLIENT_SRC_TRANSCRIPT_HPP

#include <string>

#include "paraclient/bytes.hpp"
#include "strobe.hpp"

namespace ParaClient {
namespace detail {

    /**
     * Merlin transcript (https://merlin.cool) over Strobe-128.
     */
    class Transcript {
    public:
        explicit Transcript(const std::string& label);

        void append_message(const std::string& label, const uint8_t* message, size_t size);
        void append_message(const std::string& label, const byte_vector& message);

        void challenge_bytes(const std::string& label, uint8_t* out, size_t size);

    private:
        Strobe128 strobe_;
    };

} // namespace detail
} // namespace ParaClient

#endif // PARACLIENT_SRC_TRANSCRIPT_HPP
