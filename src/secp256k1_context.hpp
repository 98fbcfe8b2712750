#ifndef PARACLIENT_SRC_SECP256K1_CONTEXT_HPP
#define PARACLIENT_SRC_SECP256K1_CONTEXT_HPP

#include <secp256k1.h>

namespace ParaClient {
namespace detail {

    // Process-wide signing and verification context.
    const secp256k1_context* secp256k1_ctx();

} // namespace detail
} // namespace ParaClient

#endif // PARACLIENT_SRC_SECP256K1_CONTEXT_HPP
