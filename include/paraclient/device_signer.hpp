#ifndef PARACLIENT_DEVICE_SIGNER_HPP
#define PARACLIENT_DEVICE_SIGNER_HPP

#include <memory>

#include "bytes.hpp"
#include "context.hpp"
#include "public_key.hpp"

namespace ParaClient {

    /**
     * @brief An external signing device such as a hardware wallet.
     *
     * Implementations perform blocking I/O. They may throw any exception
     * derived from std::exception to report a device failure.
     */
    class SigningDevice {
    public:
        virtual ~SigningDevice() = default;

        virtual PublicKey public_key() = 0;

        virtual byte_vector sign(const Context& context, const byte_vector& message) = 0;
    };

    /**
     * @brief A signer whose key material lives on a SigningDevice.
     *
     * Signing performs a device round-trip and may block. Every signature the
     * device returns is checked against the device's public key.
     */
    class DeviceSigner {
    public:
        /**
         * @brief Takes ownership of the device and caches its public key.
         * @throws ParaClient::InvalidArgument if the device is null.
         * @throws ParaClient::SignatureError if the device fails to report its key.
         */
        explicit DeviceSigner(std::unique_ptr<SigningDevice> device);

        const PublicKey& public_key() const { return public_key_; }

        /**
         * @throws ParaClient::SignatureError if the signer was reset, the device
         *         failed or the returned signature does not verify.
         */
        byte_vector context_sign(const Context& context, const byte_vector& message) const;

        // Releases the device.
        void reset();

        bool is_reset() const { return device_ == nullptr; }

    private:
        static PublicKey query_public_key(SigningDevice* device);

        std::unique_ptr<SigningDevice> device_;
        PublicKey public_key_;
    };

} // namespace ParaClient

#endif // PARACLIENT_DEVICE_SIGNER_HPP
