#include "paraclient/device_signer.hpp"

#include <string>

#include "paraclient/errors.hpp"
#include "paraclient/log.hpp"

namespace ParaClient {

    DeviceSigner::DeviceSigner(std::unique_ptr<SigningDevice> device)
        : device_(std::move(device)), public_key_(query_public_key(device_.get())) {}

    PublicKey DeviceSigner::query_public_key(SigningDevice* device) {
        if (device == nullptr) {
            throw InvalidArgument("Signing device must not be null.");
        }
        try {
            return device->public_key();
        } catch (const Exception&) {
            throw;
        } catch (const std::exception& e) {
            throw SignatureError(std::string("Signing device failed to report its public key: ") + e.what());
        }
    }

    byte_vector DeviceSigner::context_sign(const Context& context, const byte_vector& message) const {
        if (is_reset()) {
            throw SignatureError("Device signer has been reset.");
        }

        byte_vector signature;
        try {
            signature = device_->sign(context, message);
        } catch (const Exception&) {
            throw;
        } catch (const std::exception& e) {
            throw SignatureError(std::string("Signing device failure: ") + e.what());
        }

        if (!public_key_.verify(context, message, signature)) {
            create_logger("signer")->warn("Signing device returned a signature that does not verify");
            throw SignatureError("Signing device returned an invalid signature.");
        }
        return signature;
    }

    void DeviceSigner::reset() {
        device_.reset();
    }

} // namespace ParaClient
