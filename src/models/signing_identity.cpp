#include "chachamir/models/signing_identity.hpp"

namespace chachamir::models {
    SigningIdentity::SigningIdentity(
        crypto::SecureMemoryHandle secret_key_handle,
        const PublicKeyBytes& public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(public_key) {
    }
}
