#pragma once

#include "keylink/io/protocol/wrapper_packet.h"

namespace keylink::session {

// Supplies bootstrap nonces.
class NonceSource {
public:
    virtual ~NonceSource() = default;

    // Throws BootstrapFailure when no nonce can be produced.
    virtual io::protocol::Nonce next() = 0;
};

// OpenSSL RAND_bytes.
class SecureNonceSource : public NonceSource {
public:
    io::protocol::Nonce next() override;
};

} // namespace keylink::session
