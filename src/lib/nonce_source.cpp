#include "keylink/session/nonce_source.h"

#include "keylink/core/errors.h"
#include "keylink/core/logging.h"

#include <openssl/err.h>
#include <openssl/rand.h>

namespace keylink::session {

static constexpr const char* TAG = "lease";

io::protocol::Nonce SecureNonceSource::next()
{
    io::protocol::Nonce nonce{};
    if (::RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        char err[256] = {0};
        ::ERR_error_string_n(::ERR_get_error(), err, sizeof(err));
        KL_LOGE(TAG, "RAND_bytes failed: %s", err);
        throw BootstrapFailure("secure random source unavailable");
    }
    return nonce;
}

} // namespace keylink::session
