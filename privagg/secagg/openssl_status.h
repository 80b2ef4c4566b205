#ifndef PRIVAGG_PRIVAGG_SECAGG_OPENSSL_STATUS_H_
#define PRIVAGG_PRIVAGG_SECAGG_OPENSSL_STATUS_H_

#include <openssl/evp.h>

#include <memory>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace privagg::secagg {

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY *pkey) const { EVP_PKEY_free(pkey); }
};

struct EvpPkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
};

typedef std::unique_ptr<EVP_PKEY, EvpPkeyDeleter> EvpPkeyPtr;
typedef std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter> EvpPkeyCtxPtr;

// Internal error naming the failed operation, followed by every entry of the
// thread's OpenSSL error queue. The queue is left empty.
absl::Status OpenSslError(absl::string_view operation);

}  // namespace privagg::secagg

#endif  // PRIVAGG_PRIVAGG_SECAGG_OPENSSL_STATUS_H_
