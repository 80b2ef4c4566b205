#include "privagg/secagg/openssl_status.h"

#include <openssl/err.h>

#include <string>

#include "absl/strings/str_cat.h"

namespace privagg::secagg {

absl::Status OpenSslError(absl::string_view operation) {
  std::string message = absl::StrCat(operation, " failed");
  unsigned long code;
  while ((code = ERR_get_error()) != 0) {
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    absl::StrAppend(&message, ": ", buffer);
  }
  return absl::InternalError(message);
}

}  // namespace privagg::secagg
