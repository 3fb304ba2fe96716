#include "storage/chunk_address.hpp"

#include <openssl/evp.h>

namespace csync::storage {

  base::Hash256 chunkAddress(gsl::span<const uint8_t> data) {
    base::Hash256 address;
    unsigned int digest_len = 0;

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, address.data(), &digest_len);
    EVP_MD_CTX_free(ctx);

    return address;
  }

}  // namespace csync::storage
