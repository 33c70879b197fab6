#ifndef LIGHTPROOF_UTIL_OPENSSL_SCOPED_TYPES_H_
#define LIGHTPROOF_UTIL_OPENSSL_SCOPED_TYPES_H_

#include <openssl/evp.h>
#include <memory>


template <typename T, void (*func)(T*)>
struct OpenSSLDeleter {
  void operator()(T* obj) {
    func(obj);
  }
};


template <typename T, void (*func)(T*)>
using ScopedOpenSSLType = std::unique_ptr<T, OpenSSLDeleter<T, func>>;


using ScopedEVP_MD_CTX = ScopedOpenSSLType<EVP_MD_CTX, EVP_MD_CTX_free>;


#endif  // LIGHTPROOF_UTIL_OPENSSL_SCOPED_TYPES_H_
