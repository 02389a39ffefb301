#pragma once

#include <memory>
#include <string>

#include <openssl/evp.h>

namespace kestrel {
namespace network {

class IRequestSigner {
public:
    virtual ~IRequestSigner() = default;

    // Base64 signature over timestamp + METHOD + path (query stripped)
    virtual std::string sign(const std::string& timestamp_ms,
                             const std::string& method,
                             const std::string& path) const = 0;
};

// RSA-PSS / SHA-256 / MGF1-SHA-256, salt length = digest length
class RsaPssSigner : public IRequestSigner {
public:
    static std::unique_ptr<RsaPssSigner> fromPem(const std::string& pem);
    static std::unique_ptr<RsaPssSigner> fromFile(const std::string& path);

    std::string sign(const std::string& timestamp_ms,
                     const std::string& method,
                     const std::string& path) const override;

    static std::string signingMessage(const std::string& timestamp_ms,
                                      const std::string& method,
                                      const std::string& path);

    static std::string base64Encode(const std::string& data);
    static std::string base64Decode(const std::string& data);

private:
    struct KeyDeleter {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };

    explicit RsaPssSigner(EVP_PKEY* key) : key_(key) {}

    // Accepts literal "\n" escapes and one-line PEM bodies
    static std::string normalizePem(const std::string& pem);

    std::unique_ptr<EVP_PKEY, KeyDeleter> key_;
};

} // namespace network
} // namespace kestrel
