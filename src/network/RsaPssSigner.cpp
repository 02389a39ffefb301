#include "network/RsaPssSigner.h"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace kestrel {
namespace network {

namespace {
std::string lastOpenSslError() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};
}

std::string RsaPssSigner::normalizePem(const std::string& pem) {
    std::string key_data = pem;

    // Escaped newlines from env files
    size_t pos = 0;
    while ((pos = key_data.find("\\n", pos)) != std::string::npos) {
        key_data.replace(pos, 2, "\n");
        pos += 1;
    }

    const auto begin = key_data.find("-----BEGIN");
    if (begin == std::string::npos ||
        std::count(key_data.begin(), key_data.end(), '\n') > 2) {
        return key_data;
    }

    // One-line PEM: re-wrap the body at 64 columns
    const auto header_end = key_data.find("-----", begin + 10);
    const auto footer = key_data.find("-----END", header_end == std::string::npos ? begin : header_end + 5);
    if (header_end == std::string::npos || footer == std::string::npos) {
        return key_data;
    }
    const auto footer_end = key_data.find("-----", footer + 8);
    if (footer_end == std::string::npos) {
        return key_data;
    }

    const std::string header = key_data.substr(begin, header_end + 5 - begin);
    const std::string trailer = key_data.substr(footer, footer_end + 5 - footer);

    std::string body;
    for (char c : key_data.substr(header_end + 5, footer - header_end - 5)) {
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            body += c;
        }
    }

    std::ostringstream oss;
    oss << header << "\n";
    for (size_t i = 0; i < body.size(); i += 64) {
        oss << body.substr(i, 64) << "\n";
    }
    oss << trailer << "\n";
    return oss.str();
}

std::unique_ptr<RsaPssSigner> RsaPssSigner::fromPem(const std::string& pem) {
    const std::string normalized = normalizePem(pem);

    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(normalized.data(), static_cast<int>(normalized.size())));
    if (!bio) {
        throw std::runtime_error("Failed to allocate BIO for private key");
    }

    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!key) {
        throw std::runtime_error("Failed to parse private key: " + lastOpenSslError());
    }
    return std::unique_ptr<RsaPssSigner>(new RsaPssSigner(key));
}

std::unique_ptr<RsaPssSigner> RsaPssSigner::fromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open private key file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return fromPem(oss.str());
}

std::string RsaPssSigner::signingMessage(const std::string& timestamp_ms,
                                         const std::string& method,
                                         const std::string& path) {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return timestamp_ms + upper + path.substr(0, path.find('?'));
}

std::string RsaPssSigner::sign(const std::string& timestamp_ms,
                               const std::string& method,
                               const std::string& path) const {
    const std::string message = signingMessage(timestamp_ms, method, path);

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key_.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) <= 0) {
        throw std::runtime_error("Failed to init RSA-PSS signing: " + lastOpenSslError());
    }

    if (EVP_DigestSignUpdate(ctx.get(), message.data(), message.size()) != 1) {
        throw std::runtime_error("Failed to hash signing message: " + lastOpenSslError());
    }

    size_t signature_len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &signature_len) != 1) {
        throw std::runtime_error("Failed to size signature: " + lastOpenSslError());
    }
    std::vector<unsigned char> signature(signature_len);
    if (EVP_DigestSignFinal(ctx.get(), signature.data(), &signature_len) != 1) {
        throw std::runtime_error("Failed to sign request: " + lastOpenSslError());
    }

    return base64Encode(std::string(reinterpret_cast<char*>(signature.data()), signature_len));
}

std::string RsaPssSigner::base64Encode(const std::string& data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.c_str(), static_cast<int>(data.length()));
    BIO_flush(bio);

    BUF_MEM* buffer_ptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);
    return result;
}

std::string RsaPssSigner::base64Decode(const std::string& data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    bio = BIO_push(b64, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::string result(data.size(), '\0');
    const int len = BIO_read(bio, &result[0], static_cast<int>(result.size()));
    BIO_free_all(bio);

    result.resize(len > 0 ? static_cast<size_t>(len) : 0);
    return result;
}

} // namespace network
} // namespace kestrel
