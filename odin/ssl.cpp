#include "ssl.hpp"

#include <type_traits>

namespace NOdin {

namespace {

template<typename T, void (*Free)(T*)>
using TOpenSslPtr = std::unique_ptr<T, std::integral_constant<decltype(Free), Free>>;

using TBioPtr = TOpenSslPtr<BIO, BIO_free_all>;
using TX509Ptr = TOpenSslPtr<X509, X509_free>;
using TKeyPtr = TOpenSslPtr<EVP_PKEY, EVP_PKEY_free>;

TBioPtr MemBio(const std::string& pem) {
    TBioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw std::runtime_error("BIO_new_mem_buf: " + SslErrorString());
    }
    return bio;
}

} // namespace

std::string SslErrorString() {
    auto err = ERR_get_error();
    if (!err) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

TSslContext::TSslContext(const SSL_METHOD* method)
    : Ctx_(SSL_CTX_new(method))
{
    if (!Ctx_) {
        throw std::runtime_error("SSL_CTX_new: " + SslErrorString());
    }
    SSL_CTX_set_min_proto_version(Ctx_.get(), TLS1_2_VERSION);
}

TSslContext TSslContext::Client() {
    return TSslContext(TLS_client_method());
}

TSslContext TSslContext::Server(const std::string& certfile, const std::string& keyfile) {
    TSslContext ctx(TLS_server_method());
    if (SSL_CTX_use_certificate_chain_file(ctx.Native(), certfile.c_str()) != 1) {
        throw std::runtime_error("Cannot load certificate '" + certfile + "': " + SslErrorString());
    }
    if (SSL_CTX_use_PrivateKey_file(ctx.Native(), keyfile.c_str(), SSL_FILETYPE_PEM) != 1) {
        throw std::runtime_error("Cannot load key '" + keyfile + "': " + SslErrorString());
    }
    if (SSL_CTX_check_private_key(ctx.Native()) != 1) {
        throw std::runtime_error("Key does not match certificate: " + SslErrorString());
    }
    return ctx;
}

TSslContext TSslContext::ServerFromMem(const std::string& certPem, const std::string& keyPem) {
    TSslContext ctx(TLS_server_method());

    auto certBio = MemBio(certPem);
    TX509Ptr cert(PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
    if (!cert || SSL_CTX_use_certificate(ctx.Native(), cert.get()) != 1) {
        throw std::runtime_error("Cannot load X509 certificate: " + SslErrorString());
    }

    auto keyBio = MemBio(keyPem);
    TKeyPtr key(PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr));
    if (!key || SSL_CTX_use_PrivateKey(ctx.Native(), key.get()) != 1) {
        throw std::runtime_error("Cannot load private key: " + SslErrorString());
    }
    return ctx;
}

} // namespace NOdin
