#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "base.hpp"
#include "corochain.hpp"
#include "log.hpp"
#include "sockutils.hpp"
#include "socket.hpp"

namespace NOdin {

namespace NDetail {

struct TSslCtxFree {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

struct TSslFree {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};

} // namespace NDetail

/// Text of the last OpenSSL error, for exception messages. Clears the error queue.
std::string SslErrorString();

/// TLS settings shared by every connection of a server or a client (TLS 1.2 and up).
class TSslContext {
public:
    static TSslContext Client();
    /// Certificate chain and private key from PEM files.
    static TSslContext Server(const std::string& certfile, const std::string& keyfile);
    /// Same as Server() with PEM text instead of file names.
    static TSslContext ServerFromMem(const std::string& certPem, const std::string& keyPem);

    SSL_CTX* Native() const {
        return Ctx_.get();
    }

private:
    explicit TSslContext(const SSL_METHOD* method);

    std::unique_ptr<SSL_CTX, NDetail::TSslCtxFree> Ctx_;
};

/**
 * @class TSslSocket
 * @brief TLS over a non-blocking stream via memory BIOs.
 *
 * OpenSSL never touches the descriptor: ciphertext goes through a pair of
 * memory BIOs that Fill() and Flush() move to and from the socket. The
 * handshake is explicit, AcceptHandshake() on the server side and
 * Connect() or ConnectHandshake() on the client side. After it one reader
 * and one writer may run concurrently; writes never read from the socket.
 */
template<typename TSocket>
class TSslSocket {
public:
    using TPoller = typename TSocket::TPoller;

    TSslSocket() = default;

    TSslSocket(TSocket&& socket, TSslContext& ctx)
        : Socket_(std::move(socket))
        , Ssl_(SSL_new(ctx.Native()))
    {
        if (!Ssl_) {
            throw std::runtime_error("SSL_new: " + SslErrorString());
        }
        Rbio_ = BIO_new(BIO_s_mem());
        Wbio_ = BIO_new(BIO_s_mem());
        if (!Rbio_ || !Wbio_) {
            BIO_free(Rbio_);
            BIO_free(Wbio_);
            throw std::runtime_error("BIO_new: " + SslErrorString());
        }
        // the session owns both BIOs from here on
        SSL_set_bio(Ssl_.get(), Rbio_, Wbio_);
        SSL_set_mode(Ssl_.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    }

    TSslSocket(TSslSocket&&) = default;
    TSslSocket& operator=(TSslSocket&&) = default;

    void SslSetTlsExtHostName(const std::string& host) {
        SSL_set_tlsext_host_name(Ssl_.get(), host.c_str());
    }

    TFuture<void> AcceptHandshake() {
        SSL_set_accept_state(Ssl_.get());
        co_await Handshake();
    }

    TFuture<void> Connect(const TAddress& address, TTime deadline = TTime::max()) {
        co_await Socket_.Connect(address, deadline);
        co_await ConnectHandshake();
    }

    /// Client handshake over an already connected socket.
    TFuture<void> ConnectHandshake() {
        SSL_set_connect_state(Ssl_.get());
        co_await Handshake();
    }

    /// Returns 0 when the peer closes the TLS session or the connection.
    TFuture<ssize_t> ReadSome(void* data, size_t size) {
        while (true) {
            int n = SSL_read(Ssl_.get(), data, static_cast<int>(size));
            if (n > 0) {
                co_return n;
            }
            int status = SSL_get_error(Ssl_.get(), n);
            if (status == SSL_ERROR_ZERO_RETURN) {
                co_return 0;
            }
            if (status != SSL_ERROR_WANT_READ && status != SSL_ERROR_WANT_WRITE) {
                throw std::runtime_error("SSL_read: " + SslErrorString());
            }
            co_await Flush();
            if (status == SSL_ERROR_WANT_READ && !co_await Fill()) {
                co_return 0;
            }
        }
    }

    /// Encrypts and sends all of @p data.
    TFuture<ssize_t> WriteSome(const void* data, size_t size) {
        const char* p = static_cast<const char*>(data);
        size_t left = size;
        while (left != 0) {
            int n = SSL_write(Ssl_.get(), p, static_cast<int>(left));
            if (n <= 0) {
                throw std::runtime_error("SSL_write: " + SslErrorString());
            }
            co_await Flush();
            p += n;
            left -= n;
        }
        co_return static_cast<ssize_t>(size);
    }

    void Close() {
        Socket_.Close();
    }

    auto Poller() {
        return Socket_.Poller();
    }

private:
    // Ciphertext from the write BIO to the socket.
    TFuture<void> Flush() {
        char buf[4096];
        int n;
        while ((n = BIO_read(Wbio_, buf, sizeof(buf))) > 0) {
            co_await TByteWriter(Socket_).Write(buf, n);
        }
    }

    // One socket read into the read BIO. False at end of stream.
    TFuture<bool> Fill() {
        char buf[4096];
        ssize_t size;
        do {
            size = co_await Socket_.ReadSome(buf, sizeof(buf));
        } while (size < 0);
        if (size == 0) {
            co_return false;
        }
        // a memory BIO grows as needed and takes everything at once
        if (BIO_write(Rbio_, buf, static_cast<int>(size)) != size) {
            throw std::runtime_error("BIO_write: " + SslErrorString());
        }
        co_return true;
    }

    TFuture<void> Handshake() {
        while (true) {
            TraceState();
            int r = SSL_do_handshake(Ssl_.get());
            if (r == 1) {
                break;
            }
            int status = SSL_get_error(Ssl_.get(), r);
            if (status != SSL_ERROR_WANT_READ && status != SSL_ERROR_WANT_WRITE) {
                throw std::runtime_error("SSL handshake: " + SslErrorString());
            }
            co_await Flush();
            if (status == SSL_ERROR_WANT_READ && !co_await Fill()) {
                throw std::runtime_error("Connection closed during handshake");
            }
        }
        co_await Flush();
        ODIN_DEBUG << "TLS handshake done, " << SSL_get_version(Ssl_.get()) << " " << SSL_get_cipher_name(Ssl_.get());
    }

    void TraceState() {
        const char* state = SSL_state_string_long(Ssl_.get());
        if (state != LastState_) {
            ODIN_TRACE << "TLS state: " << state;
            LastState_ = state;
        }
    }

    TSocket Socket_;
    std::unique_ptr<SSL, NDetail::TSslFree> Ssl_;
    BIO* Rbio_ = nullptr;
    BIO* Wbio_ = nullptr;
    const char* LastState_ = nullptr;
};

} // namespace NOdin
