#include <duplex/error.h>
#include <duplex/server/ssl.hpp>

#include <array>
#include <nghttp2/nghttp2.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <timber/timber>

namespace {
    using duplex::config_error;

    auto alpn_select(
        SSL* ssl,
        const unsigned char** out,
        unsigned char* outlen,
        const unsigned char* in,
        unsigned int inlen,
        void* arg
    ) -> int {
        const auto ret = nghttp2_select_next_protocol(
            (unsigned char**) out,
            outlen,
            in,
            inlen
        );

        // Anything but h2 aborts the handshake.
        if (ret != 1) {
            TIMBER_DEBUG("Client offered no acceptable application protocol");
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        }

        return SSL_TLSEXT_ERR_OK;
    }

    auto ssl_error(std::string_view what) -> config_error {
        auto buffer = std::array<char, 256>();
        const auto code = ERR_get_error();

        if (code == 0) return config_error(what);

        ERR_error_string_n(code, buffer.data(), buffer.size());
        ERR_clear_error();

        return config_error("{}: {}", what, buffer.data());
    }

    auto use_identity(SSL_CTX* ctx, const duplex::server::identity& id)
        -> void {
        if (id.chain.empty()) throw config_error("Identity has no certificate");
        if (id.key.empty()) throw config_error("Identity has no private key");

        const auto& leaf = id.chain.front();

        if (SSL_CTX_use_certificate_ASN1(
            ctx,
            static_cast<int>(leaf.size()),
            reinterpret_cast<const unsigned char*>(leaf.data())
        ) != 1) throw ssl_error("Invalid certificate");

        for (auto it = id.chain.begin() + 1; it != id.chain.end(); ++it) {
            const auto* in = reinterpret_cast<const unsigned char*>(it->data());
            auto* cert = d2i_X509(nullptr, &in, it->size());

            if (!cert) throw ssl_error("Invalid intermediate certificate");

            // On success the context takes ownership.
            if (SSL_CTX_add0_chain_cert(ctx, cert) != 1) {
                X509_free(cert);
                throw ssl_error("Failed to add intermediate certificate");
            }
        }

        const auto* in = reinterpret_cast<const unsigned char*>(id.key.data());
        auto* const key = d2i_AutoPrivateKey(
            nullptr,
            &in,
            static_cast<long>(id.key.size())
        );

        if (!key) throw ssl_error("Invalid private key");

        const auto ret = SSL_CTX_use_PrivateKey(ctx, key);
        EVP_PKEY_free(key);

        if (ret != 1) throw ssl_error("Failed to use private key");

        if (SSL_CTX_check_private_key(ctx) != 1) {
            throw ssl_error("Private key does not match certificate");
        }
    }
}

namespace duplex::server {
    auto make_server_ssl(const identity& id) -> netcore::ssl::context {
        auto ssl = netcore::ssl::context::server();
        auto* const ctx = ssl.data();

        use_identity(ctx, id);

        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

        ssl.set_alpn_select_callback(alpn_select);

        TIMBER_DEBUG(
            "Server TLS context ready ({} certificate{})",
            id.chain.size(),
            id.chain.size() == 1 ? "" : "s"
        );

        return ssl;
    }
}
