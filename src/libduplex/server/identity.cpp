#include <duplex/error.h>
#include <duplex/server/identity.hpp>

#include <array>
#include <fmt/format.h>
#include <memory>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>
#include <timber/timber>

namespace fs = std::filesystem;

namespace {
    using duplex::identity_error;
    using duplex::server::der;

    constexpr long validity_seconds = 365L * 24 * 60 * 60;

    template <auto Fn>
    struct deleter {
        template <typename T>
        auto operator()(T* ptr) const noexcept -> void { Fn(ptr); }
    };

    using bio_ptr = std::unique_ptr<BIO, deleter<BIO_free_all>>;
    using bignum_ptr = std::unique_ptr<BIGNUM, deleter<BN_free>>;
    using extension_ptr =
        std::unique_ptr<X509_EXTENSION, deleter<X509_EXTENSION_free>>;
    using key_ptr = std::unique_ptr<EVP_PKEY, deleter<EVP_PKEY_free>>;
    using pkcs8_ptr =
        std::unique_ptr<PKCS8_PRIV_KEY_INFO, deleter<PKCS8_PRIV_KEY_INFO_free>>;
    using x509_ptr = std::unique_ptr<X509, deleter<X509_free>>;

    auto openssl_error(std::string_view what) -> identity_error {
        auto buffer = std::array<char, 256>();
        const auto code = ERR_get_error();

        if (code == 0) return identity_error(what);

        ERR_error_string_n(code, buffer.data(), buffer.size());
        ERR_clear_error();

        return identity_error("{}: {}", what, buffer.data());
    }

    template <typename T, typename Encode>
    auto encode(const T* object, Encode&& fn) -> der {
        const auto size = fn(object, nullptr);
        if (size <= 0) throw openssl_error("DER encoding failed");

        auto result = der(size);
        auto* out = reinterpret_cast<unsigned char*>(result.data());

        if (fn(object, &out) != size) {
            throw openssl_error("DER encoding failed");
        }

        return result;
    }

    auto to_der(const X509* cert) -> der {
        return encode(cert, [](const X509* x, unsigned char** out) {
            return i2d_X509(x, out);
        });
    }

    auto to_der(const EVP_PKEY* key) -> der {
        auto info = pkcs8_ptr(EVP_PKEY2PKCS8(key));
        if (!info) throw openssl_error("Failed to convert key to PKCS#8");

        return encode(
            info.get(),
            [](const PKCS8_PRIV_KEY_INFO* p8, unsigned char** out) {
                return i2d_PKCS8_PRIV_KEY_INFO(p8, out);
            }
        );
    }

    auto parse_certificate(const der& bytes) -> x509_ptr {
        const auto* in = reinterpret_cast<const unsigned char*>(bytes.data());
        auto cert = x509_ptr(d2i_X509(nullptr, &in, bytes.size()));

        if (!cert) throw openssl_error("Malformed certificate");
        return cert;
    }

    auto parse_key(const der& bytes) -> key_ptr {
        const auto* in = reinterpret_cast<const unsigned char*>(bytes.data());
        auto key = key_ptr(d2i_AutoPrivateKey(nullptr, &in, bytes.size()));

        if (!key) throw openssl_error("Malformed private key");
        return key;
    }

    auto read_all(BIO* bio) -> std::string {
        char* data = nullptr;
        const auto size = BIO_get_mem_data(bio, &data);

        return std::string(data, size);
    }

    auto add_extension(X509* cert, int nid, const std::string& value)
        -> void {
        auto ctx = X509V3_CTX();

        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);

        auto extension = extension_ptr(
            X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str())
        );

        if (!extension || !X509_add_ext(cert, extension.get(), -1)) {
            throw openssl_error("Failed to add certificate extension");
        }
    }

    auto set_serial(X509* cert) -> void {
        auto serial = bignum_ptr(BN_new());

        if (
            !serial ||
            !BN_rand(serial.get(), 64, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) ||
            !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert))
        ) throw openssl_error("Failed to generate serial number");
    }

    auto open_file(const fs::path& path) -> bio_ptr {
        auto bio = bio_ptr(BIO_new_file(path.c_str(), "r"));

        if (!bio) {
            throw openssl_error(fmt::format(
                R"(Failed to open "{}")",
                path.native()
            ));
        }

        return bio;
    }
}

namespace duplex::server {
    auto identity::certificate_pem() const -> std::string {
        auto bio = bio_ptr(BIO_new(BIO_s_mem()));
        if (!bio) throw openssl_error("Failed to allocate memory BIO");

        for (const auto& entry : chain) {
            const auto cert = parse_certificate(entry);

            if (!PEM_write_bio_X509(bio.get(), cert.get())) {
                throw openssl_error("Failed to write certificate PEM");
            }
        }

        return read_all(bio.get());
    }

    auto identity::key_pem() const -> std::string {
        auto bio = bio_ptr(BIO_new(BIO_s_mem()));
        if (!bio) throw openssl_error("Failed to allocate memory BIO");

        const auto pkey = parse_key(key);

        if (!PEM_write_bio_PrivateKey(
            bio.get(),
            pkey.get(),
            nullptr,
            nullptr,
            0,
            nullptr,
            nullptr
        )) throw openssl_error("Failed to write private key PEM");

        return read_all(bio.get());
    }

    auto make_server_identity(std::string_view hostname) -> identity {
        if (hostname.empty()) {
            throw identity_error("Identity requires a host name");
        }

        const auto host = std::string(hostname);

        auto key = key_ptr(EVP_EC_gen("P-256"));
        if (!key) throw openssl_error("Failed to generate key");

        auto cert = x509_ptr(X509_new());
        if (!cert) throw openssl_error("Failed to allocate certificate");

        if (!X509_set_version(cert.get(), X509_VERSION_3)) {
            throw openssl_error("Failed to set certificate version");
        }

        set_serial(cert.get());

        if (
            !X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
            !X509_gmtime_adj(X509_getm_notAfter(cert.get()), validity_seconds)
        ) throw openssl_error("Failed to set certificate validity");

        auto* const name = X509_get_subject_name(cert.get());

        if (!X509_NAME_add_entry_by_txt(
            name,
            "CN",
            MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>(host.c_str()),
            -1,
            -1,
            0
        )) throw openssl_error("Failed to set certificate subject");

        if (
            !X509_set_issuer_name(cert.get(), name) ||
            !X509_set_pubkey(cert.get(), key.get())
        ) throw openssl_error("Failed to fill in certificate");

        add_extension(
            cert.get(),
            NID_subject_alt_name,
            fmt::format("DNS:{}", host)
        );

        if (!X509_sign(cert.get(), key.get(), EVP_sha256())) {
            throw openssl_error("Failed to sign certificate");
        }

        TIMBER_DEBUG("Generated self-signed certificate for '{}'", host);

        return identity {
            .chain = { to_der(cert.get()) },
            .key = to_der(key.get())
        };
    }

    auto load_server_identity(
        const fs::path& certificate,
        const fs::path& key
    ) -> identity {
        auto result = identity();

        const auto cert_file = open_file(certificate);

        while (auto cert = x509_ptr(PEM_read_bio_X509(
            cert_file.get(),
            nullptr,
            nullptr,
            nullptr
        ))) result.chain.push_back(to_der(cert.get()));

        // Reading stops with a "no start line" error at end of file.
        ERR_clear_error();

        if (result.chain.empty()) {
            throw identity_error(
                R"(No certificates found in "{}")",
                certificate.native()
            );
        }

        const auto key_file = open_file(key);
        const auto pkey = key_ptr(PEM_read_bio_PrivateKey(
            key_file.get(),
            nullptr,
            nullptr,
            nullptr
        ));

        if (!pkey) {
            throw openssl_error(fmt::format(
                R"(Failed to read private key "{}")",
                key.native()
            ));
        }

        result.key = to_der(pkey.get());

        TIMBER_DEBUG(
            R"(Loaded {} certificate{} from "{}")",
            result.chain.size(),
            result.chain.size() == 1 ? "" : "s",
            certificate.native()
        );

        return result;
    }
}
