#include "backend_client/trust_store.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>

#include "backend_client/logging.hpp"

namespace ssl = boost::asio::ssl;

namespace backend_client {

    namespace {

        struct BioDeleter {
            void operator()(BIO* b) const noexcept { BIO_free(b); }
        };
        struct X509Deleter {
            void operator()(X509* x) const noexcept { X509_free(x); }
        };
        using BioPtr = std::unique_ptr<BIO, BioDeleter>;
        using X509Ptr = std::unique_ptr<X509, X509Deleter>;

        // BIO_new_mem_buf takes an int length.
        constexpr std::size_t kMaxPemBytes =
            static_cast<std::size_t>(std::numeric_limits<int>::max());

        BioPtr make_mem_bio(std::string_view data) {
            if (data.size() > kMaxPemBytes) return nullptr;
            return BioPtr(
                BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
        }

        void add_certificate_dir(ssl::context& ctx,
                                 const std::filesystem::path& dir,
                                 TrustStoreStats& stats) {
            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec);
            if (ec) {
                logger()->debug("skipping CA directory {}: {}", dir.string(),
                                ec.message());
                return;
            }

            for (std::filesystem::directory_iterator end; it != end;
                 it.increment(ec)) {
                if (ec) break;
                std::error_code type_ec;
                if (it->is_directory(type_ec)) continue;

                std::size_t added = add_certificate_file(ctx, it->path());
                if (added == 0) {
                    ++stats.skipped_files;
                } else {
                    stats.ca_path_certificates += added;
                }
            }
            if (ec) {
                logger()->debug("stopped reading CA directory {}: {}",
                                dir.string(), ec.message());
            }
        }

        Result<TlsClientSettings> load_client_certificate(
            TlsClientSettings settings, const ClientCertificate& pair) {
            boost::system::error_code ec;
            settings.context->use_certificate_chain_file(
                pair.cert_path.string(), ec);
            if (ec) {
                return Result<TlsClientSettings>::err(
                    Error::Code::InvalidClientCertificate,
                    "load client certificate " + pair.cert_path.string() +
                        ": " + ec.message());
            }

            // Never prompt for a passphrase: an encrypted key fails to load.
            settings.context->set_password_callback(
                [](std::size_t, ssl::context::password_purpose) {
                    return std::string();
                },
                ec);
            if (ec) {
                return Result<TlsClientSettings>::err(
                    Error::Code::TlsConfigurationFailed,
                    "failed to install key password callback: " +
                        ec.message());
            }

            settings.context->use_private_key_file(pair.key_path.string(),
                                                   ssl::context::pem, ec);
            if (ec) {
                return Result<TlsClientSettings>::err(
                    Error::Code::InvalidClientCertificate,
                    "load client key " + pair.key_path.string() + ": " +
                        ec.message());
            }

            if (SSL_CTX_check_private_key(settings.context->native_handle()) !=
                1) {
                ERR_clear_error();
                return Result<TlsClientSettings>::err(
                    Error::Code::InvalidClientCertificate,
                    "client certificate " + pair.cert_path.string() +
                        " does not match key " + pair.key_path.string());
            }

            settings.client_certificate_count = 1;
            return Result<TlsClientSettings>::ok(std::move(settings));
        }

    }  // namespace

    std::size_t add_pem_certificates(ssl::context& ctx, std::string_view pem) {
        BioPtr bio = make_mem_bio(pem);
        if (!bio) return 0;

        X509_STORE* store = SSL_CTX_get_cert_store(ctx.native_handle());
        std::size_t added = 0;
        for (;;) {
            X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
            if (!cert) break;
            if (X509_STORE_add_cert(store, cert.get()) == 1) ++added;
        }

        // PEM_read_bio_X509 always ends on an error (no more PEM blocks).
        ERR_clear_error();
        return added;
    }

    std::size_t add_certificate_file(ssl::context& ctx,
                                     const std::filesystem::path& file) {
        std::error_code size_ec;
        const auto size = std::filesystem::file_size(file, size_ec);
        if (!size_ec && size > kMaxPemBytes) {
            logger()->debug("skipping oversized CA file {} ({} bytes)",
                            file.string(), size);
            return 0;
        }

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            logger()->debug("skipping unreadable CA file {}", file.string());
            return 0;
        }

        std::ostringstream buf;
        buf << in.rdbuf();
        std::size_t added = add_pem_certificates(ctx, buf.str());
        if (added == 0) {
            logger()->debug("no certificates found in CA file {}",
                            file.string());
        }
        return added;
    }

    bool trusts_certificate(ssl::context& ctx, std::string_view pem) {
        BioPtr bio = make_mem_bio(pem);
        if (!bio) return false;
        X509Ptr wanted(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!wanted) {
            ERR_clear_error();
            return false;
        }

        X509_STORE* store = SSL_CTX_get_cert_store(ctx.native_handle());
        STACK_OF(X509_OBJECT)* objects = X509_STORE_get0_objects(store);
        for (int i = 0; i < sk_X509_OBJECT_num(objects); ++i) {
            X509* cert = X509_OBJECT_get0_X509(sk_X509_OBJECT_value(objects, i));
            if (cert != nullptr && X509_cmp(cert, wanted.get()) == 0) {
                return true;
            }
        }
        return false;
    }

    Result<TlsClientSettings> build_tls_context(const ClientConfig& config) {
        TlsClientSettings settings;
        settings.context =
            std::make_shared<ssl::context>(ssl::context::tls_client);
        settings.insecure_skip_verify = config.self_signed_cert;

        boost::system::error_code ec;
        settings.context->set_default_verify_paths(ec);
        if (ec) {
            // Fall back to an empty pool; the CA file/dir may still fill it.
            logger()->debug("system trust roots unavailable: {}", ec.message());
            ERR_clear_error();
        } else {
            settings.trust.system_roots_loaded = true;
        }

        if (config.ca_file) {
            settings.trust.ca_file_certificates =
                add_certificate_file(*settings.context, *config.ca_file);
            if (settings.trust.ca_file_certificates == 0) {
                ++settings.trust.skipped_files;
            }
        }

        if (config.ca_path) {
            add_certificate_dir(*settings.context, *config.ca_path,
                                settings.trust);
        }

        if (settings.trust.skipped_files > 0) {
            logger()->debug("{} CA file(s) skipped while building trust pool",
                            settings.trust.skipped_files);
        }

        if (SSL_CTX_set_min_proto_version(settings.context->native_handle(),
                                          TLS1_2_VERSION) != 1) {
            ERR_clear_error();
            return Result<TlsClientSettings>::err(
                Error::Code::TlsConfigurationFailed,
                "failed to pin minimum TLS version to 1.2");
        }

        settings.context->set_verify_mode(
            config.self_signed_cert ? ssl::verify_none : ssl::verify_peer, ec);
        if (ec) {
            return Result<TlsClientSettings>::err(
                Error::Code::TlsConfigurationFailed,
                "failed to set TLS verify mode: " + ec.message());
        }

        if (config.has_cert_and_key()) {
            return load_client_certificate(std::move(settings),
                                           *config.client_certificate);
        }

        return Result<TlsClientSettings>::ok(std::move(settings));
    }

}  // namespace backend_client
