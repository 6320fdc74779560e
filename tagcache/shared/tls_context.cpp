#include "tls_context.h"
#include "logging.h"

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace tagcache {

tls_context::tls_context() = default;

tls_context::~tls_context()
{
    if (m_ctx)
        SSL_CTX_free(m_ctx);
}

bool tls_context::init_client(std::string_view ca_path,
                              std::string_view client_cert,
                              std::string_view client_key)
{
    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx)
    {
        TAGCACHE_LOG_ERROR("tls: failed to create SSL context");
        return false;
    }
    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);

    // Reconnects from the pool resume the previous session
    SSL_CTX_set_session_cache_mode(m_ctx, SSL_SESS_CACHE_CLIENT);
    SSL_CTX_sess_set_cache_size(m_ctx, 1024);

    // Blocking sockets: let OpenSSL retry reads/writes interrupted by
    // post-handshake messages instead of surfacing WANT_READ.
    SSL_CTX_set_mode(m_ctx, SSL_MODE_AUTO_RETRY);

    if (!ca_path.empty())
    {
        if (SSL_CTX_load_verify_locations(m_ctx, std::string(ca_path).c_str(), nullptr) <= 0)
        {
            TAGCACHE_LOG_ERROR("tls: failed to load CA file: " + std::string(ca_path));
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, nullptr);
    }

    if (!client_cert.empty() && !client_key.empty())
    {
        if (SSL_CTX_use_certificate_file(m_ctx, std::string(client_cert).c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            TAGCACHE_LOG_ERROR("tls: failed to load client certificate: " + std::string(client_cert));
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
        if (SSL_CTX_use_PrivateKey_file(m_ctx, std::string(client_key).c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            TAGCACHE_LOG_ERROR("tls: failed to load client key: " + std::string(client_key));
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
            return false;
        }
    }

    return true;
}

SSL* tls_context::connect(int fd, std::string_view server_name) const
{
    if (!m_ctx)
        return nullptr;

    SSL* ssl = SSL_new(m_ctx);
    if (!ssl)
        return nullptr;

    if (SSL_set_fd(ssl, fd) != 1)
    {
        SSL_free(ssl);
        return nullptr;
    }

    if (!server_name.empty())
        SSL_set_tlsext_host_name(ssl, std::string(server_name).c_str());

    if (SSL_connect(ssl) != 1)
    {
        TAGCACHE_LOG_WARN("tls: handshake failed: " + last_error());
        SSL_free(ssl);
        return nullptr;
    }

    return ssl;
}

int tls_context::ssl_read(SSL* ssl, char* buf, int len)
{
    int n = SSL_read(ssl, buf, len);
    if (n > 0)
        return n;
    int err = SSL_get_error(ssl, n);
    if (err == SSL_ERROR_ZERO_RETURN)
        return 0;
    return -1;
}

int tls_context::ssl_write(SSL* ssl, const char* buf, int len)
{
    int n = SSL_write(ssl, buf, len);
    return n > 0 ? n : -1;
}

void tls_context::free_ssl(SSL* ssl)
{
    if (ssl)
    {
        SSL_shutdown(ssl);
        SSL_free(ssl);
    }
}

std::string tls_context::last_error()
{
    unsigned long code = ERR_get_error();
    if (code == 0)
        return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace tagcache
