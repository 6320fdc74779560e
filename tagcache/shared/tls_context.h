#pragma once
#include <string>
#include <string_view>

// Forward declare OpenSSL types to avoid pulling in headers everywhere
typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace tagcache {

// Client-side TLS context for store connections. SSL objects created from it
// are bound directly to a blocking socket.
class tls_context
{
public:
    tls_context();
    ~tls_context();

    tls_context(const tls_context&) = delete;
    tls_context& operator=(const tls_context&) = delete;

    // If ca_path is non-empty the peer certificate is verified against it.
    // If client_cert/client_key are non-empty, presents a client certificate (mTLS)
    bool init_client(std::string_view ca_path = {},
                     std::string_view client_cert = {},
                     std::string_view client_key = {});

    // Create an SSL object in client mode bound to `fd` and run the handshake.
    // `server_name` is sent as SNI when non-empty. Returns nullptr on failure.
    SSL* connect(int fd, std::string_view server_name) const;

    // Returns bytes read, 0 = peer closed, -1 = error
    static int ssl_read(SSL* ssl, char* buf, int len);

    // Returns bytes written, -1 = error
    static int ssl_write(SSL* ssl, const char* buf, int len);

    static void free_ssl(SSL* ssl);

    // Last OpenSSL error queue entry as text
    static std::string last_error();

    bool is_initialized() const { return m_ctx != nullptr; }

private:
    SSL_CTX* m_ctx = nullptr;
};

} // namespace tagcache
