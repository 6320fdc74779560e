#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "store_backend.h"
#include "../shared/scoped_fd.h"

typedef struct ssl_st SSL;

namespace tagcache {

class tls_context;

struct resp_endpoint
{
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string username;           // ACL user; empty = legacy AUTH
    std::string password;
    int database = 0;
    uint32_t connect_timeout_ms = 2000;
    uint32_t io_timeout_ms = 2000;  // 0 = block forever
    std::shared_ptr<tls_context> tls;  // null = plaintext
};

// Blocking connection to a Redis-compatible server speaking RESP2.
class resp_connection : public store_backend
{
public:
    resp_connection() = default;
    ~resp_connection() override;

    resp_connection(const resp_connection&) = delete;
    resp_connection& operator=(const resp_connection&) = delete;

    // Connects, then authenticates and selects the database when configured.
    // Returns false and records last_error() on failure.
    bool connect(const resp_endpoint& ep);

    // Takes ownership of an already connected plaintext socket
    bool adopt(scoped_fd fd);

    void close();

    resp::reply execute(const command& cmd) override;
    std::vector<resp::reply> execute_batch(const std::vector<command>& cmds) override;

    bool is_healthy() const override { return static_cast<bool>(m_fd) && !m_broken; }

    const std::string& last_error() const { return m_last_error; }
    const std::string& host() const { return m_host; }
    uint16_t port() const { return m_port; }

private:
    bool handshake(const resp_endpoint& ep);
    bool send_all(const std::string& data);
    bool read_reply(resp::reply& out);
    int raw_recv(char* buf, int len);
    int raw_send(const char* buf, int len);
    [[noreturn]] void fail(std::string_view what, int err = 0);

    scoped_fd m_fd;
    SSL* m_ssl = nullptr;
    std::string m_buf;
    bool m_broken = false;
    std::string m_last_error;
    std::string m_host;
    uint16_t m_port = 0;
};

} // namespace tagcache
