#include "resp_connection.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

#include <tagcache/types.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace tagcache {

namespace {

// Non-blocking connect bounded by timeout_ms, then back to blocking mode
int connect_with_timeout(const struct addrinfo* rp, uint32_t timeout_ms)
{
    int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd < 0)
        return -1;

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
    if (rc < 0 && errno != EINPROGRESS)
    {
        ::close(fd);
        return -1;
    }

    if (rc < 0)
    {
        struct pollfd pfd{fd, POLLOUT, 0};
        int timeout = timeout_ms == 0 ? -1 : static_cast<int>(timeout_ms);
        if (poll(&pfd, 1, timeout) <= 0)
        {
            ::close(fd);
            return -1;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0)
        {
            ::close(fd);
            return -1;
        }
    }

    fcntl(fd, F_SETFL, flags);
    return fd;
}

} // namespace

resp_connection::~resp_connection()
{
    close();
}

bool resp_connection::connect(const resp_endpoint& ep)
{
    close();
    m_host = ep.host;
    m_port = ep.port;

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    char port_str[8];
    std::snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(ep.port));

    if (getaddrinfo(ep.host.c_str(), port_str, &hints, &res) != 0 || !res)
    {
        m_last_error = "cannot resolve " + ep.host;
        TAGCACHE_LOG_WARN(m_last_error);
        return false;
    }

    int fd = -1;
    for (auto* rp = res; rp; rp = rp->ai_next)
    {
        fd = connect_with_timeout(rp, ep.connect_timeout_ms);
        if (fd >= 0)
            break;
    }
    freeaddrinfo(res);

    if (fd < 0)
    {
        m_last_error = "cannot connect to " + ep.host + ":" + port_str;
        TAGCACHE_LOG_WARN(m_last_error);
        return false;
    }

    m_fd.reset(fd);
    m_fd.set_nodelay();
    m_fd.set_io_timeout(ep.io_timeout_ms);

    if (ep.tls)
    {
        m_ssl = ep.tls->connect(fd, ep.host);
        if (!m_ssl)
        {
            m_last_error = "tls handshake with " + ep.host + " failed";
            TAGCACHE_LOG_WARN(m_last_error);
            close();
            return false;
        }
    }

    if (!handshake(ep))
    {
        TAGCACHE_LOG_WARN(m_last_error);
        close();
        return false;
    }

    TAGCACHE_LOG_DEBUG("connected to " + ep.host + ":" + port_str);
    return true;
}

bool resp_connection::handshake(const resp_endpoint& ep)
{
    std::vector<command> cmds;
    if (!ep.password.empty())
    {
        if (ep.username.empty())
            cmds.push_back({"AUTH", ep.password});
        else
            cmds.push_back({"AUTH", ep.username, ep.password});
    }
    if (ep.database != 0)
        cmds.push_back({"SELECT", std::to_string(ep.database)});

    if (cmds.empty())
        return true;

    try
    {
        auto replies = execute_batch(cmds);
        for (const auto& r : replies)
        {
            if (r.is_error())
            {
                m_last_error = "handshake rejected: " + r.str;
                return false;
            }
        }
    }
    catch (const store_error& e)
    {
        m_last_error = e.what();
        return false;
    }
    return true;
}

bool resp_connection::adopt(scoped_fd fd)
{
    close();
    if (!fd)
        return false;
    m_fd = std::move(fd);
    m_host = "adopted";
    return true;
}

void resp_connection::close()
{
    if (m_ssl)
    {
        tls_context::free_ssl(m_ssl);
        m_ssl = nullptr;
    }
    m_fd.reset();
    m_buf.clear();
    m_broken = false;
}

resp::reply resp_connection::execute(const command& cmd)
{
    if (!is_healthy())
        fail("connection is not open");

    std::string out;
    resp::encode_command_into(out, cmd);
    if (!send_all(out))
        fail("write failed", errno);

    resp::reply r;
    if (!read_reply(r))
        fail("read failed", errno);
    return r;
}

std::vector<resp::reply> resp_connection::execute_batch(const std::vector<command>& cmds)
{
    if (!is_healthy())
        fail("connection is not open");

    std::string out;
    for (const auto& c : cmds)
        resp::encode_command_into(out, c);
    if (!send_all(out))
        fail("write failed", errno);

    std::vector<resp::reply> replies(cmds.size());
    for (auto& r : replies)
    {
        if (!read_reply(r))
            fail("read failed", errno);
    }
    return replies;
}

void resp_connection::fail(std::string_view what, int err)
{
    m_broken = true;
    m_last_error = std::string(what);
    if (err != 0)
    {
        m_last_error += ": ";
        m_last_error += std::strerror(err);
    }
    throw store_error("store " + m_host + ": " + m_last_error);
}

bool resp_connection::send_all(const std::string& data)
{
    size_t sent = 0;
    while (sent < data.size())
    {
        int n = raw_send(data.data() + sent, static_cast<int>(data.size() - sent));
        if (n <= 0)
            return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool resp_connection::read_reply(resp::reply& out)
{
    for (;;)
    {
        if (!m_buf.empty())
        {
            size_t consumed = 0;
            auto pr = resp::parse_reply(m_buf, out, consumed);
            if (pr == resp::parse_result::ok)
            {
                m_buf.erase(0, consumed);
                return true;
            }
            if (pr == resp::parse_result::error)
            {
                errno = EPROTO;
                return false;
            }
        }

        char tmp[16384];
        int n = raw_recv(tmp, sizeof(tmp));
        if (n <= 0)
        {
            if (n == 0)
                errno = ECONNRESET;
            return false;
        }
        m_buf.append(tmp, static_cast<size_t>(n));
    }
}

int resp_connection::raw_recv(char* buf, int len)
{
    errno = 0;
    if (m_ssl)
        return tls_context::ssl_read(m_ssl, buf, len);
    ssize_t n;
    do
        n = ::recv(m_fd.get(), buf, static_cast<size_t>(len), 0);
    while (n < 0 && errno == EINTR);
    return static_cast<int>(n);
}

int resp_connection::raw_send(const char* buf, int len)
{
    errno = 0;
    if (m_ssl)
        return tls_context::ssl_write(m_ssl, buf, len);
    ssize_t n;
    do
        n = ::send(m_fd.get(), buf, static_cast<size_t>(len), MSG_NOSIGNAL);
    while (n < 0 && errno == EINTR);
    return static_cast<int>(n);
}

} // namespace tagcache
