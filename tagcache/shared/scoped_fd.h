#pragma once
#include <cstdint>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace tagcache {

// Owned stream socket. Closing is idempotent; moved-from handles are empty.
class scoped_fd
{
public:
    scoped_fd() noexcept = default;
    explicit scoped_fd(int fd) noexcept : m_fd(fd) {}
    ~scoped_fd() { reset(); }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    scoped_fd(scoped_fd&& other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }

    scoped_fd& operator=(scoped_fd&& other) noexcept
    {
        if (this != &other)
        {
            reset(other.m_fd);
            other.m_fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return m_fd; }
    explicit operator bool() const noexcept { return m_fd >= 0; }

    void reset(int fd = -1) noexcept
    {
        if (m_fd >= 0)
            ::close(m_fd);
        m_fd = fd;
    }

    // Wakes any thread blocked on the socket without releasing the descriptor
    void shutdown() noexcept
    {
        if (m_fd >= 0)
            ::shutdown(m_fd, SHUT_RDWR);
    }

    // Request/response traffic: no Nagle delay
    void set_nodelay() noexcept
    {
        int opt = 1;
        setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    }

    // Bounds every blocking send/recv; 0 leaves them unbounded
    void set_io_timeout(uint32_t ms) noexcept
    {
        if (ms == 0)
            return;
        struct timeval tv{};
        tv.tv_sec = static_cast<long>(ms / 1000);
        tv.tv_usec = static_cast<long>((ms % 1000) * 1000);
        setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(m_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

private:
    int m_fd = -1;
};

} // namespace tagcache
