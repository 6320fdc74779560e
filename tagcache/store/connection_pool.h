#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "store_backend.h"

namespace tagcache {

// Bounded set of backends shared by every caller. acquire() hands out a
// lease that returns its backend on destruction; a backend that went
// unhealthy while leased is dropped instead, and the pool grows again on
// the next demand.
class connection_pool
{
public:
    // Creates a connected backend; throws store_error when it cannot
    using factory = std::function<std::unique_ptr<store_backend>()>;

    class lease
    {
    public:
        lease() = default;
        lease(connection_pool* pool, std::unique_ptr<store_backend> backend)
            : m_pool(pool), m_backend(std::move(backend)) {}
        ~lease() { release(); }

        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;

        lease(lease&& other) noexcept
            : m_pool(other.m_pool), m_backend(std::move(other.m_backend))
        {
            other.m_pool = nullptr;
        }

        lease& operator=(lease&& other) noexcept
        {
            if (this != &other)
            {
                release();
                m_pool = other.m_pool;
                m_backend = std::move(other.m_backend);
                other.m_pool = nullptr;
            }
            return *this;
        }

        store_backend* operator->() const { return m_backend.get(); }
        store_backend& operator*() const { return *m_backend; }
        explicit operator bool() const { return static_cast<bool>(m_backend); }

        void release()
        {
            if (m_pool && m_backend)
                m_pool->give_back(std::move(m_backend));
            m_pool = nullptr;
        }

    private:
        connection_pool* m_pool = nullptr;
        std::unique_ptr<store_backend> m_backend;
    };

    connection_pool(factory make, size_t max_size);
    ~connection_pool();

    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    // Blocks until a backend is idle or the pool may open another one
    lease acquire();

    size_t idle_count() const;
    size_t size() const;       // open backends, leased or idle
    size_t max_size() const { return m_max; }

private:
    void give_back(std::unique_ptr<store_backend> backend);

    factory m_make;
    size_t m_max;
    size_t m_open = 0;
    std::vector<std::unique_ptr<store_backend>> m_idle;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace tagcache
