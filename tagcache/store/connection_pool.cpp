#include "connection_pool.h"
#include "../shared/logging.h"

#include <tagcache/types.h>

#include <string>

namespace tagcache {

connection_pool::connection_pool(factory make, size_t max_size)
    : m_make(std::move(make)), m_max(max_size == 0 ? 1 : max_size)
{
    m_idle.reserve(m_max);
}

connection_pool::~connection_pool()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_idle.clear();
}

connection_pool::lease connection_pool::acquire()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_idle.empty() || m_open < m_max; });

    if (!m_idle.empty())
    {
        auto backend = std::move(m_idle.back());
        m_idle.pop_back();
        return lease(this, std::move(backend));
    }

    // Reserve the slot, then connect without holding the lock
    ++m_open;
    lock.unlock();

    std::unique_ptr<store_backend> backend;
    try
    {
        backend = m_make();
    }
    catch (...)
    {
        lock.lock();
        --m_open;
        lock.unlock();
        m_cv.notify_one();
        throw;
    }

    if (!backend)
    {
        lock.lock();
        --m_open;
        lock.unlock();
        m_cv.notify_one();
        throw store_error("connection factory returned no backend");
    }

    TAGCACHE_LOG_DEBUG("pool opened backend (" + std::to_string(size()) + "/" +
                       std::to_string(m_max) + ")");
    return lease(this, std::move(backend));
}

void connection_pool::give_back(std::unique_ptr<store_backend> backend)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (backend->is_healthy())
        {
            m_idle.push_back(std::move(backend));
        }
        else
        {
            --m_open;
            backend.reset();
            TAGCACHE_LOG_WARN("pool discarded an unhealthy backend");
        }
    }
    m_cv.notify_one();
}

size_t connection_pool::idle_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle.size();
}

size_t connection_pool::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

} // namespace tagcache
