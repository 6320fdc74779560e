#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "store_backend.h"
#include "memory_store.h"

namespace tagcache {

// A memory_store shared by every backend handle of a pool. Commands are
// dispatched with the same names, arguments and replies as a Redis server, so
// the client layer cannot tell the two apart. One mutex makes every command
// (and every batch) atomic.
class memory_keyspace
{
public:
    // Watched keys with the version each had at WATCH time
    using watch_list = std::vector<std::pair<std::string, uint64_t>>;

    resp::reply execute(const command& cmd);
    std::vector<resp::reply> execute_batch(const std::vector<command>& cmds);

    // ─── Optimistic transactions ───

    // Starts tracking writes to `key`; returns its current version
    uint64_t watch(const std::string& key);
    void unwatch(const watch_list& watched);

    // Runs `queued` under one lock and answers the array of their replies,
    // or nil when any watched key was written since it was watched. Releases
    // the watches either way.
    resp::reply exec(const watch_list& watched, const std::vector<command>& queued);

    // Answer `name` as an unknown command from now on (servers lacking SCAN etc.)
    void disable_command(std::string_view name);

    uint32_t size();

private:
    struct watch_slot
    {
        uint64_t version = 0;
        uint32_t watchers = 0;
    };

    resp::reply apply(const command& cmd);
    resp::reply dispatch(const command& cmd);
    void touch_written(const command& cmd);
    void release_watches(const watch_list& watched);

    std::mutex m_mutex;
    memory_store m_store;
    std::unordered_set<uint32_t> m_disabled;
    std::unordered_map<std::string, watch_slot> m_watches;
};

// Pool handle onto a shared keyspace. Like a server connection it carries its
// own WATCH / MULTI / EXEC state.
class memory_backend : public store_backend
{
public:
    explicit memory_backend(std::shared_ptr<memory_keyspace> keyspace)
        : m_keyspace(std::move(keyspace)) {}
    ~memory_backend() override;

    memory_backend(const memory_backend&) = delete;
    memory_backend& operator=(const memory_backend&) = delete;

    resp::reply execute(const command& cmd) override;
    std::vector<resp::reply> execute_batch(const std::vector<command>& cmds) override;

    bool is_healthy() const override { return true; }

private:
    void reset_transaction();

    std::shared_ptr<memory_keyspace> m_keyspace;
    memory_keyspace::watch_list m_watched;
    std::vector<command> m_queued;
    bool m_in_multi = false;
};

} // namespace tagcache
