#pragma once
#include <memory>

#include "../../tagcache/store/connection_pool.h"
#include "../../tagcache/store/memory_backend.h"
#include "../../tagcache/store/resp_connection.h"
#include "fake_resp_server.h"

#include <tagcache/types.h>

// Pool of memory backends over one keyspace
inline std::shared_ptr<tagcache::connection_pool> make_memory_pool(
    std::shared_ptr<tagcache::memory_keyspace> keyspace, size_t size = 4)
{
    return std::make_shared<tagcache::connection_pool>(
        [keyspace]() -> std::unique_ptr<tagcache::store_backend>
        {
            return std::make_unique<tagcache::memory_backend>(keyspace);
        },
        size);
}

// Pool of RESP connections served by `server`
inline std::shared_ptr<tagcache::connection_pool> make_resp_pool(fake_resp_server& server, size_t size = 2)
{
    return std::make_shared<tagcache::connection_pool>(
        [&server]() -> std::unique_ptr<tagcache::store_backend>
        {
            auto conn = std::make_unique<tagcache::resp_connection>();
            if (!conn->adopt(server.connect()))
                throw tagcache::store_error("socketpair failed");
            return conn;
        },
        size);
}
