#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "logging.h"
#include "../client/pattern_scanner.h"
#include "../store/connection_pool.h"

namespace tagcache {

struct provider_options;
class memory_keyspace;

enum backend_type : uint8_t
{
    backend_resp   = 0,
    backend_memory = 1
};

struct store_config
{
    backend_type backend = backend_resp;
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string username;
    std::string password;
    int database = 0;

    bool tls = false;
    std::string ca;
    std::string cert;
    std::string key;

    uint32_t pool_size = 4;
    uint32_t connect_timeout_ms = 2000;
    uint32_t io_timeout_ms = 2000;

    std::string tag_prefix = "_tag:";
    scan_strategy scan = scan_auto;
    uint32_t scan_page_size = 250;
    log_level level = log_info;
};

// Runs a Lua config script. The script either returns a table or defines a
// global `tagcache` table; absent fields keep their defaults. Returns false
// with a message in `error` on script errors or invalid values.
bool load_config(const std::string& path, store_config& out, std::string& error);
bool load_config_string(std::string_view script, store_config& out, std::string& error);

// Pool for the configured backend. A memory backend pool shares one keyspace,
// optionally supplied by the caller.
std::shared_ptr<connection_pool> make_pool(const store_config& config,
                                           std::shared_ptr<memory_keyspace> keyspace = nullptr);

provider_options make_provider_options(const store_config& config);

} // namespace tagcache
