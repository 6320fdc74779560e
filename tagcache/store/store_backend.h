#pragma once
#include <string>
#include <vector>

#include "resp_protocol.h"

namespace tagcache {

using command = std::vector<std::string>;

// Command surface of the backing store. Implementations run one command (or a
// pipelined batch) and hand back the raw reply; error replies are returned,
// not thrown. Transport failures throw store_error and leave the backend
// unhealthy so the pool discards it.
class store_backend
{
public:
    virtual ~store_backend() = default;

    virtual resp::reply execute(const command& cmd) = 0;

    // Default: one round trip per command. Network backends override this to
    // write the whole batch before reading the replies.
    virtual std::vector<resp::reply> execute_batch(const std::vector<command>& cmds)
    {
        std::vector<resp::reply> out;
        out.reserve(cmds.size());
        for (const auto& c : cmds)
            out.push_back(execute(c));
        return out;
    }

    virtual bool is_healthy() const = 0;
};

} // namespace tagcache
