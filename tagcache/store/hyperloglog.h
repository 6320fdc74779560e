#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tagcache {

// Dense HyperLogLog with 2^14 registers: ~0.81% standard error, the same
// precision the Redis PF* commands use.
class hyperloglog
{
public:
    static constexpr int PRECISION = 14;
    static constexpr size_t REGISTERS = size_t{1} << PRECISION;

    hyperloglog() : m_registers(REGISTERS, 0) {}

    // Returns true if at least one register was altered
    bool add(std::string_view item);

    uint64_t count() const;

    bool empty() const { return m_empty; }

    static double standard_error() { return 1.04 / 128.0; } // 1.04 / sqrt(REGISTERS)

private:
    std::vector<uint8_t> m_registers;
    bool m_empty = true;
};

} // namespace tagcache
