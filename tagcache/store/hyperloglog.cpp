#include "hyperloglog.h"
#include "../shared/command_hashing.h"

#include <bit>
#include <cmath>

namespace tagcache {

bool hyperloglog::add(std::string_view item)
{
    uint64_t hash = fnv1a_64(item);
    size_t index = static_cast<size_t>(hash & (REGISTERS - 1));

    // Sentinel bit caps the run length at 64 - PRECISION + 1
    uint64_t rest = (hash >> PRECISION) | (uint64_t{1} << (64 - PRECISION));
    auto rank = static_cast<uint8_t>(std::countr_zero(rest) + 1);

    m_empty = false;
    if (rank > m_registers[index])
    {
        m_registers[index] = rank;
        return true;
    }
    return false;
}

uint64_t hyperloglog::count() const
{
    if (m_empty)
        return 0;

    const double m = static_cast<double>(REGISTERS);
    double sum = 0.0;
    size_t zeros = 0;
    for (uint8_t r : m_registers)
    {
        sum += std::ldexp(1.0, -static_cast<int>(r));
        if (r == 0)
            ++zeros;
    }

    const double alpha = 0.7213 / (1.0 + 1.079 / m);
    double estimate = alpha * m * m / sum;

    // Small range: linear counting is far more accurate while registers are sparse
    if (estimate <= 2.5 * m && zeros > 0)
        estimate = m * std::log(m / static_cast<double>(zeros));

    return static_cast<uint64_t>(std::llround(estimate));
}

} // namespace tagcache
