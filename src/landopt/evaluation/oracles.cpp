// oracles.cpp
#include "oracles.hpp"

#include <stdexcept>
#include <utility>

namespace landopt::evaluation {

double roiPercentage(double total_cost, double total_revenue)
{
    if (!(total_cost > 0.0)) return 0.0;
    return (total_revenue - total_cost) / total_cost * 100.0;
}

FunctionFinancialOracle::FunctionFinancialOracle(Function fn)
    : m_fn(std::move(fn))
{
    if (!m_fn) throw std::invalid_argument("Financial oracle function is empty.");
}

FinancialScore FunctionFinancialOracle::score(const layout::Layout& layout) const
{
    return m_fn(layout);
}

CachingFinancialOracle::CachingFinancialOracle(const FinancialOracle& inner, std::size_t limit)
    : m_inner(inner), m_limit(limit)
{
    if (limit == 0) throw std::invalid_argument("Financial cache limit must be positive.");
}

CachingFinancialOracle::LayoutKey CachingFinancialOracle::keyOf(const layout::Layout& layout)
{
    LayoutKey k;
    k.lots = layout.lots.size();
    k.sellable_area = layout.sellableArea();
    k.road_area = layout.roads.surfaceArea();
    k.road_length = layout.roads.totalLength();
    k.green_area = layout.green_area;
    return k;
}

FinancialScore CachingFinancialOracle::score(const layout::Layout& layout) const
{
    const LayoutKey key = keyOf(layout);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cache.find(layout.genome_hash);
        if (it != m_cache.end() && it->second.key == key) {
            ++m_hits;
            return it->second.score;
        }
        ++m_misses;
    }

    // scored outside the lock; a concurrent duplicate just computes twice
    const FinancialScore s = m_inner.score(layout);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(layout.genome_hash);
    if (it != m_cache.end()) {
        // collision or concurrent insert: the latest layout owns the slot
        it->second = Entry{key, s};
        return s;
    }
    while (m_cache.size() >= m_limit && !m_order.empty()) {
        m_cache.erase(m_order.front());
        m_order.pop_front();
    }
    m_cache.emplace(layout.genome_hash, Entry{key, s});
    m_order.push_back(layout.genome_hash);
    return s;
}

std::size_t CachingFinancialOracle::hits() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hits;
}

std::size_t CachingFinancialOracle::misses() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_misses;
}

std::size_t CachingFinancialOracle::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

void CachingFinancialOracle::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
    m_order.clear();
    m_hits = 0;
    m_misses = 0;
}

} // namespace landopt::evaluation
