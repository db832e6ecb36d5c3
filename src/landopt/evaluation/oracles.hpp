//
// Scoring oracles consumed by the fitness evaluator.
// Implementations must be thread-safe: the engine calls them from an OpenMP team.
//

#ifndef LANDOPT_ORACLES_HPP
#define LANDOPT_ORACLES_HPP

#include "../layout/layout.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace landopt::evaluation {

struct FinancialScore {
    double total_cost     = 0.0;
    double total_revenue  = 0.0;
    double roi_percentage = 0.0;
};

struct UtilityScore {
    double network_cost = 0.0;
};

struct TerrainScore {
    double      grading_cost     = 0.0;
    std::size_t slope_violations = 0;
};

/// (revenue - cost) / cost * 100, or 0 when the cost is not positive.
double roiPercentage(double total_cost, double total_revenue);

class FinancialOracle {
public:
    virtual ~FinancialOracle() = default;

    /// May throw; the evaluator records anything thrown as an oracle failure.
    virtual FinancialScore score(const layout::Layout& layout) const = 0;
};

class UtilityOracle {
public:
    virtual ~UtilityOracle() = default;
    virtual UtilityScore score(const std::vector<layout::Lot>& lots,
                               const layout::RoadNetwork& roads) const = 0;
};

class TerrainOracle {
public:
    virtual ~TerrainOracle() = default;
    virtual TerrainScore score(const layout::Layout& layout) const = 0;
};

/**
 * @brief Adapts a callable to the FinancialOracle interface.
 */
class FunctionFinancialOracle : public FinancialOracle {
public:
    using Function = std::function<FinancialScore(const layout::Layout&)>;

    explicit FunctionFinancialOracle(Function fn);

    FinancialScore score(const layout::Layout& layout) const override;

private:
    Function m_fn;
};

/**
 * @brief Memoizes another financial oracle by the layout's genome hash.
 *
 * @details Decoding is pure, so equal genomes give equal layouts and equal
 * scores. Each entry also keeps the layout's aggregates; a hash hit whose
 * aggregates differ is a collision and is scored again. At most `limit`
 * entries are held, the oldest evicted first. Failures are not cached and
 * propagate to the caller. The wrapped oracle must outlive the adapter.
 */
class CachingFinancialOracle : public FinancialOracle {
public:
    static constexpr std::size_t kDefaultLimit = 4096;

    /// @throws std::invalid_argument if limit is zero.
    explicit CachingFinancialOracle(const FinancialOracle& inner, std::size_t limit = kDefaultLimit);

    FinancialScore score(const layout::Layout& layout) const override;

    std::size_t hits() const;
    std::size_t misses() const;
    std::size_t size() const;
    std::size_t limit() const { return m_limit; }
    void clear();

private:
    struct LayoutKey {
        std::size_t lots = 0;
        double sellable_area = 0.0;
        double road_area = 0.0;
        double road_length = 0.0;
        double green_area = 0.0;

        bool operator==(const LayoutKey& o) const {
            return lots == o.lots && sellable_area == o.sellable_area && road_area == o.road_area &&
                   road_length == o.road_length && green_area == o.green_area;
        }
    };

    struct Entry {
        LayoutKey key;
        FinancialScore score;
    };

    static LayoutKey keyOf(const layout::Layout& layout);

    const FinancialOracle& m_inner;
    std::size_t m_limit;

    mutable std::mutex m_mutex;
    mutable std::unordered_map<std::uint64_t, Entry> m_cache;
    mutable std::deque<std::uint64_t> m_order;   // insertion order, oldest first
    mutable std::size_t m_hits = 0;
    mutable std::size_t m_misses = 0;
};

} // namespace landopt::evaluation

#endif // LANDOPT_ORACLES_HPP
