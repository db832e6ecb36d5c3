// genome.cpp
#include "genome.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace landopt::layout {

namespace {

using Tick = std::int64_t;

constexpr Tick kMaxTick = static_cast<Tick>(kGeneResolution);

Tick toTick(double v)
{
    if (std::isnan(v)) v = 0.5;
    v = std::clamp(v, 0.0, 1.0);
    return static_cast<Tick>(std::llround(v * static_cast<double>(kGeneResolution)));
}

double fromTick(Tick t)
{
    return static_cast<double>(t) / static_cast<double>(kGeneResolution);
}

} // namespace

std::uint64_t Genome::hash() const
{
    std::uint64_t h = 1469598103934665603ULL;
    for (double g : genes) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &g, sizeof(bits));
        for (int b = 0; b < 8; ++b) {
            h ^= (bits >> (8 * b)) & 0xFFULL;
            h *= 1099511628211ULL;
        }
    }
    return h;
}

std::size_t Genome::activeCuts(const GenomeSchema& schema) const
{
    if (genes.size() <= CutFraction) return 0;
    const double k = static_cast<double>(schema.max_secondary_cuts);
    const auto n = static_cast<std::size_t>(std::llround(std::clamp(genes[CutFraction], 0.0, 1.0) * k));
    return std::min(n, schema.max_secondary_cuts);
}

Genome repair(const Genome& raw, const GenomeSchema& schema)
{
    const std::size_t len = schema.length();

    std::vector<Tick> ticks(len, toTick(0.5));
    const std::size_t copy = std::min(len, raw.genes.size());
    for (std::size_t i = 0; i < copy; ++i) ticks[i] = toTick(raw.genes[i]);

    // Cut positions: ascending, separated by at least the minimum gap
    const std::size_t k = schema.max_secondary_cuts;
    if (k > 0) {
        auto first = ticks.begin() + static_cast<std::ptrdiff_t>(kHeaderGenes);
        std::sort(first, ticks.end());

        double gap = std::isfinite(schema.min_cut_gap) ? std::max(0.0, schema.min_cut_gap) : 0.0;
        Tick g = static_cast<Tick>(std::ceil(gap * static_cast<double>(kGeneResolution)));
        if (k > 1 && g * static_cast<Tick>(k - 1) > kMaxTick) {
            g = kMaxTick / static_cast<Tick>(k - 1);
        }

        Tick* c = &ticks[kHeaderGenes];
        for (std::size_t i = 1; i < k; ++i) c[i] = std::max(c[i], c[i - 1] + g);
        c[k - 1] = std::min(c[k - 1], kMaxTick);
        for (std::size_t i = k - 1; i-- > 0;) c[i] = std::min(c[i], c[i + 1] - g);
    }

    Genome out;
    out.genes.resize(len);
    for (std::size_t i = 0; i < len; ++i) out.genes[i] = fromTick(ticks[i]);
    return out;
}

Genome randomGenome(const GenomeSchema& schema, rng::Engine& engine)
{
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    Genome g;
    g.genes.resize(schema.length());
    for (auto& v : g.genes) v = u01(engine);
    return repair(g, schema);
}

} // namespace landopt::layout
