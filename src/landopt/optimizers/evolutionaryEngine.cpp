/**
 * @file evolutionaryEngine.cpp
 * @brief Multi-objective evolutionary engine implementation
 */

#include "evolutionaryEngine.hpp"
#include "pareto.hpp"
#include "paretoSelector.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace landopt::optim {

    using evaluation::FitnessVector;
    using evaluation::kWorstObjective;

    const char* toString(EngineState s) {
        switch (s) {
            case EngineState::Initializing: return "initializing";
            case EngineState::Evaluating:   return "evaluating";
            case EngineState::Selecting:    return "selecting";
            case EngineState::Varying:      return "varying";
            case EngineState::Terminated:   return "terminated";
        }
        return "?";
    }

    const char* toString(TerminationReason r) {
        switch (r) {
            case TerminationReason::None:           return "none";
            case TerminationReason::MaxGenerations: return "max generations";
            case TerminationReason::Plateau:        return "plateau";
            case TerminationReason::Cancelled:      return "cancelled";
        }
        return "?";
    }

    const char* toString(CrossoverKind k) {
        switch (k) {
            case CrossoverKind::OnePoint: return "one_point";
            case CrossoverKind::TwoPoint: return "two_point";
            case CrossoverKind::Uniform:  return "uniform";
        }
        return "?";
    }

    CrossoverKind crossoverFromName(const std::string& name) {
        if (name == "one_point") return CrossoverKind::OnePoint;
        if (name == "two_point") return CrossoverKind::TwoPoint;
        if (name == "uniform")   return CrossoverKind::Uniform;
        throw std::invalid_argument("Unknown crossover kind: " + name);
    }

    EvolutionaryEngine::EvolutionaryEngine(const site::Site& site,
                                           const evaluation::FitnessEvaluator& evaluator,
                                           const EngineConfig& config,
                                           const layout::DecoderConfig& decoder,
                                           const layout::GenomeSchema& schema)
        : m_site(site),
          m_evaluator(evaluator),
          m_config(config),
          m_schema(schema),
          m_decoder(site, decoder, schema),
          m_rng_manager(config.seed),
          m_init_rng(m_rng_manager.make_rng(rng::Stream::Initialization)),
          m_var_rng(m_rng_manager.make_rng(rng::Stream::Variation))
    {
        if (m_config.population_size == 0)
            throw std::invalid_argument("Population size must be > 0.");
        if (m_config.elitism_count >= m_config.population_size)
            throw std::invalid_argument("Elitism count must be < population size.");
        if (m_config.tournament_k == 0)
            throw std::invalid_argument("Tournament size must be > 0.");
        if (!(m_config.crossover_rate >= 0.0 && m_config.crossover_rate <= 1.0))
            throw std::invalid_argument("Crossover rate must lie in [0,1].");
        if (!(m_config.mutation_rate >= 0.0 && m_config.mutation_rate <= 1.0))
            throw std::invalid_argument("Mutation rate must lie in [0,1].");
        if (!(m_config.mutation_sigma >= 0.0))
            throw std::invalid_argument("Mutation sigma must be >= 0.");
    }

    void EvolutionaryEngine::setCallback(StepCallback cb) {
        m_callback = std::move(cb);
    }

    void EvolutionaryEngine::setCancellationFlag(const std::atomic<bool>* flag) {
        m_cancel = flag;
    }

    void EvolutionaryEngine::seedGenomes(std::vector<layout::Genome> genomes) {
        m_seeds = std::move(genomes);
        m_initialized = false;
    }

    std::size_t EvolutionaryEngine::evaluatePending(Population& pop) {
        m_state = EngineState::Evaluating;

        std::vector<std::size_t> pending;
        for (std::size_t i = 0; i < pop.size(); ++i) {
            Individual& ind = pop[i];
            if (ind.evaluated()) continue;
            if (m_config.evaluation_cache_limit > 0) {
                auto it = m_cache.find(ind.genome.hash());
                if (it != m_cache.end() && it->second.genome == ind.genome) {
                    ind.layout = it->second.layout;
                    ind.fitness = it->second.fitness;
                    continue;
                }
            }
            pending.push_back(i);
        }

#ifdef _OPENMP
        const int threads = m_config.num_threads > 0 ? m_config.num_threads : omp_get_max_threads();
#endif
        // Decoding and scoring are independent per individual
        #pragma omp parallel for schedule(dynamic) num_threads(threads)
        for (int k = 0; k < static_cast<int>(pending.size()); ++k) {
            Individual& ind = pop[pending[static_cast<std::size_t>(k)]];
            auto decoded = std::make_shared<const layout::Layout>(m_decoder.decode(ind.genome));
            ind.fitness = m_evaluator.evaluate(*decoded, m_site.constraints);
            ind.layout = std::move(decoded);
        }

        // Serial cache fill keeps the map single-threaded
        for (std::size_t i : pending) {
            const Individual& ind = pop[i];
            if (ind.fitness->oracle_failed) continue;
            if (m_cache.size() >= m_config.evaluation_cache_limit) break;
            m_cache.emplace(ind.genome.hash(), CacheEntry{ind.genome, ind.layout, *ind.fitness});
        }
        return pending.size();
    }

    void EvolutionaryEngine::initialize() {
        m_state = EngineState::Initializing;
        m_reason = TerminationReason::None;
        m_population.clear();
        m_archive.clear();
        m_history.clear();
        m_generation = 0;
        m_stale_generations = 0;

        m_init_rng = m_rng_manager.make_rng(rng::Stream::Initialization);
        m_var_rng = m_rng_manager.make_rng(rng::Stream::Variation);

        const std::size_t failures_before = m_evaluator.oracleFailures();
        const std::size_t n = m_config.population_size;
        m_population.reserve(n);

        for (const auto& seed : m_seeds) {
            if (m_population.size() >= n) break;
            Individual ind;
            ind.genome = layout::repair(seed, m_schema);
            m_population.push_back(std::move(ind));
        }
        // Genome init stays serial (uses shared RNG)
        while (m_population.size() < n) {
            Individual ind;
            ind.genome = layout::randomGenome(m_schema, m_init_rng);
            m_population.push_back(std::move(ind));
        }

        if (m_config.verbose) {
            std::cout << "Evolutionary engine: population " << n
                      << ", generations " << m_config.max_generations
                      << ", crossover " << toString(m_config.crossover)
                      << ", seed " << m_config.seed << std::endl;
        }

        const std::size_t evaluated = evaluatePending(m_population);
        m_initialized = true;
        finishGeneration(evaluated, failures_before);
    }

    bool EvolutionaryEngine::tournamentBetter(const Individual& a, const Individual& b) const {
        if (a.rank != b.rank) return a.rank < b.rank;
        if (a.crowding != b.crowding) return a.crowding > b.crowding;
        return a.fitness->financialObjective() > b.fitness->financialObjective();
    }

    const Individual& EvolutionaryEngine::tournamentSelect() {
        std::uniform_int_distribution<std::size_t> pick(0, m_population.size() - 1);

        const Individual* best = nullptr;
        for (std::size_t i = 0; i < m_config.tournament_k; ++i) {
            const Individual& cand = m_population[pick(m_var_rng)];
            if (!best || tournamentBetter(cand, *best)) {
                best = &cand;
            }
        }
        return *best;
    }

    void EvolutionaryEngine::crossoverGenes(layout::Genome& c1, layout::Genome& c2) {
        const std::size_t dim = std::min(c1.size(), c2.size());
        if (dim < 2) return;

        CrossoverKind kind = m_config.crossover;
        if (kind == CrossoverKind::TwoPoint && dim < 3) kind = CrossoverKind::OnePoint;

        switch (kind) {
            case CrossoverKind::OnePoint: {
                std::uniform_int_distribution<std::size_t> cut(1, dim - 1);
                const std::size_t a = cut(m_var_rng);
                for (std::size_t i = a; i < dim; ++i) std::swap(c1[i], c2[i]);
                break;
            }
            case CrossoverKind::TwoPoint: {
                std::uniform_int_distribution<std::size_t> cut(1, dim - 1);
                std::size_t a = cut(m_var_rng);
                std::size_t b = cut(m_var_rng);
                while (b == a) b = cut(m_var_rng);
                if (a > b) std::swap(a, b);
                for (std::size_t i = a; i < b; ++i) std::swap(c1[i], c2[i]);
                break;
            }
            case CrossoverKind::Uniform: {
                std::uniform_real_distribution<double> u01(0.0, 1.0);
                for (std::size_t i = 0; i < dim; ++i) {
                    if (u01(m_var_rng) < 0.5) std::swap(c1[i], c2[i]);
                }
                break;
            }
        }
    }

    void EvolutionaryEngine::mutateGaussian(layout::Genome& g) {
        std::uniform_real_distribution<double> u01(0.0, 1.0);
        if (g.size() == 0 || u01(m_var_rng) >= m_config.mutation_rate) return;

        std::normal_distribution<double> n01(0.0, 1.0);
        std::uniform_int_distribution<std::size_t> count(1, std::max<std::size_t>(1, m_config.max_mutated_genes));
        std::uniform_int_distribution<std::size_t> gene(0, g.size() - 1);

        const std::size_t m = count(m_var_rng);
        for (std::size_t j = 0; j < m; ++j) {
            g[gene(m_var_rng)] += n01(m_var_rng) * m_config.mutation_sigma;
        }
    }

    Population EvolutionaryEngine::selectElites() const {
        const std::size_t k = std::min(m_population.size(), std::max<std::size_t>(1, m_config.elitism_count));

        std::vector<std::size_t> order(m_population.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return tournamentBetter(m_population[a], m_population[b]);
        });
        order.resize(k);

        // The best financial individual always survives
        std::size_t best = 0;
        for (std::size_t i = 1; i < m_population.size(); ++i) {
            if (m_population[i].fitness->financialObjective() > m_population[best].fitness->financialObjective())
                best = i;
        }
        if (std::find(order.begin(), order.end(), best) == order.end()) order.back() = best;

        Population elites;
        elites.reserve(m_config.population_size);
        for (std::size_t i : order) elites.push_back(m_population[i]);
        return elites;
    }

    void EvolutionaryEngine::updateArchive() {
        Population merged = m_archive;
        for (const auto& ind : m_population) {
            if (ind.rank != 0) continue;
            const std::uint64_t h = ind.genome.hash();
            const bool seen = std::any_of(merged.begin(), merged.end(), [&](const Individual& other) {
                return other.genome.hash() == h && other.genome == ind.genome;
            });
            if (!seen) merged.push_back(ind);
        }
        if (merged.empty()) return;

        rankPopulation(merged);
        Population front;
        for (auto& ind : merged) {
            if (ind.rank == 0) front.push_back(std::move(ind));
        }

        const std::size_t cap = 2 * m_config.population_size;
        if (front.size() > cap) {
            std::stable_sort(front.begin(), front.end(), [](const Individual& a, const Individual& b) {
                return a.crowding > b.crowding;
            });
            front.resize(cap);
        }
        m_archive = std::move(front);
    }

    void EvolutionaryEngine::finishGeneration(std::size_t evaluations, std::size_t failures_before) {
        rankPopulation(m_population);
        updateArchive();

        GenerationStats stats;
        stats.generation = m_generation;
        stats.evaluations = evaluations;
        stats.oracle_failures = m_evaluator.oracleFailures() - failures_before;
        stats.best_financial = bestFinancial();
        for (const auto& ind : m_population) {
            if (ind.rank == 0) ++stats.front_size;
            if (ind.fitness->feasible()) ++stats.feasible;
        }
        m_history.push_back(stats);

        if (m_config.verbose) {
            std::cout << "Gen " << std::setw(4) << stats.generation
                      << " | front " << std::setw(3) << stats.front_size
                      << " | feasible " << stats.feasible << "/" << m_population.size()
                      << " | best ROI " << std::fixed << std::setprecision(3) << stats.best_financial
                      << std::defaultfloat << std::endl;
        }
        if (stats.oracle_failures > 0) {
            std::cerr << "Warning: " << stats.oracle_failures << " oracle failure(s) in generation "
                      << stats.generation << std::endl;
        }

        if (m_callback) {
            m_callback(stats);
        }

        if (m_generation == 0 || stats.best_financial > m_plateau_best + m_config.plateau_tolerance) {
            m_plateau_best = stats.best_financial;
            m_stale_generations = 0;
        } else {
            ++m_stale_generations;
        }

        if (m_config.plateau_window > 0 && m_stale_generations >= m_config.plateau_window) {
            terminate(TerminationReason::Plateau);
        } else if (m_generation >= m_config.max_generations) {
            terminate(TerminationReason::MaxGenerations);
        } else {
            m_state = EngineState::Selecting;
        }
    }

    void EvolutionaryEngine::terminate(TerminationReason reason) {
        m_state = EngineState::Terminated;
        m_reason = reason;
        if (m_config.verbose) {
            std::cout << "Terminated after " << m_generation << " generation(s): "
                      << toString(reason) << std::endl;
        }
    }

    void EvolutionaryEngine::step() {
        if (!m_initialized) {
            initialize();
            if (m_state == EngineState::Terminated) return;
        }
        if (m_state == EngineState::Terminated) {
            throw std::runtime_error("Engine has terminated; call initialize() to restart.");
        }

        const std::size_t failures_before = m_evaluator.oracleFailures();

        m_state = EngineState::Selecting;
        Population next = selectElites();

        m_state = EngineState::Varying;
        std::uniform_real_distribution<double> u01(0.0, 1.0);

        // Selection + variation stays serial (uses shared RNG)
        while (next.size() < m_config.population_size) {
            const Individual& p1 = tournamentSelect();
            const Individual& p2 = tournamentSelect();

            layout::Genome g1 = p1.genome;
            layout::Genome g2 = p2.genome;

            if (u01(m_var_rng) < m_config.crossover_rate) {
                crossoverGenes(g1, g2);
            }

            mutateGaussian(g1);
            mutateGaussian(g2);

            Individual c1;
            c1.genome = layout::repair(g1, m_schema);
            next.push_back(std::move(c1));

            if (next.size() < m_config.population_size) {
                Individual c2;
                c2.genome = layout::repair(g2, m_schema);
                next.push_back(std::move(c2));
            }
        }

        const std::size_t evaluated = evaluatePending(next);

        m_population = std::move(next);
        ++m_generation;

        finishGeneration(evaluated, failures_before);
    }

    OptimizationResult EvolutionaryEngine::optimize() {
        if (!m_initialized || m_state == EngineState::Terminated) initialize();

        while (m_state != EngineState::Terminated) {
            if (m_cancel && m_cancel->load()) {
                terminate(TerminationReason::Cancelled);
                break;
            }
            step();
        }
        return result();
    }

    double EvolutionaryEngine::bestFinancial() const {
        double best = -std::numeric_limits<double>::infinity();
        for (const auto& ind : m_population) {
            if (ind.fitness) best = std::max(best, ind.fitness->financialObjective());
        }
        return m_population.empty() ? kWorstObjective : best;
    }

    OptimizationResult EvolutionaryEngine::result() const {
        OptimizationResult r;
        r.front = m_archive;
        if (auto idx = ParetoSelector::recommend(m_archive)) {
            r.recommended = m_archive[*idx];
        }
        r.generations = m_generation;
        r.reason = m_reason;
        r.best_financial = bestFinancial();
        r.history = m_history;
        for (const auto& s : m_history) r.oracle_failures += s.oracle_failures;
        return r;
    }

} // namespace landopt::optim
