// evolutionaryEngine.hpp
#pragma once

#include "individual.hpp"
#include "../evaluation/fitnessEvaluator.hpp"
#include "../layout/layoutDecoder.hpp"
#include "../rngManager.hpp"
#include "../site/siteLoader.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace landopt::optim {

enum class CrossoverKind { OnePoint, TwoPoint, Uniform };

/**
 * @brief Configuration of the evolutionary engine.
 * Real-coded multi-objective GA over normalized genomes.
 */
struct EngineConfig {
    std::size_t population_size = 60;
    std::size_t max_generations = 50;

    // Selection
    std::size_t tournament_k = 3;              // Tournament size

    // Variation operators
    double        crossover_rate = 0.9;        // Probability to crossover a parent pair
    CrossoverKind crossover      = CrossoverKind::TwoPoint;
    double        mutation_rate  = 0.3;        // Probability to mutate each offspring
    double        mutation_sigma = 0.1;        // Stddev of the Gaussian step
    std::size_t   max_mutated_genes = 2;       // Genes perturbed per mutation, at least one

    // Elitism
    std::size_t elitism_count = 4;             // Non-dominated individuals carried over unchanged

    // Termination
    std::size_t plateau_window    = 15;        // Generations without improvement; 0 disables
    double      plateau_tolerance = 1e-6;

    std::uint64_t seed = 12345;
    bool          verbose = false;

    std::size_t evaluation_cache_limit = 4096; // Decoded genomes kept for reuse; 0 disables
    int         num_threads = 0;               // OpenMP team size; 0 uses the runtime default
};

enum class EngineState { Initializing, Evaluating, Selecting, Varying, Terminated };

enum class TerminationReason { None, MaxGenerations, Plateau, Cancelled };

const char* toString(EngineState s);
const char* toString(TerminationReason r);
const char* toString(CrossoverKind k);

/// @throws std::invalid_argument for an unrecognised name.
CrossoverKind crossoverFromName(const std::string& name);

struct GenerationStats {
    std::size_t generation = 0;
    std::size_t front_size = 0;
    std::size_t feasible = 0;
    std::size_t evaluations = 0;        // individuals decoded and scored this generation
    std::size_t oracle_failures = 0;    // failures this generation
    double      best_financial = 0.0;
};

using StepCallback = std::function<void(const GenerationStats&)>;

struct OptimizationResult {
    ParetoFront                front;
    std::optional<Individual>  recommended;
    std::size_t                generations = 0;
    TerminationReason          reason = TerminationReason::None;
    std::size_t                oracle_failures = 0;
    double                     best_financial = 0.0;
    std::vector<GenerationStats> history;
};

/**
 * @brief NSGA-II style engine: tournament selection on constrained Pareto rank
 * and crowding, crossover, Gaussian mutation, repair and elitism.
 *
 * @details Evaluation of a generation runs in an OpenMP parallel loop; every
 * individual writes only its own slot. Selection and variation stay serial
 * on the seeded variation stream, so a run is reproducible for a given seed
 * regardless of the thread count.
 *
 * The site and evaluator are not owned and must outlive the engine.
 */
class EvolutionaryEngine {
public:
    EvolutionaryEngine(const site::Site& site,
                       const evaluation::FitnessEvaluator& evaluator,
                       const EngineConfig& config = EngineConfig{},
                       const layout::DecoderConfig& decoder = layout::DecoderConfig{},
                       const layout::GenomeSchema& schema = layout::GenomeSchema{});

    void setCallback(StepCallback cb);

    /// Polled once per generation boundary inside optimize().
    void setCancellationFlag(const std::atomic<bool>* flag);

    /// Genomes injected (repaired) ahead of the random ones at initialization.
    void seedGenomes(std::vector<layout::Genome> genomes);

    void initialize();

    /// Runs one generation, initializing first if needed.
    /// @throws std::runtime_error once the engine has terminated.
    void step();

    OptimizationResult optimize();

    [[nodiscard]] OptimizationResult result() const;

    EngineState state() const { return m_state; }
    TerminationReason terminationReason() const { return m_reason; }
    std::size_t generation() const { return m_generation; }

    /// Highest financial objective in the current population.
    double bestFinancial() const;

    [[nodiscard]] const Population& getPopulation() const { return m_population; }
    [[nodiscard]] const Population& getArchive() const { return m_archive; }
    const layout::LayoutDecoder& decoder() const { return m_decoder; }
    const EngineConfig& config() const { return m_config; }

private:
    struct CacheEntry {
        layout::Genome genome;
        std::shared_ptr<const layout::Layout> layout;
        evaluation::FitnessVector fitness;
    };

    std::size_t evaluatePending(Population& pop);
    void updateArchive();
    void finishGeneration(std::size_t evaluations, std::size_t failures_before);
    void terminate(TerminationReason reason);

    const Individual& tournamentSelect();
    bool tournamentBetter(const Individual& a, const Individual& b) const;
    void crossoverGenes(layout::Genome& c1, layout::Genome& c2);
    void mutateGaussian(layout::Genome& g);
    Population selectElites() const;

    const site::Site& m_site;
    const evaluation::FitnessEvaluator& m_evaluator;
    EngineConfig m_config;
    layout::GenomeSchema m_schema;
    layout::LayoutDecoder m_decoder;

    rng::RngManager m_rng_manager;
    rng::Engine m_init_rng;
    rng::Engine m_var_rng;

    std::vector<layout::Genome> m_seeds;
    Population m_population;
    Population m_archive;
    std::unordered_map<std::uint64_t, CacheEntry> m_cache;

    EngineState m_state = EngineState::Initializing;
    TerminationReason m_reason = TerminationReason::None;
    bool m_initialized = false;
    std::size_t m_generation = 0;

    double m_plateau_best = 0.0;
    std::size_t m_stale_generations = 0;

    StepCallback m_callback;
    const std::atomic<bool>* m_cancel = nullptr;
    std::vector<GenerationStats> m_history;
};

} // namespace landopt::optim
