#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <landopt/errors.hpp>
#include <landopt/evaluation/expressionFinancialOracle.hpp>
#include <landopt/evaluation/fitnessEvaluator.hpp>
#include <landopt/evaluation/oracles.hpp>
#include <landopt/optimizers/evolutionaryEngine.hpp>
#include <landopt/site/siteLoader.hpp>
#include <landopt/utils/parameters.hpp>

using namespace landopt;

// Default pricing: only used when the user gives no expressions.
#define DEFAULT_COST_EXPR    "road_area*150 + boundary_area*25 + green_area*8"
#define DEFAULT_REVENUE_EXPR "weighted_area*70 + corner_lots*2500"

namespace {

std::atomic<bool> g_cancel{false};

void onInterrupt(int) {
    g_cancel.store(true);
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <site-file> [options]\n"
              << "  --params <file>     key = value parameter file\n"
              << "  --cost <expr>       cost expression (default: " << DEFAULT_COST_EXPR << ")\n"
              << "  --revenue <expr>    revenue expression (default: " << DEFAULT_REVENUE_EXPR << ")\n"
              << "  --seed <n>          random seed\n"
              << "  --generations <n>   maximum number of generations\n"
              << "  --verbose           per-generation progress\n";
}

void printLayout(const optim::Individual& ind) {
    const layout::Layout& l = *ind.layout;
    const evaluation::FitnessVector& f = *ind.fitness;

    std::cout << "  lots            : " << l.lots.size() << " (" << l.cornerLots() << " corner)" << std::endl;
    std::cout << "  sellable ratio  : " << std::fixed << std::setprecision(3) << l.sellableRatio() << std::endl;
    std::cout << "  green ratio     : " << l.greenRatio() << std::endl;
    std::cout << "  road length     : " << std::setprecision(1) << l.roads.totalLength()
              << " (" << l.roads.edges.size() << " segments)" << std::endl;
    std::cout << "  orientation     : " << l.orientation_deg << " deg" << std::endl;
    std::cout << "  mean quality    : " << f[evaluation::MeanQualityObjective] << std::endl;
    std::cout << "  ROI             : " << std::setprecision(2) << f.financial.roi_percentage << " %"
              << " (cost " << f.financial.total_cost << ", revenue " << f.financial.total_revenue << ")" << std::endl;
    std::cout << "  feasible        : " << (f.feasible() ? "yes" : "no") << std::defaultfloat << std::endl;

    for (const auto& v : f.report.violations) {
        std::cout << "    violation " << v.rule << " (" << site::toString(v.priority) << "): actual "
                  << v.actual << ", required " << v.required << ", " << v.count << " item(s)" << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string site_file;
    std::string params_file;
    std::string cost_expr = DEFAULT_COST_EXPR;
    std::string revenue_expr = DEFAULT_REVENUE_EXPR;
    std::string seed_arg;
    std::string generations_arg;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value after " + arg);
            return argv[++i];
        };
        try {
            if (arg == "--params") params_file = next();
            else if (arg == "--cost") cost_expr = next();
            else if (arg == "--revenue") revenue_expr = next();
            else if (arg == "--seed") seed_arg = next();
            else if (arg == "--generations") generations_arg = next();
            else if (arg == "--verbose") verbose = true;
            else if (arg == "--help" || arg == "-h") { printUsage(argv[0]); return 0; }
            else if (site_file.empty()) site_file = arg;
            else throw std::invalid_argument("Unexpected argument: " + arg);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    std::cout << "===========================================" << std::endl;
    std::cout << "   Land Subdivision Optimizer" << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        utils::RunParameters params;
        if (!params_file.empty()) params = utils::loadParameters(params_file);
        if (!seed_arg.empty()) params.engine.seed = std::stoull(seed_arg);
        if (!generations_arg.empty()) params.engine.max_generations = std::stoul(generations_arg);
        if (verbose) params.engine.verbose = true;

        const site::Site site = site::SiteLoader::load(site_file);
        std::cout << "Site: " << site_file << ", area " << site.boundary.getArea()
                  << ", " << site.constraints.size() << " rule(s)" << std::endl;

        const evaluation::ExpressionFinancialOracle pricing(cost_expr, revenue_expr);
        const evaluation::CachingFinancialOracle cached(pricing);
        const evaluation::FitnessEvaluator evaluator(cached);

        optim::EvolutionaryEngine engine(site, evaluator, params.engine, params.decoder, params.schema);
        engine.setCancellationFlag(&g_cancel);
        std::signal(SIGINT, onInterrupt);

        const optim::OptimizationResult result = engine.optimize();

        std::cout << "\nStopped after " << result.generations << " generation(s): "
                  << optim::toString(result.reason) << std::endl;
        if (result.oracle_failures > 0) {
            std::cerr << "Warning: " << result.oracle_failures << " financial oracle failure(s)" << std::endl;
        }

        std::cout << "\nPareto front (" << result.front.size() << " layouts)" << std::endl;
        std::cout << std::setw(6) << "lots" << std::setw(10) << "quality"
                  << std::setw(12) << "road eff." << std::setw(12) << "ROI %"
                  << std::setw(10) << "feasible" << std::endl;
        for (const auto& ind : result.front) {
            const auto& f = *ind.fitness;
            std::cout << std::fixed << std::setprecision(2)
                      << std::setw(6) << ind.layout->lots.size()
                      << std::setw(10) << f[evaluation::MeanQualityObjective]
                      << std::setw(12) << f[evaluation::RoadEfficiencyObjective]
                      << std::setw(12) << f.financial.roi_percentage
                      << std::setw(10) << (f.feasible() ? "yes" : "no")
                      << std::defaultfloat << std::endl;
        }

        if (result.recommended) {
            std::cout << "\nRecommended layout" << std::endl;
            printLayout(*result.recommended);
        }
    } catch (const InvalidBoundary& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
