// parameters.cpp
#include "parameters.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <utility>
#include <stdexcept>

namespace landopt::utils {

namespace {

using Setter = std::function<void(RunParameters&, const std::string&)>;

std::string trim(const std::string& s)
{
    const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last  = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

double toDouble(const std::string& v)
{
    std::size_t used = 0;
    const double d = std::stod(v, &used);
    if (used != v.size()) throw std::invalid_argument("trailing characters");
    return d;
}

std::size_t toSize(const std::string& v)
{
    if (!v.empty() && v.front() == '-') throw std::invalid_argument("negative count");
    std::size_t used = 0;
    const unsigned long long n = std::stoull(v, &used);
    if (used != v.size()) throw std::invalid_argument("trailing characters");
    return static_cast<std::size_t>(n);
}

bool toBool(const std::string& v)
{
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument("expected a boolean");
}

// Table entry writing parse(value) into (params.*section).*member.
template <class Section, class Field, class Parse>
std::pair<const std::string, Setter> field(const char* key, Section RunParameters::*section,
                                           Field Section::*member, Parse parse)
{
    return {key, [section, member, parse](RunParameters& p, const std::string& v) {
        (p.*section).*member = parse(v);
    }};
}

template <class Field>
std::pair<const std::string, Setter> engineField(const char* key, Field optim::EngineConfig::*member,
                                                 Field (*parse)(const std::string&))
{
    return field(key, &RunParameters::engine, member, parse);
}

template <class Field>
std::pair<const std::string, Setter> decoderField(const char* key, Field layout::DecoderConfig::*member)
{
    return field(key, &RunParameters::decoder, member, toDouble);
}

template <class Field>
std::pair<const std::string, Setter> schemaField(const char* key, Field layout::GenomeSchema::*member,
                                                 Field (*parse)(const std::string&))
{
    return field(key, &RunParameters::schema, member, parse);
}

const std::map<std::string, Setter>& setters()
{
    static const std::map<std::string, Setter> table = {
        engineField("population_size", &optim::EngineConfig::population_size, toSize),
        engineField("max_generations", &optim::EngineConfig::max_generations, toSize),
        engineField("tournament_k", &optim::EngineConfig::tournament_k, toSize),
        engineField("crossover_rate", &optim::EngineConfig::crossover_rate, toDouble),
        engineField("mutation_rate", &optim::EngineConfig::mutation_rate, toDouble),
        engineField("mutation_sigma", &optim::EngineConfig::mutation_sigma, toDouble),
        engineField("max_mutated_genes", &optim::EngineConfig::max_mutated_genes, toSize),
        engineField("elitism_count", &optim::EngineConfig::elitism_count, toSize),
        engineField("plateau_window", &optim::EngineConfig::plateau_window, toSize),
        engineField("plateau_tolerance", &optim::EngineConfig::plateau_tolerance, toDouble),
        engineField("evaluation_cache_limit", &optim::EngineConfig::evaluation_cache_limit, toSize),
        {"crossover", [](RunParameters& p, const std::string& v) { p.engine.crossover = optim::crossoverFromName(v); }},
        {"seed", [](RunParameters& p, const std::string& v) { p.engine.seed = toSize(v); }},
        {"verbose", [](RunParameters& p, const std::string& v) { p.engine.verbose = toBool(v); }},
        {"num_threads", [](RunParameters& p, const std::string& v) { p.engine.num_threads = static_cast<int>(toSize(v)); }},

        decoderField("max_angle_deg", &layout::DecoderConfig::max_angle_deg),
        decoderField("primary_offset_min", &layout::DecoderConfig::primary_offset_min),
        decoderField("primary_offset_max", &layout::DecoderConfig::primary_offset_max),
        decoderField("primary_road_width", &layout::DecoderConfig::primary_road_width),
        decoderField("secondary_road_width", &layout::DecoderConfig::secondary_road_width),
        decoderField("buffer_width", &layout::DecoderConfig::buffer_width),
        decoderField("min_lot_area", &layout::DecoderConfig::min_lot_area),
        decoderField("lot_size_span", &layout::DecoderConfig::lot_size_span),
        decoderField("min_frontage", &layout::DecoderConfig::min_frontage),
        decoderField("aspect_min", &layout::DecoderConfig::aspect_min),
        decoderField("aspect_max", &layout::DecoderConfig::aspect_max),
        decoderField("max_row_stretch", &layout::DecoderConfig::max_row_stretch),
        decoderField("edge_row_depth_factor", &layout::DecoderConfig::edge_row_depth_factor),
        decoderField("max_green_threshold", &layout::DecoderConfig::max_green_threshold),
        decoderField("preferred_frontage_factor", &layout::DecoderConfig::preferred_frontage_factor),
        decoderField("min_fragment_area", &layout::DecoderConfig::min_fragment_area),

        schemaField("max_secondary_cuts", &layout::GenomeSchema::max_secondary_cuts, toSize),
        schemaField("min_cut_gap", &layout::GenomeSchema::min_cut_gap, toDouble),
    };
    return table;
}

} // namespace

RunParameters parseParameters(std::istream& in, const RunParameters& defaults)
{
    RunParameters params = defaults;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Warning: parameter line " << line_no << " has no '=': " << line << std::endl;
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        auto it = setters().find(key);
        if (it == setters().end()) {
            std::cerr << "Warning: unknown parameter '" << key << "' on line " << line_no << std::endl;
            continue;
        }
        try {
            it->second(params, value);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Warning: bad value '" << value << "' for " << key
                      << " on line " << line_no << " (" << e.what() << ")" << std::endl;
        } catch (const std::out_of_range&) {
            std::cerr << "Warning: value out of range for " << key << " on line " << line_no << std::endl;
        }
    }
    return params;
}

RunParameters loadParameters(const std::string& filename, const RunParameters& defaults)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open parameter file at: " + filename);
    }
    return parseParameters(file, defaults);
}

std::vector<std::string> parameterKeys()
{
    std::vector<std::string> keys;
    for (const auto& kv : setters()) keys.push_back(kv.first);
    return keys;
}

} // namespace landopt::utils
