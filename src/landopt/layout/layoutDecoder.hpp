/**
 * @file layoutDecoder.hpp
 * @brief Deterministic genome -> layout decoder.
 *
 * @details The decoder rotates the site into a local frame whose X axis follows
 * the primary road, lays out horizontal roads (primary plus collectors every
 * two lot rows), cuts the lot bands with perpendicular secondary roads, then
 * subdivides every strip into equal-width lots. Pieces that cannot hold a
 * lot become green space; low-quality lots are converted to green space when
 * the genome or the green-space rule asks for it.
 *
 * Decoding is pure: the same genome and site always give bit-identical output.
 */

#ifndef LANDOPT_LAYOUTDECODER_HPP
#define LANDOPT_LAYOUTDECODER_HPP

#include "genome.hpp"
#include "layout.hpp"
#include "../site/siteLoader.hpp"

namespace landopt::layout {

/**
 * @brief Decoder settings. Thresholds present in the site's constraint set
 * take precedence over the matching fields here.
 */
struct DecoderConfig {
    double max_angle_deg        = 15.0;   // orientation swing around the reference direction
    double primary_offset_min   = 0.25;   // primary road position, as a fraction of the box height
    double primary_offset_max   = 0.75;

    double primary_road_width   = 20.0;
    double secondary_road_width = 12.0;
    double buffer_width         = 5.0;

    double min_lot_area         = 1000.0;
    double lot_size_span        = 2.5;    // target lot area ranges over [min, min * span]
    double min_frontage         = 20.0;
    double aspect_min           = 1.5;    // depth / width
    double aspect_max           = 2.0;

    double max_row_stretch      = 1.5;    // deepest row relative to the target lot depth
    double edge_row_depth_factor = 1.5;   // single-loaded rows against the buffer
    double max_green_threshold  = 40.0;   // quality cut-off reachable by the green gene
    double preferred_frontage_factor = 1.5;
    double min_fragment_area    = 1.0;    // smaller pieces stay unallocated
};

/// Thresholds after merging the constraint set over the config.
struct DecodeParameters {
    double buffer_width    = 0.0;
    double primary_width   = 0.0;
    double secondary_width = 0.0;
    double min_lot_area    = 0.0;
    double max_lot_area    = 0.0;   // +inf when unbounded
    double min_frontage    = 0.0;
    double aspect_min      = 0.0;
    double aspect_max      = 0.0;
    double green_target    = 0.0;
};

class LayoutDecoder {
public:
    /**
     * @param site Must outlive the decoder; it is not copied.
     */
    LayoutDecoder(const site::Site& site,
                  const DecoderConfig& config = DecoderConfig{},
                  const GenomeSchema& schema = GenomeSchema{});

    LayoutDecoder(site::Site&&, const DecoderConfig& = DecoderConfig{},
                  const GenomeSchema& = GenomeSchema{}) = delete;

    /// Never throws for any genome; the input is repaired first.
    [[nodiscard]] Layout decode(const Genome& genome) const;

    const DecodeParameters& parameters() const { return m_params; }
    const GenomeSchema& schema() const { return m_schema; }
    const site::Site& site() const { return m_site; }

    /// Reference direction (degrees) the orientation gene swings around.
    double referenceAngleDeg() const { return m_reference_deg; }

private:
    const site::Site& m_site;
    DecoderConfig     m_config;
    GenomeSchema      m_schema;
    DecodeParameters  m_params;
    QualityParams     m_quality;
    double            m_reference_deg = 0.0;
};

} // namespace landopt::layout

#endif // LANDOPT_LAYOUTDECODER_HPP
