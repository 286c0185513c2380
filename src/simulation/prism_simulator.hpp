/* ──────────────────────────────────────────────────────────────
   prism_simulator.hpp  –  theoretical deviation curves per index
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "config.hpp"
#include "simulation/curve.hpp"
#include "storage.hpp"

namespace refrax {

struct SimulatedCurve {
    double      refractive_index;
    Curve       curve;
    std::string image_path;      // empty when no storage is attached
};

struct SkippedIndex {
    double refractive_index;
    double incidence_deg;        // first angle of the sweep without a valid exit ray
    std::string reason;
};

struct SimulationResult {
    std::vector<SimulatedCurve> curves;
    std::vector<SkippedIndex>   skipped;
    bool                        stopped = false;   // request_stop() cut the sweep short
};

/* "Rn_1.450.pgm" */
std::string template_file_name(double refractive_index);

/* one curve over the configured sweep; false + first failing angle on TIR */
bool simulate_curve(double n, const SimOpt& opt, std::vector<double>& deviation, double& bad_angle);

class PrismSimulator {
public:
    explicit PrismSimulator(SimOpt opt);
    /* images are written to layout.images_dir, checked writable up front */
    PrismSimulator(SimOpt opt, StorageLayout layout);

    void set_progress_sink(ProgressSink sink) { sink_ = std::move(sink); }

    /* indices lo + i·step for i < floor((hi − lo)/step) */
    SimulationResult generate(double lo, double hi, double step);

    /* checked between indices; a request made before generate() stops it
       before the first index */
    void request_stop() { stop_ = true; }

private:
    SimOpt              opt_;
    bool                write_images_ = false;
    StorageLayout       layout_{};
    ProgressSink        sink_;
    std::atomic<bool>   stop_{false};
};

}  // namespace refrax
