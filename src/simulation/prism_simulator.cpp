#include "simulation/prism_simulator.hpp"

#include <utility>

#include "errors.hpp"
#include "simulation/curve_render.hpp"
#include "simulation/prism_physics.hpp"

namespace refrax {

std::string template_file_name(double refractive_index)
{
    return "Rn_" + format_fixed(refractive_index, 3) + ".pgm";
}

bool simulate_curve(double n, const SimOpt& opt, std::vector<double>& deviation, double& bad_angle)
{
    const auto xs = incidence_sweep(opt);
    deviation.clear();
    deviation.reserve(xs.size());
    for (double x : xs) {
        double d = 0.0;
        if (!deviation_deg(n, x, opt.apex_deg, d)) {
            bad_angle = x;
            return false;
        }
        deviation.push_back(d);
    }
    return true;
}

PrismSimulator::PrismSimulator(SimOpt opt) : opt_(std::move(opt)) {}

PrismSimulator::PrismSimulator(SimOpt opt, StorageLayout layout)
    : opt_(std::move(opt)), write_images_(true), layout_(std::move(layout))
{
    require_writable(layout_.images_dir, "images");
}

SimulationResult PrismSimulator::generate(double lo, double hi, double step)
{
    const auto indices = index_grid(lo, hi, step);
    const auto xs      = incidence_sweep(opt_);

    /* a stop requested before the call is honoured; the flag is spent when the run ends */
    struct ClearStop {
        std::atomic<bool>& flag;
        ~ClearStop() { flag = false; }
    } clear_stop{stop_};

    SimulationResult res;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (stop_) {
            res.stopped = true;
            logW("simulation stopped after " + std::to_string(i) + " of " +
                 std::to_string(indices.size()) + " indices");
            break;
        }
        const double n = indices[i];
        std::vector<double> dev;
        double bad = 0.0;
        if (!simulate_curve(n, opt_, dev, bad)) {
            const std::string why = n <= 1.0 ? "n <= 1" : "total internal reflection";
            logW("skip n=" + format_fixed(n, 4) + ": " + why + " at i1=" + format_fixed(bad, 2) + "°");
            res.skipped.push_back({n, bad, why});
        } else {
            Curve c(xs, std::move(dev));
            std::string path;
            if (write_images_) {
                path = join_path(layout_.images_dir, template_file_name(n));
                write_pgm(render(c), path);
            }
            res.curves.push_back({n, std::move(c), std::move(path)});
        }
        emit_progress(sink_, "simulate", i + 1, indices.size(), "n=" + format_fixed(n, 3));
    }
    logI("simulated " + std::to_string(res.curves.size()) + " curves, skipped " +
         std::to_string(res.skipped.size()));
    return res;
}

}  // namespace refrax
