/*───────────────────────────────────────────────────────────
 *  common.hpp   –  shared constants, logging, progress, file helpers
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace refrax {

using json = nlohmann::json;

/* ---------- physical / raster constants ---------- */
constexpr double kMinIncidenceDeg = 0.0;     // curve domain lower bound
constexpr double kMaxIncidenceDeg = 80.0;    // curve domain upper bound

/* plot window shared by every rendered curve (simulated or measured) */
constexpr double kAxisIncidenceMin = 40.0;
constexpr double kAxisIncidenceMax = 80.0;
constexpr double kAxisDeviationMin = 20.0;
constexpr double kAxisDeviationMax = 80.0;
constexpr int    kRasterSize       = 128;     // square raster, pixels
constexpr double kPenRadiusPx      = 1.0;

/* ────────────────── log / progress ────────────────── */
enum class LogLevel { Debug = 0, Info, Warn, Error };

void logD(const std::string& msg);
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

void     set_log_level(LogLevel lvl);
LogLevel log_level();
LogLevel parse_log_level(const std::string& s);
/* mirror every line to an append-mode file; empty path disables */
void     set_log_file(const std::string& path);

void progress(const std::string& tag,
              std::size_t cur, std::size_t tot, std::size_t barWidth = 40);

/* ────────────────── progress events (UI sink) ────────────────── */
struct ProgressEvent {
    std::string stage;          // "simulate", "optimize", "fit", "evaluate", "predict"
    double      percent = 0.0;  // 0…100
    std::size_t count   = 0;
    std::size_t total   = 0;
    std::string message;
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

/* emit if a sink is attached; percent derived from count/total */
void emit_progress(const ProgressSink& sink, const std::string& stage,
                   std::size_t count, std::size_t total,
                   const std::string& message = "");

/* renders events with the terminal progress bar */
ProgressSink console_sink();

/* ────────────────── file helpers ────────────────── */
bool        file_exists   (const std::string& path);
bool        is_directory  (const std::string& path);
bool        is_writable_dir(const std::string& path);
bool        has_ext       (const std::string& filename, const std::string& ext);
std::string strip_ext     (const std::string& filename);
std::string base_name     (const std::string& path);
std::string join_path     (const std::string& dir, const std::string& name);

/* write to <path>.tmp then rename over <path>; throws StorageUnavailableError */
void write_file_atomic(const std::string& path, const std::string& content);
std::string read_text_file(const std::string& path);   // throws on failure

/* ────────────────── time / numeric helpers ────────────────── */
std::int64_t now_ms();
std::string  timestamp_string(std::int64_t ms, bool compact);   // compact → 20251019_120000_123
std::string  format_fixed(double v, int digits);

inline double deg2rad(double d) { return d * 0.017453292519943295; }
inline double rad2deg(double r) { return r * 57.29577951308232; }

/* Eigen ↔ JSON */
json            vec_to_json(const Eigen::VectorXd& v);
Eigen::VectorXd vec_from_json(const json& j);
json            mat_to_json(const Eigen::MatrixXd& m);      // {"rows","cols","data" (row-major)}
Eigen::MatrixXd mat_from_json(const json& j);

}  // namespace refrax
