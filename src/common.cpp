/*───────────────────────────────────────────────────────────
 *  common.cpp   –  logging, progress bar, file and JSON helpers
 *───────────────────────────────────────────────────────────*/
#include "common.hpp"

#include <sys/stat.h>   // stat
#include <unistd.h>     // access

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include "errors.hpp"

namespace refrax {

namespace fs = std::filesystem;

/* ────────── logging ────────── */
namespace {

std::mutex&    log_mutex() { static std::mutex m; return m; }
std::atomic<LogLevel> g_level{LogLevel::Info};
std::ofstream  g_log_file;

void emit(LogLevel lvl, const char* tag, const std::string& s)
{
    if (static_cast<int>(lvl) < static_cast<int>(g_level.load())) return;
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << tag << s << '\n';
    if (g_log_file.is_open()) g_log_file << tag << s << '\n' << std::flush;
}

}  // namespace

void logD(const std::string& s) { emit(LogLevel::Debug, "[DEBUG] ", s); }
void logI(const std::string& s) { emit(LogLevel::Info,  "[INFO]  ", s); }
void logW(const std::string& s) { emit(LogLevel::Warn,  "[WARN]  ", s); }
void logE(const std::string& s) { emit(LogLevel::Error, "[ERR]   ", s); }

void set_log_level(LogLevel lvl) { g_level = lvl; }
LogLevel log_level() { return g_level; }

LogLevel parse_log_level(const std::string& s)
{
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "warn")  return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    throw InvalidRangeError("unknown log level: " + s);
}

void set_log_file(const std::string& path)
{
    std::lock_guard<std::mutex> lk(log_mutex());
    if (g_log_file.is_open()) g_log_file.close();
    if (path.empty()) return;
    g_log_file.open(path, std::ios::app);
    if (!g_log_file)
        std::cerr << "[WARN]  cannot open log file " << path << '\n';
}

void progress(const std::string& tag, std::size_t cur, std::size_t tot, std::size_t W)
{
    double f = tot ? double(cur) / tot : 1.0;
    if (f > 1.0) f = 1.0;
    std::size_t filled = std::size_t(f * W);
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cout << '\r' << tag << " ["
              << std::string(filled, '=') << std::string(W - filled, ' ')
              << "] " << std::setw(3) << int(f * 100) << "% ("
              << cur << '/' << tot << ')' << std::flush;
    if (cur >= tot) std::cout << '\n';
}

/* ────────── progress events ────────── */
void emit_progress(const ProgressSink& sink, const std::string& stage,
                   std::size_t count, std::size_t total, const std::string& message)
{
    if (!sink) return;
    ProgressEvent ev;
    ev.stage   = stage;
    ev.count   = count;
    ev.total   = total;
    ev.percent = total ? 100.0 * double(count) / double(total) : 100.0;
    ev.message = message;
    sink(ev);
}

ProgressSink console_sink()
{
    return [](const ProgressEvent& ev) { progress(ev.stage, ev.count, ev.total); };
}

/* ────────── file helpers ────────── */
bool file_exists(const std::string& p)
{
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool is_directory(const std::string& p)
{
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_writable_dir(const std::string& p)
{
    return is_directory(p) && ::access(p.c_str(), W_OK | X_OK) == 0;
}

bool has_ext(const std::string& f, const std::string& ext)
{
    return f.size() >= ext.size() &&
           f.compare(f.size() - ext.size(), ext.size(), ext) == 0;
}

std::string strip_ext(const std::string& f)
{
    auto p = f.find_last_of('.');
    return p == std::string::npos ? f : f.substr(0, p);
}

std::string base_name(const std::string& path)
{
    auto p = path.find_last_of('/');
    return p == std::string::npos ? path : path.substr(p + 1);
}

std::string join_path(const std::string& dir, const std::string& name)
{
    if (dir.empty()) return name;
    return dir.back() == '/' ? dir + name : dir + '/' + name;
}

void write_file_atomic(const std::string& path, const std::string& content)
{
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw StorageUnavailableError("cannot write " + tmp);
        out << content;
        out.flush();
        if (!out) throw StorageUnavailableError("short write to " + tmp);
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageUnavailableError("cannot publish " + path);
    }
}

std::string read_text_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/* ────────── time / numeric ────────── */
std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string timestamp_string(std::int64_t ms, bool compact)
{
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    localtime_r(&secs, &tm);
    std::ostringstream ss;
    if (compact)
        ss << std::put_time(&tm, "%Y%m%d_%H%M%S") << '_'
           << std::setw(3) << std::setfill('0') << (ms % 1000);
    else
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string format_fixed(double v, int digits)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(digits) << v;
    return ss.str();
}

/* ────────── Eigen ↔ JSON ────────── */
json vec_to_json(const Eigen::VectorXd& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

Eigen::VectorXd vec_from_json(const json& j)
{
    auto raw = j.get<std::vector<double>>();
    Eigen::VectorXd v(static_cast<Eigen::Index>(raw.size()));
    for (std::size_t i = 0; i < raw.size(); ++i) v(Eigen::Index(i)) = raw[i];
    return v;
}

json mat_to_json(const Eigen::MatrixXd& m)
{
    std::vector<double> data;
    data.reserve(std::size_t(m.size()));
    for (Eigen::Index r = 0; r < m.rows(); ++r)
        for (Eigen::Index c = 0; c < m.cols(); ++c) data.push_back(m(r, c));
    return {{"rows", m.rows()}, {"cols", m.cols()}, {"data", data}};
}

Eigen::MatrixXd mat_from_json(const json& j)
{
    const auto rows = j.at("rows").get<Eigen::Index>();
    const auto cols = j.at("cols").get<Eigen::Index>();
    auto data = j.at("data").get<std::vector<double>>();
    if (std::size_t(rows * cols) != data.size())
        throw std::runtime_error("Shape mismatch in mat_from_json");
    Eigen::MatrixXd m(rows, cols);
    std::size_t k = 0;
    for (Eigen::Index r = 0; r < rows; ++r)
        for (Eigen::Index c = 0; c < cols; ++c) m(r, c) = data[k++];
    return m;
}

}  // namespace refrax
