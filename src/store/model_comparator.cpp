#include "store/model_comparator.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "errors.hpp"

namespace refrax {

bool ModelComparator::evaluate_into(const std::string& id, CachedScore& out)
{
    ++evaluations_;
    try {
        if (!has_reference()) {
            const ModelMeta meta = store_.read_meta(id);
            out.score        = meta.validation_score;
            out.timestamp_ms = meta.timestamp_ms;
            out.metrics      = meta.test_metrics;
        } else {
            const TrainedModel m = store_.load(id);
            out.metrics      = evaluate(m.regressor.predict_values(ref_X_), ref_y_);
            out.score        = out.metrics.mae;
            out.timestamp_ms = m.meta.timestamp_ms;
        }
    } catch (const ModelFormatError& e) {
        logW("compare: model " + id + " skipped: " + e.what());
        return false;
    } catch (const std::runtime_error& e) {     // reference set of another feature width
        logW("compare: model " + id + " cannot score the reference set: " + e.what());
        return false;
    }
    out.needs_eval = false;
    return true;
}

std::vector<RankedModel> ModelComparator::compare(const std::vector<std::string>& ids)
{
    std::vector<RankedModel> out;
    std::set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) continue;
        auto it = cache_.find(id);
        if (it == cache_.end() || it->second.needs_eval) {
            CachedScore cs;
            if (!evaluate_into(id, cs)) continue;
            it = cache_.insert_or_assign(id, cs).first;
        }
        RankedModel r;
        r.model_id     = id;
        r.score        = it->second.score;
        r.timestamp_ms = it->second.timestamp_ms;
        r.metrics      = it->second.metrics;
        out.push_back(std::move(r));
    }
    std::sort(out.begin(), out.end(), [](const RankedModel& a, const RankedModel& b) {
        if (a.score != b.score) return a.score < b.score;
        if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms > b.timestamp_ms;
        return a.model_id < b.model_id;
    });
    for (std::size_t i = 0; i < out.size(); ++i) out[i].rank = int(i + 1);
    return out;
}

void ModelComparator::invalidate(const std::string& model_id)
{
    auto it = cache_.find(model_id);
    if (it != cache_.end()) it->second.needs_eval = true;
}

const CachedScore* ModelComparator::cached(const std::string& model_id) const
{
    auto it = cache_.find(model_id);
    return it == cache_.end() ? nullptr : &it->second;
}

void ModelComparator::mark_all_stale()
{
    for (auto& kv : cache_) kv.second.needs_eval = true;
}

void ModelComparator::set_reference(Eigen::MatrixXd X, Eigen::VectorXd y)
{
    if (X.rows() == 0 || X.rows() != y.size())
        throw InvalidRangeError("reference set needs matching, non-empty features and targets");
    ref_X_ = std::move(X);
    ref_y_ = std::move(y);
    mark_all_stale();
}

void ModelComparator::clear_reference()
{
    ref_X_.resize(0, 0);
    ref_y_.resize(0);
    mark_all_stale();
}

void ModelComparator::save_cache(const std::string& path) const
{
    json entries = json::object();
    for (const auto& kv : cache_)
        entries[kv.first] = {{"score", kv.second.score}, {"timestamp_ms", kv.second.timestamp_ms},
                             {"needs_eval", kv.second.needs_eval}, {"metrics", kv.second.metrics}};
    json j = {{"reference_rows", ref_X_.rows()}, {"entries", entries}};
    write_file_atomic(path, j.dump(2));
}

void ModelComparator::load_cache(const std::string& path)
{
    if (!file_exists(path)) return;                 // nothing cached yet
    json j = json::parse(read_text_file(path), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.contains("entries")) {
        logW("compare: cache " + path + " unreadable, starting empty");
        return;
    }
    /* scores from another reference set are not comparable */
    const bool stale = j.value("reference_rows", Eigen::Index(0)) != ref_X_.rows();
    try {
        std::map<std::string, CachedScore> next;
        for (auto it = j.at("entries").begin(); it != j.at("entries").end(); ++it) {
            CachedScore cs;
            cs.score        = it.value().at("score").get<double>();
            cs.timestamp_ms = it.value().at("timestamp_ms").get<std::int64_t>();
            cs.needs_eval   = stale || it.value().value("needs_eval", false);
            if (it.value().contains("metrics")) cs.metrics = it.value().at("metrics").get<EvalMetrics>();
            next[it.key()] = cs;
        }
        cache_.swap(next);
    } catch (const json::exception& e) {
        logW("compare: cache " + path + " malformed (" + e.what() + "), starting empty");
    }
}

void ModelComparator::export_csv(const std::vector<RankedModel>& ranking, const std::string& path)
{
    std::ostringstream out;
    out << "rank,model_id,score,timestamp_ms,mae,rmse,medae,sse,r2,accuracy,count\n";
    for (const auto& r : ranking)
        out << r.rank << ',' << r.model_id << ',' << format_fixed(r.score, 6) << ','
            << r.timestamp_ms << ',' << format_fixed(r.metrics.mae, 6) << ','
            << format_fixed(r.metrics.rmse, 6) << ',' << format_fixed(r.metrics.medae, 6) << ','
            << format_fixed(r.metrics.sse, 6) << ',' << format_fixed(r.metrics.r2, 4) << ','
            << format_fixed(r.metrics.accuracy, 2) << ',' << r.metrics.count << '\n';
    write_file_atomic(path, out.str());
}

}  // namespace refrax
