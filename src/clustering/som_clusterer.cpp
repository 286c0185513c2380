#include "clustering/som_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "errors.hpp"

namespace refrax {

void som_grid_shape(int k, int& rows, int& cols)
{
    if (k < 1) throw InvalidRangeError("SOM needs at least one node");
    rows = 1;
    for (int r = 1; r * r <= k; ++r)
        if (k % r == 0) rows = r;
    cols = k / rows;
}

SomClusterer::SomClusterer(int k, const ClusterOpt& opt) : opt_(opt)
{
    som_grid_shape(k, rows_, cols_);
    for (const auto* d : {&opt_.som.sigma_decay, &opt_.som.lr_decay})
        if (*d != "linear" && *d != "exponential" && *d != "inverse")
            throw InvalidRangeError("unknown SOM decay: " + *d);
    const auto& nb = opt_.som.neighborhood;
    if (nb != "gaussian" && nb != "bubble" && nb != "mexican_hat")
        throw InvalidRangeError("unknown SOM neighbourhood: " + nb);
}

double SomClusterer::decay(const std::string& how, double v0, int t) const
{
    const double T = double(std::max(1, opt_.som.max_iter));
    if (how == "linear")      return v0 * std::max(1e-3, 1.0 - double(t) / T);
    if (how == "inverse")     return v0 / (1.0 + double(t) / (T / 2.0));
    return v0 * std::exp(-double(t) / (T / 3.0));                       // exponential
}

double SomClusterer::neighbourhood(double d2, double sigma) const
{
    const double s2 = sigma * sigma;
    const auto& nb = opt_.som.neighborhood;
    if (nb == "bubble")      return d2 <= s2 ? 1.0 : 0.0;
    if (nb == "mexican_hat") return (1.0 - d2 / s2) * std::exp(-d2 / (2.0 * s2));
    return std::exp(-d2 / (2.0 * s2));
}

int SomClusterer::best_node(const Eigen::RowVectorXd& x, double& d2) const
{
    int best = 0;
    d2 = std::numeric_limits<double>::max();
    for (Eigen::Index i = 0; i < W_.rows(); ++i) {
        const double v = (W_.row(i) - x).squaredNorm();
        if (v < d2) { d2 = v; best = int(i); }
    }
    return best;
}

/* spread the grid over the two leading principal axes (±1 std) */
void SomClusterer::init_weights(const Eigen::MatrixXd& X, std::mt19937& rng)
{
    const int K = rows_ * cols_;
    const Eigen::Index n = X.rows();
    W_.resize(K, X.cols());

    const Eigen::RowVectorXd mu = X.colwise().mean();
    bool pca_ok = n >= 3 && X.cols() >= 2;
    if (pca_ok) {
        const Eigen::MatrixXd Xc = X.rowwise() - mu;
        Eigen::BDCSVD<Eigen::MatrixXd> svd(Xc, Eigen::ComputeThinV);
        const auto& s = svd.singularValues();
        pca_ok = s.size() >= 2 && s(0) > 1e-12;
        if (pca_ok) {
            const double sd1 = s(0) / std::sqrt(double(n - 1));
            const double sd2 = s(1) / std::sqrt(double(n - 1));
            const Eigen::RowVectorXd v1 = svd.matrixV().col(0).transpose();
            const Eigen::RowVectorXd v2 = svd.matrixV().col(1).transpose();
            for (int r = 0; r < rows_; ++r)
                for (int c = 0; c < cols_; ++c) {
                    const double a = rows_ > 1 ? -1.0 + 2.0 * r / (rows_ - 1) : 0.0;
                    const double b = cols_ > 1 ? -1.0 + 2.0 * c / (cols_ - 1) : 0.0;
                    /* the longer grid side follows the first axis */
                    W_.row(r * cols_ + c) = cols_ >= rows_
                        ? mu + b * sd1 * v1 + a * sd2 * v2
                        : mu + a * sd1 * v1 + b * sd2 * v2;
                }
            return;
        }
    }
    logD("SOM: PCA init unavailable, sampling nodes from the data");
    std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);
    for (int i = 0; i < K; ++i) W_.row(i) = X.row(pick(rng));
}

double SomClusterer::quantization_error(const Eigen::MatrixXd& X) const
{
    double s = 0.0;
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        double d2 = 0.0;
        best_node(X.row(i), d2);
        s += std::sqrt(d2);
    }
    return X.rows() ? s / double(X.rows()) : 0.0;
}

double SomClusterer::topographic_error(const Eigen::MatrixXd& X) const
{
    if (W_.rows() < 2 || X.rows() == 0) return 0.0;
    int bad = 0;
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        int b1 = -1, b2 = -1;
        double d1 = std::numeric_limits<double>::max(), d2 = d1;
        for (Eigen::Index k = 0; k < W_.rows(); ++k) {
            const double v = (W_.row(k) - X.row(i)).squaredNorm();
            if (v < d1)      { d2 = d1; b2 = b1; d1 = v; b1 = int(k); }
            else if (v < d2) { d2 = v; b2 = int(k); }
        }
        const int dr = std::abs(b1 / cols_ - b2 / cols_);
        const int dc = std::abs(b1 % cols_ - b2 % cols_);
        if (std::max(dr, dc) > 1) ++bad;
    }
    return double(bad) / double(X.rows());
}

void SomClusterer::fit(const Eigen::MatrixXd& X)
{
    const int K = rows_ * cols_;
    if (X.rows() < K)
        throw InsufficientValidSamplesError("SOM: " + std::to_string(X.rows()) +
                                            " samples for a " + std::to_string(rows_) + "×" +
                                            std::to_string(cols_) + " grid");
    std::mt19937 rng(opt_.seed);
    init_weights(X, rng);
    qe_hist_.clear();
    te_hist_.clear();

    std::uniform_int_distribution<Eigen::Index> pick(0, X.rows() - 1);
    const int T = std::max(1, opt_.som.max_iter);
    for (int t = 0; t < T; ++t) {
        if (t % kErrorEvery == 0) {
            qe_hist_.push_back(quantization_error(X));
            te_hist_.push_back(topographic_error(X));
        }
        const Eigen::RowVectorXd x = X.row(pick(rng));
        double d2 = 0.0;
        const int bmu = best_node(x, d2);
        const double lr    = decay(opt_.som.lr_decay, opt_.som.learning_rate, t);
        const double sigma = std::max(1e-3, decay(opt_.som.sigma_decay, opt_.som.sigma, t));
        const int br = bmu / cols_, bc = bmu % cols_;
        for (int k = 0; k < K; ++k) {
            const double gr = k / cols_ - br, gc = k % cols_ - bc;
            const double h = neighbourhood(gr * gr + gc * gc, sigma);
            if (h != 0.0) W_.row(k) += lr * h * (x - W_.row(k));
        }
    }
    qe_hist_.push_back(quantization_error(X));
    te_hist_.push_back(topographic_error(X));

    active_.resize(std::size_t(K));
    for (int k = 0; k < K; ++k) active_[std::size_t(k)] = k;
    logD("SOM " + std::to_string(rows_) + "×" + std::to_string(cols_) + ": qe " +
         format_fixed(qe_hist_.front(), 4) + " → " + format_fixed(qe_hist_.back(), 4) +
         ", te " + format_fixed(te_hist_.back(), 3));
}

int SomClusterer::assign(const Eigen::VectorXd& x, double* dist) const
{
    if (active_.empty()) throw std::logic_error("SOM: assign before fit");
    if (x.size() != W_.cols())
        throw std::runtime_error("Shape mismatch: feature " + std::to_string(x.size()) +
                                 " vs node " + std::to_string(W_.cols()));
    int best = 0;
    double bd = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < active_.size(); ++i) {
        const double v = (W_.row(active_[i]) - x.transpose()).squaredNorm();
        if (v < bd) { bd = v; best = int(i); }
    }
    if (dist) *dist = std::sqrt(bd);
    return best;
}

Eigen::VectorXd SomClusterer::representative(int id) const
{
    return W_.row(active_.at(std::size_t(id))).transpose();
}

void SomClusterer::retain(const std::vector<int>& ids)
{
    std::vector<int> next;
    next.reserve(ids.size());
    for (int id : ids) {
        if (id < 0 || std::size_t(id) >= active_.size())
            throw InvalidRangeError("retain: no cluster " + std::to_string(id));
        next.push_back(active_[std::size_t(id)]);
    }
    active_ = std::move(next);
}

Eigen::MatrixXd SomClusterer::u_matrix() const
{
    Eigen::MatrixXd U = Eigen::MatrixXd::Zero(rows_, cols_);
    if (W_.rows() != rows_ * cols_) return U;
    const int dr[] = {-1, 1, 0, 0}, dc[] = {0, 0, -1, 1};
    for (int r = 0; r < rows_; ++r)
        for (int c = 0; c < cols_; ++c) {
            double s = 0.0;
            int m = 0;
            for (int q = 0; q < 4; ++q) {
                const int rr = r + dr[q], cc = c + dc[q];
                if (rr < 0 || rr >= rows_ || cc < 0 || cc >= cols_) continue;
                s += (W_.row(r * cols_ + c) - W_.row(rr * cols_ + cc)).norm();
                ++m;
            }
            U(r, c) = m ? s / m : 0.0;
        }
    return U;
}

json SomClusterer::to_json() const
{
    return {{"kind", "som"}, {"k", rows_ * cols_}, {"rows", rows_}, {"cols", cols_},
            {"weights", mat_to_json(W_)}, {"active", active_},
            {"neighborhood", opt_.som.neighborhood},
            {"qe_history", qe_hist_}, {"te_history", te_hist_}};
}

void SomClusterer::from_json(const json& j)
{
    rows_   = j.at("rows").get<int>();
    cols_   = j.at("cols").get<int>();
    W_      = mat_from_json(j.at("weights"));
    active_ = j.at("active").get<std::vector<int>>();
    qe_hist_ = j.value("qe_history", std::vector<double>{});
    te_hist_ = j.value("te_history", std::vector<double>{});
    if (W_.rows() != rows_ * cols_)
        throw ModelFormatError("SOM weights do not match the " + std::to_string(rows_) + "×" +
                               std::to_string(cols_) + " grid");
    for (int a : active_)
        if (a < 0 || a >= W_.rows()) throw ModelFormatError("SOM active node out of range");
}

std::unique_ptr<IClusterer> make_som(int k, const ClusterOpt& opt)
{
    return std::make_unique<SomClusterer>(k, opt);
}

}  // namespace refrax
