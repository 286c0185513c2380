#include "regression/kernel_svr.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <svm.h>

#include "errors.hpp"

namespace refrax {

namespace {

void discard_libsvm_output(const char*) {}

void quiet_libsvm()
{
    static std::once_flag once;
    std::call_once(once, [] { svm_set_print_string_function(&discard_libsvm_output); });
}

struct ModelDeleter {
    void operator()(svm_model* m) const { svm_free_and_destroy_model(&m); }
};

/* dense row → libsvm sparse row (1-based indices, -1 terminated) */
void fill_row(svm_node* out, const double* row, Eigen::Index stride, Eigen::Index d)
{
    for (Eigen::Index c = 0; c < d; ++c) {
        out[c].index = int(c) + 1;
        out[c].value = row[c * stride];
    }
    out[d].index = -1;
    out[d].value = 0.0;
}

}  // namespace

/* owns the support set; `model` only points into it */
struct KernelSvr::Fitted {
    Eigen::MatrixXd        SV;
    std::vector<svm_node>  nodes;
    std::vector<svm_node*> rows;
    std::vector<double>    coef;
    double*                coef_row = nullptr;
    double                 rho      = 0.0;
    svm_model              model{};

    Fitted(Eigen::MatrixXd sv, std::vector<double> c, double r, const svm_parameter& p)
        : SV(std::move(sv)), coef(std::move(c)), rho(r)
    {
        const Eigen::Index l = SV.rows(), d = SV.cols();
        nodes.resize(std::size_t(l * (d + 1)));
        rows.resize(std::size_t(l));
        for (Eigen::Index i = 0; i < l; ++i) {
            svm_node* row = nodes.data() + i * (d + 1);
            fill_row(row, SV.data() + i, SV.outerStride(), d);
            rows[std::size_t(i)] = row;
        }
        coef_row       = coef.data();
        model.param    = p;
        model.nr_class = 2;
        model.l        = int(l);
        model.SV       = rows.data();
        model.sv_coef  = &coef_row;
        model.rho      = &rho;
        model.free_sv  = 0;
    }

    Fitted(const Fitted&)            = delete;
    Fitted& operator=(const Fitted&) = delete;
};

namespace {

svm_parameter make_param(const SvrOpt& o, double gamma)
{
    svm_parameter p{};
    p.svm_type     = EPSILON_SVR;
    p.kernel_type  = o.kernel == KernelKind::Linear ? LINEAR : RBF;
    p.degree       = 3;
    p.gamma        = gamma;
    p.coef0        = 0.0;
    p.cache_size   = o.cache_mb;
    p.eps          = o.tol;
    p.C            = o.C;
    p.nr_weight    = 0;
    p.weight_label = nullptr;
    p.weight       = nullptr;
    p.nu           = 0.5;
    p.p            = o.epsilon;
    p.shrinking    = 1;
    p.probability  = 0;
    return p;
}

}  // namespace

KernelSvr::KernelSvr(const SvrOpt& opt) : opt_(opt)
{
    if (!(opt_.C > 0.0) || opt_.epsilon < 0.0 || !(opt_.gamma_scale > 0.0))
        throw InvalidRangeError("SVR needs C > 0, epsilon >= 0, gamma_scale > 0");
    if (!(opt_.tol > 0.0) || !(opt_.cache_mb > 0.0))
        throw InvalidRangeError("SVR needs tol > 0 and cache_mb > 0");
}

void KernelSvr::fit(const Eigen::MatrixXd& X, const Eigen::VectorXd& y)
{
    const Eigen::Index n = X.rows(), d = X.cols();
    if (n == 0 || d == 0 || y.size() != n)
        throw std::runtime_error("Shape mismatch: SVR got " + std::to_string(n) + " rows and " +
                                 std::to_string(y.size()) + " targets");

    /* γ = gamma_scale / (d · var(X)) */
    const double var = (X.array() - X.mean()).square().mean();
    gamma_ = opt_.gamma_scale / (double(d) * (var > 1e-12 ? var : 1.0));

    std::vector<svm_node>  xs(std::size_t(n * (d + 1)));
    std::vector<svm_node*> xp(static_cast<std::size_t>(n));
    std::vector<double>    ys(y.data(), y.data() + n);
    for (Eigen::Index i = 0; i < n; ++i) {
        svm_node* row = xs.data() + i * (d + 1);
        fill_row(row, X.data() + i, X.outerStride(), d);
        xp[std::size_t(i)] = row;
    }

    svm_problem prob{};
    prob.l = int(n);
    prob.y = ys.data();
    prob.x = xp.data();

    const svm_parameter param = make_param(opt_, gamma_);
    if (const char* err = svm_check_parameter(&prob, &param))
        throw InvalidRangeError(std::string("libsvm rejected parameters: ") + err);

    quiet_libsvm();
    std::unique_ptr<svm_model, ModelDeleter> m(svm_train(&prob, &param));
    if (!m) throw std::runtime_error("libsvm: svm_train returned no model");

    /* copy the support set out before the problem buffers go away */
    Eigen::MatrixXd SV = Eigen::MatrixXd::Zero(m->l, d);
    std::vector<double> coef(std::size_t(m->l));
    for (int i = 0; i < m->l; ++i) {
        for (const svm_node* nd = m->SV[i]; nd->index != -1; ++nd)
            if (nd->index >= 1 && nd->index <= d) SV(i, nd->index - 1) = nd->value;
        coef[std::size_t(i)] = m->sv_coef[0][i];
    }
    fit_ = std::make_shared<const Fitted>(std::move(SV), std::move(coef), m->rho[0], param);
}

int KernelSvr::n_support() const
{
    return fit_ ? fit_->model.l : 0;
}

double KernelSvr::predict(const Eigen::VectorXd& x) const
{
    if (!fit_) throw std::logic_error("KernelSvr::predict before fit");
    const Eigen::Index d = fit_->SV.cols();
    if (x.size() != d)
        throw std::runtime_error("Shape mismatch: SVR input " + std::to_string(x.size()) +
                                 " vs " + std::to_string(d));
    std::vector<svm_node> q(std::size_t(d + 1));
    fill_row(q.data(), x.data(), 1, d);
    return svm_predict(&fit_->model, q.data());
}

Eigen::VectorXd KernelSvr::predict(const Eigen::MatrixXd& X) const
{
    Eigen::VectorXd out(X.rows());
    for (Eigen::Index r = 0; r < X.rows(); ++r) out(r) = predict(Eigen::VectorXd(X.row(r).transpose()));
    return out;
}

json KernelSvr::to_json() const
{
    if (!fit_) throw std::logic_error("KernelSvr::to_json before fit");
    return {{"kernel", to_string(opt_.kernel)}, {"C", opt_.C}, {"epsilon", opt_.epsilon},
            {"gamma_scale", opt_.gamma_scale}, {"tol", opt_.tol}, {"gamma", gamma_},
            {"rho", fit_->rho}, {"support", mat_to_json(fit_->SV)},
            {"coef", json(fit_->coef)}};
}

KernelSvr KernelSvr::from_json(const json& j)
{
    SvrOpt o;
    o.kernel      = parse_kernel(j.at("kernel").get<std::string>());
    o.C           = j.at("C").get<double>();
    o.epsilon     = j.at("epsilon").get<double>();
    o.gamma_scale = j.at("gamma_scale").get<double>();
    o.tol         = j.value("tol", o.tol);
    KernelSvr s(o);
    s.gamma_ = j.at("gamma").get<double>();

    Eigen::MatrixXd     SV   = mat_from_json(j.at("support"));
    std::vector<double> coef = j.at("coef").get<std::vector<double>>();
    if (SV.rows() != Eigen::Index(coef.size()) || (SV.rows() > 0 && SV.cols() == 0))
        throw std::runtime_error("Shape mismatch in KernelSvr::from_json");
    s.fit_ = std::make_shared<const Fitted>(std::move(SV), std::move(coef),
                                            j.at("rho").get<double>(), make_param(o, s.gamma_));
    return s;
}

}  // namespace refrax
