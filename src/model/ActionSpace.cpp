#include "model/ActionSpace.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace tapepg::model {

namespace {

constexpr double LOG_2PI = 1.8378770664093453;

void check_pair(const seq::Batch& params, const seq::Batch& actions, int param_width) {
    if (!params.same_presence(actions)) {
        throw std::invalid_argument("Action presence differs from parameter presence");
    }
    if (params.width() != param_width) {
        throw std::invalid_argument("Expected " + std::to_string(param_width) +
                                    " distribution parameters per lane, got " +
                                    std::to_string(params.width()));
    }
}

void check_upstream(const seq::Batch& params, const std::vector<float>& upstream) {
    if (upstream.size() != static_cast<std::size_t>(params.num_present())) {
        throw std::invalid_argument("Upstream size " + std::to_string(upstream.size()) +
                                    " does not match " + std::to_string(params.num_present()) +
                                    " present lanes");
    }
}

// Numerically stable log-softmax of one row
void log_softmax(const float* logits, int k, std::vector<double>& out) {
    float max_logit = *std::max_element(logits, logits + k);
    double sum_exp = 0.0;
    for (int i = 0; i < k; ++i) {
        sum_exp += std::exp(static_cast<double>(logits[i]) - max_logit);
    }
    double lse = max_logit + std::log(sum_exp);
    out.resize(k);
    for (int i = 0; i < k; ++i) {
        out[i] = logits[i] - lse;
    }
}

} // namespace

// ============================================================================
// Softmax
// ============================================================================

std::vector<float> Softmax::log_prob(const seq::Batch& params, const seq::Batch& actions) const {
    const int k = actions.width();
    check_pair(params, actions, k);

    std::vector<float> result(params.num_present());
    std::vector<double> log_probs;
    for (int row = 0; row < params.num_present(); ++row) {
        const float* logits = params.packed().data() + row * k;
        const float* action = actions.packed().data() + row * k;
        log_softmax(logits, k, log_probs);

        double lp = 0.0;
        for (int i = 0; i < k; ++i) {
            lp += action[i] * log_probs[i];
        }
        result[row] = static_cast<float>(lp);
    }
    return result;
}

seq::Batch Softmax::log_prob_grad(const seq::Batch& params, const seq::Batch& actions,
                                  const std::vector<float>& upstream) const {
    const int k = actions.width();
    check_pair(params, actions, k);
    check_upstream(params, upstream);

    std::vector<float> grad(params.packed().size());
    std::vector<double> log_probs;
    for (int row = 0; row < params.num_present(); ++row) {
        const float* logits = params.packed().data() + row * k;
        const float* action = actions.packed().data() + row * k;
        log_softmax(logits, k, log_probs);

        double action_mass = 0.0;
        for (int i = 0; i < k; ++i) {
            action_mass += action[i];
        }
        for (int i = 0; i < k; ++i) {
            double p = std::exp(log_probs[i]);
            grad[row * k + i] = static_cast<float>(upstream[row] * (action[i] - p * action_mass));
        }
    }
    return seq::Batch(params.present(), k, std::move(grad));
}

std::vector<float> Softmax::entropy(const seq::Batch& params) const {
    const int k = params.width();
    std::vector<float> result(params.num_present());
    std::vector<double> log_probs;
    for (int row = 0; row < params.num_present(); ++row) {
        log_softmax(params.packed().data() + row * k, k, log_probs);
        double h = 0.0;
        for (double lp : log_probs) {
            h -= std::exp(lp) * lp;
        }
        result[row] = static_cast<float>(h);
    }
    return result;
}

seq::Batch Softmax::entropy_grad(const seq::Batch& params,
                                 const std::vector<float>& upstream) const {
    const int k = params.width();
    check_upstream(params, upstream);

    std::vector<float> grad(params.packed().size());
    std::vector<double> log_probs;
    for (int row = 0; row < params.num_present(); ++row) {
        log_softmax(params.packed().data() + row * k, k, log_probs);
        double h = 0.0;
        for (double lp : log_probs) {
            h -= std::exp(lp) * lp;
        }
        // dH/dz_j = -p_j (log p_j + H)
        for (int i = 0; i < k; ++i) {
            double p = std::exp(log_probs[i]);
            grad[row * k + i] = static_cast<float>(-upstream[row] * p * (log_probs[i] + h));
        }
    }
    return seq::Batch(params.present(), k, std::move(grad));
}

seq::Batch Softmax::sample(const seq::Batch& params, std::mt19937& rng) const {
    const int k = params.width();
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    std::vector<float> actions(params.packed().size(), 0.0f);
    std::vector<double> log_probs;
    for (int row = 0; row < params.num_present(); ++row) {
        log_softmax(params.packed().data() + row * k, k, log_probs);
        double u = uniform(rng);
        int choice = k - 1;
        for (int i = 0; i < k; ++i) {
            u -= std::exp(log_probs[i]);
            if (u < 0.0) {
                choice = i;
                break;
            }
        }
        actions[row * k + choice] = 1.0f;
    }
    return seq::Batch(params.present(), k, std::move(actions));
}

// ============================================================================
// Gaussian
// ============================================================================

std::vector<float> Gaussian::log_prob(const seq::Batch& params, const seq::Batch& actions) const {
    const int d = actions.width();
    check_pair(params, actions, 2 * d);

    std::vector<float> result(params.num_present());
    for (int row = 0; row < params.num_present(); ++row) {
        const float* mean = params.packed().data() + row * 2 * d;
        const float* log_std = mean + d;
        const float* action = actions.packed().data() + row * d;

        double lp = 0.0;
        for (int i = 0; i < d; ++i) {
            double z = (action[i] - mean[i]) * std::exp(-static_cast<double>(log_std[i]));
            lp += -0.5 * z * z - log_std[i] - 0.5 * LOG_2PI;
        }
        result[row] = static_cast<float>(lp);
    }
    return result;
}

seq::Batch Gaussian::log_prob_grad(const seq::Batch& params, const seq::Batch& actions,
                                   const std::vector<float>& upstream) const {
    const int d = actions.width();
    check_pair(params, actions, 2 * d);
    check_upstream(params, upstream);

    std::vector<float> grad(params.packed().size());
    for (int row = 0; row < params.num_present(); ++row) {
        const float* mean = params.packed().data() + row * 2 * d;
        const float* log_std = mean + d;
        const float* action = actions.packed().data() + row * d;
        float* g_mean = grad.data() + row * 2 * d;
        float* g_log_std = g_mean + d;

        for (int i = 0; i < d; ++i) {
            double inv_std = std::exp(-static_cast<double>(log_std[i]));
            double z = (action[i] - mean[i]) * inv_std;
            g_mean[i] = static_cast<float>(upstream[row] * z * inv_std);
            g_log_std[i] = static_cast<float>(upstream[row] * (z * z - 1.0));
        }
    }
    return seq::Batch(params.present(), 2 * d, std::move(grad));
}

std::vector<float> Gaussian::entropy(const seq::Batch& params) const {
    if (params.width() % 2 != 0) {
        throw std::invalid_argument("Gaussian parameters must have even width");
    }
    const int d = params.width() / 2;

    std::vector<float> result(params.num_present());
    for (int row = 0; row < params.num_present(); ++row) {
        const float* log_std = params.packed().data() + row * 2 * d + d;
        double h = 0.0;
        for (int i = 0; i < d; ++i) {
            h += log_std[i] + 0.5 * (LOG_2PI + 1.0);
        }
        result[row] = static_cast<float>(h);
    }
    return result;
}

seq::Batch Gaussian::entropy_grad(const seq::Batch& params,
                                  const std::vector<float>& upstream) const {
    if (params.width() % 2 != 0) {
        throw std::invalid_argument("Gaussian parameters must have even width");
    }
    check_upstream(params, upstream);
    const int d = params.width() / 2;

    std::vector<float> grad(params.packed().size(), 0.0f);
    for (int row = 0; row < params.num_present(); ++row) {
        float* g_log_std = grad.data() + row * 2 * d + d;
        for (int i = 0; i < d; ++i) {
            g_log_std[i] = upstream[row];
        }
    }
    return seq::Batch(params.present(), params.width(), std::move(grad));
}

seq::Batch Gaussian::sample(const seq::Batch& params, std::mt19937& rng) const {
    if (params.width() % 2 != 0) {
        throw std::invalid_argument("Gaussian parameters must have even width");
    }
    const int d = params.width() / 2;
    std::normal_distribution<float> normal(0.0f, 1.0f);

    std::vector<float> actions(static_cast<std::size_t>(params.num_present()) * d);
    for (int row = 0; row < params.num_present(); ++row) {
        const float* mean = params.packed().data() + row * 2 * d;
        const float* log_std = mean + d;
        for (int i = 0; i < d; ++i) {
            actions[row * d + i] = mean[i] + std::exp(log_std[i]) * normal(rng);
        }
    }
    return seq::Batch(params.present(), d, std::move(actions));
}

} // namespace tapepg::model
