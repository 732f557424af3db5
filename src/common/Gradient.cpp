#include "common/Gradient.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tapepg {

Gradient::Gradient(const std::vector<Parameter*>& params) {
    for (Parameter* param : params) {
        if (param == nullptr) {
            throw std::invalid_argument("Gradient: null parameter");
        }
        if (index_.count(param)) {
            continue;
        }
        index_.emplace(param, entries_.size());
        entries_.push_back(Entry{param, std::vector<float>(param->size(), 0.0f)});
    }
}

bool Gradient::contains(const Parameter* param) const {
    return index_.count(param) != 0;
}

void Gradient::accumulate(const Parameter* param, const float* values, std::size_t count) {
    auto it = index_.find(param);
    if (it == index_.end()) {
        return;
    }

    auto& acc = entries_[it->second].values;
    if (acc.size() != count) {
        throw std::invalid_argument("Gradient size mismatch for parameter " + param->name() +
                                    ": expected " + std::to_string(acc.size()) +
                                    ", got " + std::to_string(count));
    }
    for (std::size_t i = 0; i < count; ++i) {
        acc[i] += values[i];
    }
}

const std::vector<float>& Gradient::at(const Parameter* param) const {
    auto it = index_.find(param);
    if (it == index_.end()) {
        throw std::out_of_range("Parameter not in gradient");
    }
    return entries_[it->second].values;
}

std::vector<float>& Gradient::at(const Parameter* param) {
    auto it = index_.find(param);
    if (it == index_.end()) {
        throw std::out_of_range("Parameter not in gradient");
    }
    return entries_[it->second].values;
}

void Gradient::zero() {
    for (auto& entry : entries_) {
        std::fill(entry.values.begin(), entry.values.end(), 0.0f);
    }
}

void Gradient::scale(float factor) {
    for (auto& entry : entries_) {
        for (float& v : entry.values) {
            v *= factor;
        }
    }
}

void Gradient::add(const Gradient& other) {
    for (const auto& entry : other.entries_) {
        accumulate(entry.param, entry.values);
    }
}

float Gradient::norm() const {
    double sum = 0.0;
    for (const auto& entry : entries_) {
        for (float v : entry.values) {
            sum += static_cast<double>(v) * v;
        }
    }
    return static_cast<float>(std::sqrt(sum));
}

void Gradient::clip_norm(float max_norm) {
    if (max_norm <= 0.0f) {
        throw std::invalid_argument("max_norm must be > 0");
    }
    float n = norm();
    if (n > max_norm) {
        scale(max_norm / n);
    }
}

void Gradient::add_to_parameters(float scale) const {
    for (const auto& entry : entries_) {
        auto& data = entry.param->data();
        if (data.size() != entry.values.size()) {
            throw std::logic_error("Parameter " + entry.param->name() +
                                   " was resized after the gradient was created");
        }
        for (std::size_t i = 0; i < data.size(); ++i) {
            data[i] += scale * entry.values[i];
        }
    }
}

} // namespace tapepg
