#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace tapepg {

// ============================================================================
// Parameter
// ============================================================================

/**
 * A named, owned block of trainable values.
 * Identity is the object's address; parameters are neither copied nor moved
 * once a Gradient or an Optimizer refers to them.
 */
class Parameter {
public:
    Parameter(std::string name, std::vector<float> data)
        : name_(std::move(name)), data_(std::move(data)) {}

    Parameter(const Parameter&) = delete;
    Parameter& operator=(const Parameter&) = delete;

    const std::string& name() const { return name_; }

    std::vector<float>& data() { return data_; }
    const std::vector<float>& data() const { return data_; }

    std::size_t size() const { return data_.size(); }

private:
    std::string name_;
    std::vector<float> data_;
};

// ============================================================================
// Gradient
// ============================================================================

/**
 * Additive accumulators for a fixed set of parameters.
 * Values are derivatives of an objective that is being maximized.
 */
class Gradient {
public:
    struct Entry {
        Parameter* param;
        std::vector<float> values;
    };

    Gradient() = default;

    // Zero accumulators for every distinct parameter in params
    explicit Gradient(const std::vector<Parameter*>& params);

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

    bool contains(const Parameter* param) const;

    /**
     * Add values into the accumulator of param.
     * Parameters outside the set are ignored; a size mismatch throws.
     */
    void accumulate(const Parameter* param, const float* values, std::size_t count);

    void accumulate(const Parameter* param, const std::vector<float>& values) {
        accumulate(param, values.data(), values.size());
    }

    const std::vector<float>& at(const Parameter* param) const;
    std::vector<float>& at(const Parameter* param);

    void zero();
    void scale(float factor);

    // Sum of another gradient over the same parameters
    void add(const Gradient& other);

    float norm() const;

    // Rescale so that norm() <= max_norm
    void clip_norm(float max_norm);

    // params += scale * gradient
    void add_to_parameters(float scale = 1.0f) const;

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<const Parameter*, std::size_t> index_;
};

} // namespace tapepg
