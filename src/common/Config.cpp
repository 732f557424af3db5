#include "common/Config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace tapepg {

NLOHMANN_JSON_SERIALIZE_ENUM(TapeStorage, {
    {TapeStorage::Reference, "reference"},
    {TapeStorage::Compressed, "compressed"},
})

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TapeConfig,
    storage, range_min, range_max, checkpoint_interval)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PPOConfig,
    critic_weight, discount, lambda, epsilon, pool_base,
    normalize_advantages, log_interval)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AdamConfig,
    lr, beta1, beta2, eps, weight_decay)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SGDConfig,
    lr, momentum, weight_decay, nesterov)

Config Config::from_json(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.good()) {
        throw std::runtime_error("Can't open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path.string() + ": " + e.what());
    }

    Config config;
    try {
        config.ppo = j.value("ppo", config.ppo);
        config.input_tape = j.value("input_tape", config.input_tape);
        config.adam = j.value("adam", config.adam);
        config.sgd = j.value("sgd", config.sgd);
        config.optimizer = j.value("optimizer", config.optimizer);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    config.validate();
    return config;
}

void Config::to_json(const std::filesystem::path& path) const {
    nlohmann::json j;
    j["ppo"] = ppo;
    j["input_tape"] = input_tape;
    j["adam"] = adam;
    j["sgd"] = sgd;
    j["optimizer"] = optimizer;
    j["log_level"] = log_level;

    std::ofstream out(path);
    if (!out.good()) {
        throw std::runtime_error("Can't write config file: " + path.string());
    }
    out << j.dump(4);
}

} // namespace tapepg
