#include "core/ControllerConfig.hpp"
#include "core/Errors.hpp"

#include <fstream>
#include <iostream>

using nlohmann::json;

namespace qecloop {

void deep_merge(json& dest, const json& src) {
    if (!src.is_object() || !dest.is_object()) {
        dest = src;
        return;
    }
    for (auto it = src.begin(); it != src.end(); ++it) {
        const std::string& key = it.key();
        if (dest.contains(key) && dest[key].is_object() && it.value().is_object()) {
            deep_merge(dest[key], it.value());
        } else {
            dest[key] = it.value();
        }
    }
}

static Micros micros(const json& obj, const char* key, Micros def) {
    return Micros(obj.value(key, (int64_t)def.count()));
}

int encoded_value_from_string(const std::string& s) {
    if (s == "zero") return 0;
    if (s == "one") return 1;
    throw ConfigError(std::string(errors::D3400_ENCODED_STATE) + ", got '" + s + "'");
}

std::string encoded_state_string(int value) {
    return value == 1 ? "one" : "zero";
}

static json section(const json& j, const char* name) {
    if (!j.contains(name)) return json::object();
    const json& s = j.at(name);
    if (!s.is_object()) throw ConfigError(std::string(errors::D3400_SECTION_NOT_OBJECT) + ": " + name);
    return s;
}

void ControllerConfig::validate() const {
    error_model.validate();
    scheduler.validate();
    orchestrator.validate();
    simulator.validate();
    if (run.num_cycles <= 0) throw ConfigError(errors::D3400_ZERO_CYCLES);
    if (run.shots_per_cycle <= 0) throw ConfigError(errors::D3400_ZERO_SHOTS);
    if (run.runs <= 0) throw ConfigError(errors::D3400_ZERO_RUNS);
}

ControllerConfig ControllerConfig::from_json(const json& j) {
    ControllerConfig c;
    try {
        if (!j.is_object()) throw ConfigError(errors::D3400_PARSE);

        const json em = section(j, "error_model");
        c.error_model.floor = em.value("floor", c.error_model.floor);
        c.error_model.initial_estimate = em.value("initial_estimate", c.error_model.initial_estimate);
        c.error_model.learning_rate = em.value("learning_rate", c.error_model.learning_rate);
        c.error_model.decay_rate = em.value("decay_rate", c.error_model.decay_rate);
        c.error_model.correlation_step = em.value("correlation_step", c.error_model.correlation_step);
        c.error_model.correlation_decay = em.value("correlation_decay", c.error_model.correlation_decay);
        c.error_model.qubit_weight = em.value("qubit_weight", c.error_model.qubit_weight);
        c.error_model.correlation_weight = em.value("correlation_weight", c.error_model.correlation_weight);

        const json sc = section(j, "scheduler");
        c.scheduler.initial_delay = micros(sc, "initial_delay_us", c.scheduler.initial_delay);
        c.scheduler.min_cycle_time = micros(sc, "min_cycle_time_us", c.scheduler.min_cycle_time);
        c.scheduler.high_water = sc.value("high_water", c.scheduler.high_water);
        c.scheduler.low_water = sc.value("low_water", c.scheduler.low_water);
        c.scheduler.calm_cycles_required = sc.value("calm_cycles_required", c.scheduler.calm_cycles_required);
        c.scheduler.increase_factor = sc.value("increase_factor", c.scheduler.increase_factor);
        c.scheduler.direction_change_min_cycles = sc.value("direction_change_min_cycles", c.scheduler.direction_change_min_cycles);
        c.scheduler.weight_ema_alpha = sc.value("weight_ema_alpha", c.scheduler.weight_ema_alpha);
        c.scheduler.calm_weight_threshold = sc.value("calm_weight_threshold", c.scheduler.calm_weight_threshold);

        const json oc = section(j, "orchestrator");
        if (oc.contains("physical_qubits")) {
            auto qs = oc.at("physical_qubits").get<std::vector<int>>();
            if (qs.size() != c.orchestrator.physical_qubits.size()) throw ConfigError(errors::D3400_PHYSICAL_QUBITS);
            std::copy(qs.begin(), qs.end(), c.orchestrator.physical_qubits.begin());
        }
        c.orchestrator.retry_cap = oc.value("retry_cap", c.orchestrator.retry_cap);
        c.orchestrator.backoff_base = micros(oc, "backoff_base_us", c.orchestrator.backoff_base);
        c.orchestrator.backoff_max = micros(oc, "backoff_max_us", c.orchestrator.backoff_max);
        c.orchestrator.deadline_fraction = oc.value("deadline_fraction", c.orchestrator.deadline_fraction);
        c.orchestrator.verbose = oc.value("verbose", c.orchestrator.verbose);

        const json rc = section(j, "run");
        c.run.num_cycles = rc.value("num_cycles", c.run.num_cycles);
        c.run.shots_per_cycle = rc.value("shots_per_cycle", c.run.shots_per_cycle);
        c.run.runs = rc.value("runs", c.run.runs);

        const json sim = section(j, "simulator");
        c.simulator.backend_name = sim.value("backend_name", c.simulator.backend_name);
        c.simulator.num_qubits = sim.value("num_qubits", c.simulator.num_qubits);
        c.simulator.dynamic_circuits = sim.value("dynamic_circuits", c.simulator.dynamic_circuits);
        if (sim.contains("coupling_map")) {
            c.simulator.coupling_map.clear();
            for (const auto& e : sim.at("coupling_map")) {
                auto pair = e.get<std::vector<int>>();
                if (pair.size() != 2) throw ConfigError(errors::D3400_COUPLING_ENTRY);
                c.simulator.coupling_map.emplace_back(pair[0], pair[1]);
            }
        }
        c.simulator.t1 = micros(sim, "t1_us", c.simulator.t1);
        c.simulator.t2 = micros(sim, "t2_us", c.simulator.t2);
        c.simulator.flip_probability = sim.value("flip_probability", c.simulator.flip_probability);
        c.simulator.drift_amplitude = sim.value("drift_amplitude", c.simulator.drift_amplitude);
        c.simulator.drift_period_cycles = sim.value("drift_period_cycles", c.simulator.drift_period_cycles);
        c.simulator.correlated_flip_probability = sim.value("correlated_flip_probability", c.simulator.correlated_flip_probability);
        c.simulator.readout_error = sim.value("readout_error", c.simulator.readout_error);
        c.simulator.latency_mean = micros(sim, "latency_mean_us", c.simulator.latency_mean);
        c.simulator.latency_jitter = sim.value("latency_jitter", c.simulator.latency_jitter);
        c.simulator.unavailable_probability = sim.value("unavailable_probability", c.simulator.unavailable_probability);
        c.simulator.seed = sim.value("seed", c.simulator.seed);
        if (sim.contains("encoded_state")) c.simulator.encoded_value = encoded_value_from_string(sim.at("encoded_state").get<std::string>());
    } catch (const json::exception& e) {
        throw ConfigError(std::string(errors::D3400_PARSE) + ": " + e.what());
    }
    c.validate();
    return c;
}

json ControllerConfig::to_json() const {
    json coupling = json::array();
    for (const auto& [a, b] : simulator.coupling_map) coupling.push_back({a, b});
    return {
        {"error_model", {
            {"floor", error_model.floor},
            {"initial_estimate", error_model.initial_estimate},
            {"learning_rate", error_model.learning_rate},
            {"decay_rate", error_model.decay_rate},
            {"correlation_step", error_model.correlation_step},
            {"correlation_decay", error_model.correlation_decay},
            {"qubit_weight", error_model.qubit_weight},
            {"correlation_weight", error_model.correlation_weight}
        }},
        {"scheduler", {
            {"initial_delay_us", scheduler.initial_delay.count()},
            {"min_cycle_time_us", scheduler.min_cycle_time.count()},
            {"high_water", scheduler.high_water},
            {"low_water", scheduler.low_water},
            {"calm_cycles_required", scheduler.calm_cycles_required},
            {"increase_factor", scheduler.increase_factor},
            {"direction_change_min_cycles", scheduler.direction_change_min_cycles},
            {"weight_ema_alpha", scheduler.weight_ema_alpha},
            {"calm_weight_threshold", scheduler.calm_weight_threshold}
        }},
        {"orchestrator", {
            {"physical_qubits", orchestrator.physical_qubits},
            {"retry_cap", orchestrator.retry_cap},
            {"backoff_base_us", orchestrator.backoff_base.count()},
            {"backoff_max_us", orchestrator.backoff_max.count()},
            {"deadline_fraction", orchestrator.deadline_fraction},
            {"verbose", orchestrator.verbose}
        }},
        {"run", {
            {"num_cycles", run.num_cycles},
            {"shots_per_cycle", run.shots_per_cycle},
            {"runs", run.runs}
        }},
        {"simulator", {
            {"backend_name", simulator.backend_name},
            {"num_qubits", simulator.num_qubits},
            {"dynamic_circuits", simulator.dynamic_circuits},
            {"coupling_map", coupling},
            {"t1_us", simulator.t1.count()},
            {"t2_us", simulator.t2.count()},
            {"flip_probability", simulator.flip_probability},
            {"drift_amplitude", simulator.drift_amplitude},
            {"drift_period_cycles", simulator.drift_period_cycles},
            {"correlated_flip_probability", simulator.correlated_flip_probability},
            {"readout_error", simulator.readout_error},
            {"latency_mean_us", simulator.latency_mean.count()},
            {"latency_jitter", simulator.latency_jitter},
            {"unavailable_probability", simulator.unavailable_probability},
            {"seed", simulator.seed},
            {"encoded_state", encoded_state_string(simulator.encoded_value)}
        }}
    };
}

static json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError(std::string(errors::D3400_OPEN) + ": " + path);
    try {
        return json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string(errors::D3400_PARSE) + ": " + path + ": " + e.what());
    }
}

ControllerConfig ControllerConfig::load(const std::string& path) {
    return from_json(read_json_file(path));
}

ControllerConfig ControllerConfig::load_with_overrides(const std::string& base_path, const std::string& overrides_path) {
    json base = read_json_file(base_path);
    json overrides = read_json_file(overrides_path);
    deep_merge(base, overrides);
    std::cerr << "[config] applied overrides from " << overrides_path << std::endl;
    return from_json(base);
}

} // namespace qecloop
