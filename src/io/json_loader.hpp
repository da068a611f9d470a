#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <stdexcept>
#include "../Params.hpp"

namespace Kapital {

class JsonLoader {
public:
    using json = nlohmann::json;

    static ModelConfig load_config(const std::string& filepath) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        json data;
        try {
            data = json::parse(f);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Could not parse config file " + filepath + ": " + e.what());
        }

        std::cout << "[Kapital::IO] Loading config: " << filepath << std::endl;
        return parse_config(data);
    }

    static ModelConfig parse_config(const json& data) {
        ModelConfig cfg;

        // 1. Parameters
        if (!data.contains("parameters") || !data["parameters"].is_object()) {
            throw std::runtime_error("Missing required section: parameters");
        }
        const json& pars = data["parameters"];
        cfg.params.r = get_required(pars, "r");
        cfg.params.delta = get_required(pars, "delta");
        cfg.params.w = get_required(pars, "w");
        cfg.params.pk = get_required(pars, "pk");
        cfg.params.elast = get_required(pars, "elast");
        cfg.params.scale = get_required(pars, "scale");

        // 2. Starting values
        cfg.p0 = get_required(data, "p");
        cfg.cap0 = get_required(data, "cap0");
        cfg.params.cap0 = cfg.cap0;

        // 3. Run controls
        cfg.endog_p = data.value("endog_p", true);
        cfg.base_only = data.value("base_only", false);
        cfg.force = data.value("force", false);

        // 4. Files and directories
        cfg.in_dir = get_required_string(data, "in");
        cfg.out_ex = get_required_string(data, "out_ex");
        cfg.out_en = get_required_string(data, "out_en");
        cfg.out_cm = data.value("out_cm", cfg.out_cm);
        cfg.baseline = data.value("baseline", cfg.baseline);

        // 5. Run registry
        if (data.contains("roll")) {
            for (auto& [key, val] : data["roll"].items()) {
                RollingSpec spec;
                spec.base = val.value("base", std::string());
                if (!val.contains("year") || !val["year"].is_number_integer()) {
                    throw std::runtime_error("roll." + key + ": integer 'year' is required");
                }
                spec.year = val["year"].get<int>();
                if (val.contains("cap0")) {
                    if (!val["cap0"].is_number()) {
                        throw std::runtime_error("roll." + key + ".cap0 must be a number");
                    }
                    spec.has_cap0 = true;
                    spec.cap0 = val["cap0"].get<double>();
                }
                cfg.roll[key] = spec;
            }
        }
        if (data.contains("inertial")) {
            for (const auto& v : data["inertial"]) {
                cfg.inertial.insert(v.get<std::string>());
            }
        }

        // 6. Root finder
        if (data.contains("solver")) {
            const json& s = data["solver"];
            cfg.solver.max_iter = s.value("max_iter", cfg.solver.max_iter);
            cfg.solver.tol = s.value("tol", cfg.solver.tol);
            cfg.solver.fd_eps = s.value("fd_eps", cfg.solver.fd_eps);
            cfg.solver.damping_factor = s.value("damping", cfg.solver.damping_factor);
            cfg.solver.max_backtracking = s.value("max_backtracking", cfg.solver.max_backtracking);
            cfg.solver.verbose = s.value("verbose", cfg.solver.verbose);
        }

        // 7. Summary program
        if (data.contains("legend")) {
            for (auto& [key, val] : data["legend"].items()) {
                cfg.legend[key] = val.get<std::string>();
            }
        }
        cfg.last_year = data.value("last_year", cfg.last_year);

        validate(cfg);

        std::cout << "[Kapital::IO] Loaded " << cfg.roll.size() << " rolling and "
                  << cfg.inertial.size() << " inertial run definitions" << std::endl;
        return cfg;
    }

    static void validate(const ModelConfig& cfg) {
        const InvestParams& p = cfg.params;
        if (!(p.w > 0.0)) throw std::runtime_error("Parameter w must be positive");
        if (!(p.delta > 0.0)) throw std::runtime_error("Parameter delta must be positive");
        if (!(p.r + p.delta > 0.0)) throw std::runtime_error("Parameters r + delta must be positive");
        if (p.elast == 0.0) throw std::runtime_error("Parameter elast must be non-zero");
        if (p.scale == 0.0) throw std::runtime_error("Parameter scale must be non-zero");

        for (const auto& [prefix, spec] : cfg.roll) {
            if (spec.base.empty()) throw std::runtime_error("roll." + prefix + ": 'base' is required");
            if (spec.year < 0) throw std::runtime_error("roll." + prefix + ": 'year' must be non-negative");
        }
        if (cfg.last_year < 0) throw std::runtime_error("last_year must be non-negative");
        if (cfg.solver.max_iter <= 0) throw std::runtime_error("solver.max_iter must be positive");
        if (!(cfg.solver.tol > 0.0)) throw std::runtime_error("solver.tol must be positive");
    }

private:
    static double get_required(const json& obj, const std::string& key) {
        if (!obj.contains(key)) throw std::runtime_error("Missing required parameter: " + key);
        if (!obj[key].is_number()) throw std::runtime_error("Parameter " + key + " must be a number");
        return obj[key].get<double>();
    }

    static std::string get_required_string(const json& obj, const std::string& key) {
        if (!obj.contains(key) || !obj[key].is_string()) {
            throw std::runtime_error("Missing required setting: " + key);
        }
        return obj[key].get<std::string>();
    }
};

} // namespace Kapital
