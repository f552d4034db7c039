#include "saf_focus/config/configuration.hpp"
#include "saf_focus/core/errors.hpp"
#include "saf_focus/core/utils.hpp"
#include "saf_focus/pipeline/focus_runner.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << saf_focus::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// default-config <path>
// ============================================================================
int cmd_default_config(const std::string& path) {
    saf_focus::config::Config cfg;
    cfg.save(path);

    json result;
    result["path"] = path;
    result["saved"] = true;
    print_json(result);
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        saf_focus::config::Config cfg;
        if (!path.empty()) {
            cfg = saf_focus::config::Config::load(path);
        } else {
            std::string yaml_text = use_stdin ? read_stdin() : yaml_arg;
            YAML::Node node;
            try {
                node = YAML::Load(yaml_text);
            } catch (const YAML::Exception& e) {
                throw saf_focus::ConfigError(std::string("Cannot parse YAML: ") + e.what());
            }
            cfg = saf_focus::config::Config::from_yaml(node);
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const saf_focus::SafFocusError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// compute --config <path> [--depth D] [--workers N] [--debug] [--curve P] [--events]
// ============================================================================
struct ComputeOptions {
    std::string config_path;
    std::string depth;
    std::string workers;
    std::string curve;
    bool debug = false;
    bool events = false;
};

int cmd_compute(const ComputeOptions& opts) {
    saf_focus::config::Config cfg;
    json run_info = json::object();
    if (!opts.config_path.empty()) {
        cfg = saf_focus::config::Config::load(opts.config_path);
        run_info["config_path"] = opts.config_path;
        run_info["config_sha256"] = saf_focus::core::sha256_file(opts.config_path);
    }

    try {
        if (!opts.depth.empty()) cfg.geometry.depth = std::stod(opts.depth);
        if (!opts.workers.empty()) cfg.runtime.parallel_workers = std::stoi(opts.workers);
    } catch (const std::exception& e) {
        throw saf_focus::InvalidParameterError(std::string("bad numeric option: ") + e.what());
    }
    if (opts.debug) cfg.runtime.debug = true;
    if (opts.events) cfg.output.events = true;
    if (!opts.curve.empty()) cfg.output.curve_artifact = opts.curve;

    saf_focus::pipeline::FocusRunner runner(cfg);
    const std::string run_id = saf_focus::core::get_run_id();
    const saf_focus::FocusResult result = runner.run(run_id, std::cerr, run_info);

    json out = saf_focus::pipeline::focus_result_to_json(result);
    out["run_id"] = run_id;
    print_json(out);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: saf_focus_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  default-config <path>           Write a config YAML with default values\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate config\n"
              << "  compute [--config P] [--depth D] [--workers N] [--debug] [--curve OUT] [--events]\n"
              << "                                  Optimal stage position and RMS aberration\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "default-config") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "default-config requires a path argument\n";
                return 1;
            }
            return cmd_default_config(path);
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            std::string yaml = get_arg("--yaml");
            bool use_stdin = has_flag("--stdin");
            bool strict = has_flag("--strict-exit-codes");

            if (path.empty() && yaml.empty() && !use_stdin) {
                std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
                return 1;
            }
            return cmd_validate_config(path, yaml, use_stdin, strict);
        }

        if (command == "compute") {
            ComputeOptions opts;
            opts.config_path = get_arg("--config", "-c");
            opts.depth = get_arg("--depth");
            opts.workers = get_arg("--workers", "-j");
            opts.curve = get_arg("--curve");
            opts.debug = has_flag("--debug");
            opts.events = has_flag("--events");
            return cmd_compute(opts);
        }
    } catch (const saf_focus::SafFocusError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
