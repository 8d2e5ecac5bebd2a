#include "core/InstanceParser.h"
#include "core/SolverFactory.h"
#include "solvers/MultiStart.h"
#include "solvers/SolveParams.h"
#include "utils.h"
#include <iostream>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <omp.h>
#include <fstream>
#include <chrono>
#include <stdexcept>
#include <filesystem>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <memory>
#include <numeric>

struct ExperimentParams {
    std::string solver_name = "alns";
    std::string exp_size = "small";
    std::string output_csv;          // empty: no CSV
    std::string sol_path;            // empty: no .sol file
    std::string history_path;        // empty: no convergence CSV
    int num_runs = 1;                // repeated multi-start solves per instance
    int threads = 0;                 // parallel runs per solve, 0: one per OpenMP thread
    std::string data_dir;
    std::vector<std::string> instance_files;
    YAML::Node params_node;
    SolveParams solve_params;
    bool alternate_constructors = true;
    int verbose = 0;
};

static void usage_and_exit() {
    std::cerr << "Usage: ./cvrp_alns [--instance-file] <instance> | --instances <dir> [--solver <name>] [--params <param_file.yaml>] [--size <experiment_size>] [--threads <int>] [--num-runs <int>] [--output <output_file.csv>] [--sol <file|dir>] [--history <file|dir>] [--verbose <level> | -v <level>]" << std::endl;
    exit(1);
}

ExperimentParams parse_params(int argc, char* argv[]) {
    ExperimentParams params;
    std::string params_yaml_file;
    bool num_runs_given = false, threads_given = false, output_given = false;

    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        if (key == "--solver" && i + 1 < argc) {
            params.solver_name = argv[++i];
        } else if ((key == "--size" || key == "--exp-size") && i + 1 < argc) {
            params.exp_size = argv[++i];
        } else if (key == "--params" && i + 1 < argc) {
            params_yaml_file = argv[++i];
        } else if (key == "--instances" && i + 1 < argc) {
            params.data_dir = argv[++i];
        } else if (key == "--instance-file" && i + 1 < argc) {
            params.instance_files.push_back(argv[++i]);
        } else if (key == "--num-runs" && i + 1 < argc) {
            params.num_runs = std::stoi(argv[++i]);
            num_runs_given = true;
        } else if (key == "--threads" && i + 1 < argc) {
            params.threads = std::stoi(argv[++i]);
            threads_given = true;
        } else if (key == "--output" && i + 1 < argc) {
            params.output_csv = argv[++i];
            output_given = true;
        } else if (key == "--sol" && i + 1 < argc) {
            params.sol_path = argv[++i];
        } else if (key == "--history" && i + 1 < argc) {
            params.history_path = argv[++i];
        } else if ((key == "--verbose" || key == "-v") && i + 1 < argc) {
            params.verbose = std::stoi(argv[++i]);
        } else if (!key.empty() && key[0] != '-') {
            params.instance_files.push_back(key);
        } else {
            std::cerr << "Unknown or incomplete option: " << key << std::endl;
            usage_and_exit();
        }
    }

    if (!params_yaml_file.empty()) {
        YAML::Node config = YAML::LoadFile(params_yaml_file);
        if (!config[params.exp_size]) {
            std::cerr << "Experiment size '" << params.exp_size << "' not found in " << params_yaml_file << std::endl;
            exit(1);
        }
        auto exp_config = config[params.exp_size];
        if (params.data_dir.empty() && params.instance_files.empty() && exp_config["data_dir"])
            params.data_dir = exp_config["data_dir"].as<std::string>();
        if (!output_given && exp_config["output_csv"])
            params.output_csv = exp_config["output_csv"].as<std::string>();
        if (!num_runs_given && exp_config["num_runs"])
            params.num_runs = exp_config["num_runs"].as<int>();
        if (!threads_given && exp_config["threads"])
            params.threads = exp_config["threads"].as<int>();

        params.params_node = exp_config["params"];
        if (!params.params_node) {
            std::cerr << "Error: 'params' section for experiment size '" << params.exp_size << "' not found in " << params_yaml_file << std::endl;
            exit(1);
        }
        params.solve_params = load_solve_params(params.params_node);
        params.alternate_constructors = !params.params_node["constructor"];
    }

    if (params.instance_files.empty() && params.data_dir.empty()) usage_and_exit();
    if (params.num_runs < 1 || params.threads < 0) {
        std::cerr << "Error: --num-runs must be positive and --threads non-negative" << std::endl;
        exit(1);
    }
    if (!SolverFactory::create(params.solver_name)) {
        std::cerr << "Unknown or unregistered solver: " << params.solver_name << ". Available solvers:" << std::endl;
        for (const auto& solver : SolverFactory::available()) {
            std::cerr << "  " << solver.first << ": " << solver.second << std::endl;
        }
        exit(1);
    }
    return params;
}

std::set<std::string> load_completed_instances(const std::string& output_csv) {
    std::set<std::string> completed;
    std::ifstream ifs(output_csv);
    if (!ifs.is_open()) return completed;
    std::string line;
    std::getline(ifs, line); // Skip header
    while (std::getline(ifs, line)) {
        if (line.empty()) continue;
        auto comma = line.find(',');
        if (comma != std::string::npos) {
            completed.insert(line.substr(0, comma));
        }
    }
    return completed;
}

void print_params(const ExperimentParams& params) {
    std::cout << "Loaded parameters for solver '" << params.solver_name << "' and size '" << params.exp_size << "':" << std::endl;
    for (const auto& it : params.params_node) {
        std::cout << "  " << it.first.as<std::string>() << ": " << it.second.as<std::string>() << std::endl;
    }
    std::cout << "  num_runs: " << params.num_runs << std::endl;
    std::cout << "  threads: " << (params.threads > 0 ? params.threads : omp_get_max_threads()) << std::endl;
    std::cout << "  output_csv: " << params.output_csv << std::endl;
    std::cout << "  data_dir: " << params.data_dir << std::endl;
    std::cout << "  verbose: " << params.verbose << std::endl;
}

// `target` names a file for a single instance, or a directory that receives
// one <instance><ext> per instance.
static std::string output_path(const std::string& target, const std::string& instance_name, const std::string& ext) {
    if (std::filesystem::is_directory(target)) {
        return (std::filesystem::path(target) / (instance_name + ext)).string();
    }
    return target;
}

static void write_history(const std::string& path, const search::ConvergenceHistory& history) {
    std::ofstream ofs(path);
    if (!ofs) throw std::runtime_error("Cannot open history file: " + path);
    ofs << "iter,best_objective\n";
    for (const auto& sample : history) ofs << sample.first << "," << sample.second << "\n";
}

void run_experiment(const ExperimentParams& params) {
    std::vector<std::string> instance_files = params.instance_files;
    if (instance_files.empty()) instance_files = utils::list_instance_files(params.data_dir);
    if (params.verbose >= 1) print_params(params);

    std::set<std::string> completed_instances;
    std::ofstream ofs;
    if (!params.output_csv.empty()) {
        bool file_exists = std::filesystem::exists(params.output_csv);
        if (file_exists) {
            completed_instances = load_completed_instances(params.output_csv);
            ofs.open(params.output_csv, std::ios::app);
        } else {
            ofs.open(params.output_csv);
            ofs << "instance_name,Num Vehicles,Best Distance,AVG Distance,Std Distance,AVG Runtime (s),Std Runtime (s)\n";
        }
        if (!ofs) throw std::runtime_error("Cannot open output file: " + params.output_csv);
    }

    const int threads = params.threads > 0 ? params.threads : omp_get_max_threads();
    const unsigned int base_seed = utils::resolve_seed(params.solve_params.seed);

    for (const auto& file : instance_files) {
        std::string instance_name = utils::file_name(file);
        if (completed_instances.count(instance_name)) {
            std::cout << "Skipping already completed instance: " << instance_name << std::endl;
            continue;
        }
        if (params.verbose >= 1) std::cout << "\nProcessing instance: " << file << std::endl;

        auto instance = std::make_shared<const VRPInstance>(InstanceParser::parse(file));
        std::vector<double> distances, runtimes;
        MultiStartResult best;
        double best_runtime = 0.0;
        double best_distance = std::numeric_limits<double>::max();

        for (int run = 0; run < params.num_runs; ++run) {
            SolveParams solve_params = params.solve_params;
            solve_params.seed = base_seed + static_cast<unsigned int>(run * threads);

            auto start = std::chrono::steady_clock::now();
            MultiStartResult result = solve_multi_start(params.solver_name, instance, solve_params, threads, threads,
                                                        params.alternate_constructors, params.verbose,
                                                        !params.history_path.empty());
            double runtime = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

            std::string reason;
            if (!result.best.is_valid_solution(&reason)) {
                throw std::logic_error("solver returned an invalid solution for " + instance_name + ": " + reason);
            }
            double cost = result.best.cost();
            runtimes.push_back(runtime);
            distances.push_back(cost);
            if (cost < best_distance) {
                best_distance = cost;
                best_runtime = runtime;
                best = std::move(result);
            }
            if (params.verbose >= 1) {
                std::cout << "  Repeat " << (run + 1) << ": Obj = " << cost << ", Time = " << runtime << "s" << std::endl;
            }
        }

        nlohmann::json record = {
            {"Instance", instance_name},
            {"Time", utils::round2(best_runtime)},
            {"Result", utils::round2(best_distance)},
            {"Solution", best.best.to_string()},
        };
        std::cout << record.dump() << std::endl;

        if (!params.sol_path.empty()) {
            std::string path = output_path(params.sol_path, instance_name, ".sol");
            std::ofstream sol(path);
            if (!sol) throw std::runtime_error("Cannot open solution file: " + path);
            sol << best.best.to_file_string();
        }
        if (!params.history_path.empty()) {
            write_history(output_path(params.history_path, instance_name, ".history.csv"), best.history);
        }

        if (ofs.is_open()) {
            double avg_dist = std::accumulate(distances.begin(), distances.end(), 0.0) / distances.size();
            double sq_sum_dist = std::inner_product(distances.begin(), distances.end(), distances.begin(), 0.0);
            double std_dist = std::sqrt(std::max(0.0, sq_sum_dist / distances.size() - avg_dist * avg_dist));
            double avg_runtime = std::accumulate(runtimes.begin(), runtimes.end(), 0.0) / runtimes.size();
            double sq_sum_runtime = std::inner_product(runtimes.begin(), runtimes.end(), runtimes.begin(), 0.0);
            double std_runtime = std::sqrt(std::max(0.0, sq_sum_runtime / runtimes.size() - avg_runtime * avg_runtime));

            ofs << instance_name << "," << best.best.num_nonempty_routes() << "," << best_distance << "," << avg_dist << ","
                << std_dist << "," << avg_runtime << "," << std_runtime << "\n";
            ofs.flush();
            if (params.verbose >= 1) std::cout << "Results saved to: " << params.output_csv << std::endl;
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        ExperimentParams params = parse_params(argc, argv);
        run_experiment(params);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
