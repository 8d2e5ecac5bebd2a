#include "core/InstanceParser.h"
#include "core/SolutionChecker.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>

// Re-validates the JSON result lines printed by cvrp_alns against the raw
// instance files.
int main(int argc, char* argv[]) {
    std::string results_file;
    std::string data_dir = ".";
    for (int i = 1; i < argc; ++i) {
        std::string key = argv[i];
        if (key == "--instances" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (!key.empty() && key[0] != '-') {
            results_file = key;
        }
    }
    if (results_file.empty()) {
        std::cerr << "Usage: ./cvrp_check <results.jsonl> [--instances <dir>]" << std::endl;
        return 1;
    }

    std::ifstream ifs(results_file);
    if (!ifs.is_open()) {
        std::cerr << "Cannot open " << results_file << std::endl;
        return 1;
    }

    int checked = 0, failed = 0;
    std::string line;
    int line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (line.empty() || line[0] != '{') continue; // progress output mixed into the log
        try {
            nlohmann::json record = nlohmann::json::parse(line);
            std::string instance_name = record.at("Instance").get<std::string>();
            double claimed = record.at("Result").get<double>();
            std::string solution = record.at("Solution").get<std::string>();
            std::cout << "Processing: " << instance_name << std::endl;

            VRPInstance instance = InstanceParser::parse((std::filesystem::path(data_dir) / instance_name).string());
            CheckResult res = SolutionChecker::check(instance, SolutionChecker::parse_routes(solution), claimed);
            ++checked;
            if (res.ok) {
                std::cout << "  OK, cost " << res.recomputed_cost << std::endl;
            } else {
                ++failed;
                std::cout << "  FAILED: " << res.message << std::endl;
            }
        } catch (const std::exception& e) {
            ++failed;
            std::cerr << results_file << ":" << line_no << ": " << e.what() << std::endl;
        }
    }
    std::cout << checked << " checked, " << failed << " failed" << std::endl;
    return failed == 0 ? 0 : 1;
}
