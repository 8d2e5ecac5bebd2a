#include "utils.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <random>

namespace utils {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string file_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

unsigned int resolve_seed(unsigned int seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return rd();
}

std::vector<std::string> list_instance_files(const std::string& dir, const std::string& ext) {
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ext) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace utils
