#ifndef UTILS_H
#define UTILS_H

#include <string>
#include <vector>

namespace utils {

// Rounded to two decimals, as reported in the result records.
double round2(double value);

// "path/to/X-n101-k25.txt" -> "X-n101-k25.txt"
std::string file_name(const std::string& path);

// A fixed seed passes through; 0 draws one from std::random_device.
unsigned int resolve_seed(unsigned int seed);

// Regular files with extension `ext` in `dir`, sorted by name.
std::vector<std::string> list_instance_files(const std::string& dir, const std::string& ext = ".vrp");

} // namespace utils

#endif // UTILS_H
