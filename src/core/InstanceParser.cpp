#include "InstanceParser.h"
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <vector>

static std::runtime_error parse_error(const std::string& source_name, int line_no, const std::string& what) {
    return std::runtime_error("Error: in VRPInstance() " + source_name + "\n" + what + " at line " + std::to_string(line_no));
}

// Reads the next non-blank line; returns false at end of input.
static bool next_line(std::istream& in, std::string& line, int& line_no) {
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") != std::string::npos) return true;
    }
    return false;
}

VRPInstance InstanceParser::parse(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile) {
        throw std::runtime_error("Error: in VRPInstance() " + filename + "\nFile not found");
    }
    return parse(infile, filename);
}

VRPInstance InstanceParser::parse(std::istream& in, const std::string& source_name) {
    std::string line;
    int line_no = 0;
    // Line 1: <number of customers incl. depot> <number of vehicles> <vehicle capacity>
    if (!next_line(in, line, line_no)) {
        throw std::runtime_error("Error: in VRPInstance() " + source_name + "\nFile is empty");
    }
    int num_customers = 0, num_vehicles = 0, vehicle_capacity = 0;
    {
        std::istringstream iss(line);
        if (!(iss >> num_customers >> num_vehicles >> vehicle_capacity) || !(iss >> std::ws).eof()) {
            throw parse_error(source_name, line_no, "Invalid first line format");
        }
    }
    if (num_customers < 1 || num_vehicles < 1 || vehicle_capacity < 1) {
        throw parse_error(source_name, line_no, "Customer count, vehicle count and capacity must be positive");
    }

    // Next num_customers lines: <demand> <x> <y>, depot first
    std::vector<int> demands(num_customers, 0);
    std::vector<double> xs(num_customers, 0.0), ys(num_customers, 0.0);
    for (int i = 0; i < num_customers; ++i) {
        if (!next_line(in, line, line_no)) {
            throw parse_error(source_name, line_no + 1, "Missing customer data for customer " + std::to_string(i));
        }
        std::istringstream iss(line);
        if (!(iss >> demands[i] >> xs[i] >> ys[i]) || !(iss >> std::ws).eof()) {
            throw parse_error(source_name, line_no, "Invalid customer data format");
        }
        if (demands[i] < 0) {
            throw parse_error(source_name, line_no, "Negative demand");
        }
    }
    return VRPInstance(num_vehicles, vehicle_capacity, std::move(demands), std::move(xs), std::move(ys));
}
