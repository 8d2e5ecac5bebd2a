#pragma once

#include "../solvers/Solver.h"
#include <memory>
#include <string>
#include <functional>
#include <map>
#include <utility>
#include <vector>

// Name -> engine registry filled by SolverRegistrar instances at static
// initialisation time.
class SolverFactory {
public:
    using SolverCreator = std::function<std::unique_ptr<Solver>()>;

    // nullptr for an unregistered name.
    static std::unique_ptr<Solver> create(const std::string& solver_name);
    static void register_solver(const std::string& solver_name, const std::string& description, SolverCreator creator);

    // (name, description) of every registered solver, sorted by name.
    static std::vector<std::pair<std::string, std::string>> available();

private:
    struct Entry {
        std::string description;
        SolverCreator creator;
    };
    static std::map<std::string, Entry>& get_registry();
};

// A helper class to automatically register solvers
template<class T>
class SolverRegistrar {
public:
    SolverRegistrar(const std::string& solver_name, const std::string& description) {
        SolverFactory::register_solver(solver_name, description, []() {
            return std::make_unique<T>();
        });
    }
};
