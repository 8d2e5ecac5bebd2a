#include "SolverFactory.h"

std::unique_ptr<Solver> SolverFactory::create(const std::string& solver_name) {
    auto& registry = get_registry();
    auto it = registry.find(solver_name);
    if (it == registry.end()) return nullptr;
    return it->second.creator();
}

void SolverFactory::register_solver(const std::string& solver_name, const std::string& description, SolverCreator creator) {
    get_registry()[solver_name] = Entry{description, std::move(creator)};
}

std::vector<std::pair<std::string, std::string>> SolverFactory::available() {
    std::vector<std::pair<std::string, std::string>> solvers;
    for (const auto& kv : get_registry()) solvers.emplace_back(kv.first, kv.second.description);
    return solvers;
}

std::map<std::string, SolverFactory::Entry>& SolverFactory::get_registry() {
    static std::map<std::string, Entry> registry;
    return registry;
}
