#pragma once

#include <map>
#include <string>
#include <tuple>

#include "../core/abi.hpp"
#include "../runtime.hpp"

namespace kpctl {

struct FunctionKey {
    std::string object;
    std::string function;
    long occurrence;

    bool operator<(const FunctionKey& other) const {
        return std::tie(object, function, occurrence) <
               std::tie(other.object, other.function, other.occurrence);
    }
};

struct FunctionRecord {
    std::string module;
    long stack_order;
    bool transitioning;
};

using FunctionOwnership = std::map<FunctionKey, FunctionRecord>;

// "cmdline_proc_show,1" -> {cmdline_proc_show, 1}; occurrence 0 when absent
FunctionKey parse_function_entry(const std::string& object, const std::string& entry);

// Owner of every patched function: the resident module with the highest
// stack_order. Equal orders go to the module scanned last. Empty on ABIs
// without stacking metadata.
FunctionOwnership patched_functions(const Runtime& rt, KernelAbi abi);

void print_patched_functions(const FunctionOwnership& functions);

}  // namespace kpctl
