#include "functions.hpp"
#include "../core/transition.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <cstdio>

namespace kpctl {

FunctionKey parse_function_entry(const std::string& object, const std::string& entry) {
    FunctionKey key{object, entry, 0};

    size_t comma = entry.rfind(',');
    if (comma != std::string::npos) {
        auto occurrence = parse_long(entry.substr(comma + 1));
        if (occurrence) {
            key.function = entry.substr(0, comma);
            key.occurrence = *occurrence;
        }
    }
    return key;
}

FunctionOwnership patched_functions(const Runtime& rt, KernelAbi abi) {
    FunctionOwnership functions;

    for (const auto& module : rt.host.list_dir(abi_root(abi))) {
        std::string module_dir = module_state_dir(abi, module);
        auto stack_order = read_number(rt.host, join_path(module_dir, STACK_ORDER_FILE_NAME));
        if (!stack_order)
            continue;

        bool transitioning = in_transition(rt.host, abi, module);

        for (const auto& object : rt.host.list_dir(module_dir)) {
            std::string object_dir = join_path(module_dir, object);
            if (!rt.host.is_dir(object_dir))
                continue;

            for (const auto& entry : rt.host.list_dir(object_dir)) {
                if (!rt.host.is_dir(join_path(object_dir, entry)))
                    continue;

                FunctionKey key = parse_function_entry(object, entry);
                auto it = functions.find(key);
                if (it != functions.end()) {
                    if (it->second.stack_order > *stack_order)
                        continue;
                    if (it->second.stack_order == *stack_order) {
                        LOGW("%s:%s patched by %s and %s with equal stack order %ld",
                             object.c_str(), key.function.c_str(), it->second.module.c_str(),
                             module.c_str(), *stack_order);
                    }
                }
                functions[key] = FunctionRecord{module, *stack_order, transitioning};
            }
        }
    }

    return functions;
}

void print_patched_functions(const FunctionOwnership& functions) {
    if (functions.empty())
        return;

    printf("\nPatched functions:\n");
    for (const auto& [key, record] : functions) {
        printf("%s:%s,%ld -> %s (stack order %ld)%s\n", key.object.c_str(),
               key.function.c_str(), key.occurrence, record.module.c_str(), record.stack_order,
               record.transitioning ? " [in transition]" : "");
    }
}

}  // namespace kpctl
