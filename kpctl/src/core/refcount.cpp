#include "refcount.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "abi.hpp"

#include <cstdio>

namespace kpctl {

bool module_resident(Host& host, const std::string& module) {
    return host.is_dir(join_path(SYS_MODULE_DIR, module));
}

Status wait_for_zero_refcount(const Runtime& rt, const std::string& module) {
    // A forced core holds its own reference, zero is never reached
    if (core_forces_module_ref(rt.host, rt.config)) {
        LOGD("refcnt wait skipped for %s: core pins patch modules", module.c_str());
        return Status::Ok;
    }

    if (!module_resident(rt.host, module)) {
        return Status::Ok;
    }

    std::string refcnt_path = join_path(join_path(SYS_MODULE_DIR, module), REFCNT_FILE_NAME);

    auto refcnt = read_number(rt.host, refcnt_path);
    if (refcnt && *refcnt == 0) {
        return Status::Ok;
    }

    printf("waiting (up to %u seconds) for module refcount...\n", rt.config.module_ref_wait);
    for (unsigned i = 0; i < rt.config.module_ref_wait; i++) {
        rt.host.sleep(1);
        refcnt = read_number(rt.host, refcnt_path);
        if (refcnt && *refcnt == 0) {
            LOGD("refcnt of %s reached zero after %u seconds", module.c_str(), i + 1);
            return Status::Ok;
        }
    }

    LOGE("refcnt of %s is %ld after %u seconds", module.c_str(), refcnt ? *refcnt : -1L,
         rt.config.module_ref_wait);
    return Status::RefcountTimeout;
}

}  // namespace kpctl
