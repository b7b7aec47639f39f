#include <gtest/gtest.h>

#include "core/abi.hpp"
#include "fake_host.hpp"

namespace kpctl {
namespace {

using test::FakeHost;

TEST(AbiTest, PrefersNativeLivepatch) {
    FakeHost host;
    host.add_dir("/sys/kernel/livepatch");
    host.add_dir("/sys/kernel/kpatch/patches");

    EXPECT_EQ(resolve_abi(host), KernelAbi::NativeLivepatch);
}

TEST(AbiTest, FallsBackToLegacyPatchesThenCore) {
    FakeHost host;
    host.add_dir("/sys/kernel/kpatch/patches");
    EXPECT_EQ(resolve_abi(host), KernelAbi::LegacyPatches);

    FakeHost bare;
    EXPECT_EQ(resolve_abi(bare), KernelAbi::LegacyCore);
    EXPECT_STREQ(abi_root(KernelAbi::LegacyCore), "/sys/kernel/kpatch");
}

TEST(AbiTest, ResolvesAgainAfterCoreActivation) {
    FakeHost host;
    EXPECT_EQ(resolve_abi(host), KernelAbi::LegacyCore);

    host.add_dir("/sys/kernel/livepatch");
    EXPECT_EQ(resolve_abi(host), KernelAbi::NativeLivepatch);
}

TEST(AbiTest, CoreLoadedNeedsGlobalTextSymbol) {
    FakeHost host;
    host.add_file("/proc/kallsyms",
                  "ffffffff81000000 T _stext\n"
                  "ffffffff81100000 t kpatch_register\n");
    EXPECT_FALSE(core_loaded(host));

    host.files["/proc/kallsyms"] += "ffffffffc0000000 T kpatch_register\t[kpatch]\n";
    EXPECT_TRUE(core_loaded(host));
}

TEST(AbiTest, ForceRefCapabilityFollowsConfig) {
    FakeHost host;
    host.add_file("/proc/kallsyms", "ffffffff81200000 t klp_force_transition\n");

    Config config;
    EXPECT_TRUE(core_forces_module_ref(host, config));

    config.force_ref_symbol = "";
    EXPECT_FALSE(core_forces_module_ref(host, config));

    config.force_ref_symbol = "kpatch_force_ref";
    EXPECT_FALSE(core_forces_module_ref(host, config));
}

TEST(AbiTest, SignalControlOnlyOnNativeAbi) {
    FakeHost host;
    host.add_file("/sys/kernel/livepatch/foo/signal", "");
    host.add_file("/sys/kernel/kpatch/foo/signal", "");

    EXPECT_TRUE(has_signal_control(host, KernelAbi::NativeLivepatch, "foo"));
    EXPECT_FALSE(has_signal_control(host, KernelAbi::NativeLivepatch, "bar"));
    EXPECT_FALSE(has_signal_control(host, KernelAbi::LegacyCore, "foo"));
}

}  // namespace
}  // namespace kpctl
