#include <gtest/gtest.h>

#include "fake_host.hpp"
#include "patch/install.hpp"
#include "patch/lifecycle.hpp"
#include "patch/listing.hpp"
#include "sim_kernel.hpp"

namespace kpctl {
namespace {

using test::FakeHost;
using test::FakeReader;
using test::SimKernel;

class InstallTest : public ::testing::Test {
protected:
    FakeHost host;
    FakeReader reader;
    SimKernel sim{host, reader};
    Runtime rt{host, reader, Config{}};

    // Installed copies carry the same sections as their source
    void mirror(const std::string& from, const std::string& to) {
        reader.sections[to] = reader.sections[from];
    }

    std::string list_output() {
        testing::internal::CaptureStdout();
        EXPECT_EQ(list_patches(rt), Status::Ok);
        return testing::internal::GetCapturedStdout();
    }
};

TEST_F(InstallTest, CopiesIntoReleaseDirectory) {
    test::add_binary(host, reader, "/tmp/foo.ko", "foo", "5.10.0", "c0ffee");

    EXPECT_EQ(install_module(rt, "/tmp/foo.ko", std::nullopt), Status::Ok);
    EXPECT_TRUE(host.exists("/var/lib/kpatch/5.10.0/foo.ko"));
}

TEST_F(InstallTest, ExplicitReleaseMustMatchBinary) {
    test::add_binary(host, reader, "/tmp/foo.ko", "foo", "5.4.0", "c0ffee");

    EXPECT_EQ(install_module(rt, "/tmp/foo.ko", std::nullopt), Status::VersionMismatch);
    EXPECT_EQ(install_module(rt, "/tmp/foo.ko", std::string("5.4.0")), Status::Ok);
    EXPECT_TRUE(host.exists("/var/lib/kpatch/5.4.0/foo.ko"));
}

TEST_F(InstallTest, RejectsMissingAndDuplicate) {
    EXPECT_EQ(install_module(rt, "/tmp/nope.ko", std::nullopt), Status::NotFound);

    test::add_binary(host, reader, "/tmp/foo.ko", "foo", "5.10.0", "c0ffee");
    ASSERT_EQ(install_module(rt, "/tmp/foo.ko", std::nullopt), Status::Ok);
    EXPECT_EQ(install_module(rt, "/tmp/foo.ko", std::nullopt), Status::ToolFailure);
}

TEST_F(InstallTest, UninstallRemovesBinary) {
    test::add_binary(host, reader, "/var/lib/kpatch/5.10.0/foo-fix.ko", "foo_fix", "5.10.0",
                     "c0ffee");

    EXPECT_EQ(uninstall_module(rt, "foo_fix", std::nullopt), Status::Ok);
    EXPECT_FALSE(host.exists("/var/lib/kpatch/5.10.0/foo-fix.ko"));
    EXPECT_EQ(uninstall_module(rt, "foo_fix", std::nullopt), Status::NotFound);
}

TEST_F(InstallTest, InstallLoadListUnload) {
    sim.start_core();
    test::add_binary(host, reader, "/tmp/foo.ko", "foo", "5.10.0", "c0ffee");
    ASSERT_EQ(install_module(rt, "/tmp/foo.ko", std::nullopt), Status::Ok);
    mirror("/tmp/foo.ko", "/var/lib/kpatch/5.10.0/foo.ko");

    ASSERT_EQ(load_patch(rt, "foo"), Status::Ok);
    std::string listed = list_output();
    EXPECT_NE(listed.find("Loaded patch modules:\nfoo [enabled]\n"), std::string::npos);
    EXPECT_NE(listed.find("Installed patch modules:\nfoo (5.10.0)\n"), std::string::npos);

    host.files["/sys/module/foo/refcnt"] = "1\n";
    unsigned released_at = host.now + 2;
    host.tick_hooks.push_back([this, released_at](unsigned now) {
        if (now == released_at)
            host.files["/sys/module/foo/refcnt"] = "0\n";
    });
    ASSERT_EQ(unload_patch(rt, "foo"), Status::Ok);

    // Disable comes first, rmmod last
    ASSERT_FALSE(host.writes.empty());
    EXPECT_EQ(host.writes.back().first, "/sys/kernel/livepatch/foo/enabled");
    EXPECT_EQ(host.writes.back().second, "0");
    EXPECT_EQ(host.commands.back(), (std::vector<std::string>{"rmmod", "foo"}));

    listed = list_output();
    EXPECT_EQ(listed.find("[enabled]"), std::string::npos);
    EXPECT_NE(listed.find("Loaded patch modules:\n\nInstalled patch modules:\nfoo (5.10.0)\n"),
              std::string::npos);
}

TEST_F(InstallTest, ListShowsTransitionAndOwners) {
    sim.start_core();
    sim.stack_orders["foo"] = 1;
    sim.functions["foo"] = {"vmlinux/cmdline_proc_show,1"};
    sim.insert("foo", "", true);
    host.files["/sys/kernel/livepatch/foo/transition"] = "1\n";
    host.add_file("/proc/42/task/42/patch_state", "0\n");
    host.add_file("/proc/42/task/42/comm", "sleeper\n");
    host.add_file("/proc/42/task/42/stack", "[<0>] do_nanosleep+0x1/0x2\n");

    std::string listed = list_output();
    EXPECT_NE(listed.find("foo [enabling...]"), std::string::npos);
    EXPECT_NE(listed.find("sleeper"), std::string::npos);
    EXPECT_NE(listed.find("vmlinux:cmdline_proc_show,1 -> foo (stack order 1) [in transition]"),
              std::string::npos);
}

TEST_F(InstallTest, InfoPrintsEmbeddedMetadata) {
    test::add_binary(host, reader, "/var/lib/kpatch/5.10.0/foo.ko", "foo", "5.10.0", "c0ffee");

    testing::internal::CaptureStdout();
    EXPECT_EQ(print_module_info(rt, "foo"), Status::Ok);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("checksum:       c0ffee"), std::string::npos);
    EXPECT_NE(out.find("livepatch:      Y"), std::string::npos);

    EXPECT_EQ(print_module_info(rt, "bar"), Status::NotFound);
}

TEST_F(InstallTest, SignalWithoutTransitionIsNoOp) {
    sim.start_core();
    sim.insert("foo", "", true);

    testing::internal::CaptureStdout();
    EXPECT_EQ(signal_transition(rt), Status::Ok);
    EXPECT_NE(testing::internal::GetCapturedStdout().find("no patch transition in progress"),
              std::string::npos);
    EXPECT_EQ(sim.signals, 0u);
}

TEST_F(InstallTest, SignalPokesTransitioningModule) {
    sim.start_core();
    sim.insert("foo", "", true);
    host.files["/sys/kernel/livepatch/foo/transition"] = "1\n";

    EXPECT_EQ(signal_transition(rt), Status::Ok);
    EXPECT_EQ(sim.signals, 1u);

    // No signal attribute: warn only
    host.files.erase("/sys/kernel/livepatch/foo/signal");
    EXPECT_EQ(signal_transition(rt), Status::Ok);
    EXPECT_EQ(sim.signals, 1u);
}

}  // namespace
}  // namespace kpctl
