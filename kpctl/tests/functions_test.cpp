#include <gtest/gtest.h>

#include "fake_host.hpp"
#include "patch/functions.hpp"

namespace kpctl {
namespace {

using test::FakeHost;
using test::FakeReader;

class FunctionsTest : public ::testing::Test {
protected:
    FakeHost host;
    FakeReader reader;
    Runtime rt{host, reader, Config{}};

    void add_patch(const std::string& name, long stack_order,
                   const std::vector<std::string>& functions, bool transitioning = false) {
        std::string dir = "/sys/kernel/livepatch/" + name;
        host.add_file(dir + "/enabled", "1\n");
        host.add_file(dir + "/transition", transitioning ? "1\n" : "0\n");
        if (stack_order > 0)
            host.add_file(dir + "/stack_order", std::to_string(stack_order) + "\n");
        for (const auto& function : functions)
            host.add_dir(dir + "/" + function);
    }
};

TEST(FunctionEntryTest, SplitsOccurrence) {
    FunctionKey key = parse_function_entry("vmlinux", "cmdline_proc_show,1");
    EXPECT_EQ(key.object, "vmlinux");
    EXPECT_EQ(key.function, "cmdline_proc_show");
    EXPECT_EQ(key.occurrence, 1);

    key = parse_function_entry("ext4", "ext4_fill_super");
    EXPECT_EQ(key.function, "ext4_fill_super");
    EXPECT_EQ(key.occurrence, 0);

    key = parse_function_entry("vmlinux", "odd,name");
    EXPECT_EQ(key.function, "odd,name");
    EXPECT_EQ(key.occurrence, 0);
}

TEST_F(FunctionsTest, HighestStackOrderOwnsFunction) {
    add_patch("b_newer", 2, {"vmlinux/cmdline_proc_show,1"});
    add_patch("a_older", 1, {"vmlinux/cmdline_proc_show,1", "vmlinux/meminfo_proc_show,1"});

    auto functions = patched_functions(rt, KernelAbi::NativeLivepatch);
    ASSERT_EQ(functions.size(), 2u);
    EXPECT_EQ(functions.at({"vmlinux", "cmdline_proc_show", 1}).module, "b_newer");
    EXPECT_EQ(functions.at({"vmlinux", "cmdline_proc_show", 1}).stack_order, 2);
    EXPECT_EQ(functions.at({"vmlinux", "meminfo_proc_show", 1}).module, "a_older");
}

TEST_F(FunctionsTest, OccurrencesAreDistinctFunctions) {
    add_patch("p", 1, {"vmlinux/show,1", "vmlinux/show,2"});

    auto functions = patched_functions(rt, KernelAbi::NativeLivepatch);
    EXPECT_EQ(functions.size(), 2u);
}

TEST_F(FunctionsTest, EqualStackOrderGoesToLastScanned) {
    add_patch("a", 3, {"vmlinux/show,1"});
    add_patch("b", 3, {"vmlinux/show,1"});

    auto functions = patched_functions(rt, KernelAbi::NativeLivepatch);
    EXPECT_EQ(functions.at({"vmlinux", "show", 1}).module, "b");
}

TEST_F(FunctionsTest, TransitionIsReported) {
    add_patch("p", 1, {"vmlinux/show,1"}, true);

    auto functions = patched_functions(rt, KernelAbi::NativeLivepatch);
    ASSERT_EQ(functions.size(), 1u);
    EXPECT_TRUE(functions.begin()->second.transitioning);

    testing::internal::CaptureStdout();
    print_patched_functions(functions);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("vmlinux:show,1 -> p (stack order 1) [in transition]"), std::string::npos);
}

TEST_F(FunctionsTest, NoStackingMetadataMeansNoOwners) {
    add_patch("p", 0, {"vmlinux/show,1"});

    EXPECT_TRUE(patched_functions(rt, KernelAbi::NativeLivepatch).empty());

    testing::internal::CaptureStdout();
    print_patched_functions({});
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
}

}  // namespace
}  // namespace kpctl
