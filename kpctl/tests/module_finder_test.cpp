#include <gtest/gtest.h>

#include "fake_host.hpp"
#include "patch/module_finder.hpp"

namespace kpctl {
namespace {

using test::FakeHost;
using test::FakeReader;

class ModuleFinderTest : public ::testing::Test {
protected:
    FakeHost host;
    FakeReader reader;
    Runtime rt{host, reader, Config{}};

    void SetUp() override {
        test::add_binary(host, reader, "/var/lib/kpatch/5.10.0/livepatch-foo.ko",
                         "livepatch_foo", "5.10.0", "abc123");
        test::add_binary(host, reader, "/var/lib/kpatch/5.10.0/bar.ko", "bar", "5.10.0", "");
        test::add_binary(host, reader, "/var/lib/kpatch/4.18.0/old.ko", "old", "4.18.0", "");
        host.add_file("/var/lib/kpatch/5.10.0/README", "not a module");
    }
};

TEST_F(ModuleFinderTest, CanonicalName) {
    EXPECT_EQ(canonical_name("/tmp/livepatch-foo.ko"), "livepatch_foo");
    EXPECT_EQ(canonical_name("kpatch-cmdline"), "kpatch_cmdline");
    EXPECT_EQ(canonical_name("plain"), "plain");
}

TEST_F(ModuleFinderTest, FindsInstalledModuleByName) {
    auto module = find_module(rt, "livepatch-foo");
    ASSERT_TRUE(module.has_value());
    EXPECT_EQ(module->name, "livepatch_foo");
    EXPECT_EQ(module->path, "/var/lib/kpatch/5.10.0/livepatch-foo.ko");
    EXPECT_EQ(module->kernel_version, "5.10.0");
    EXPECT_EQ(module->checksum, "abc123");

    EXPECT_TRUE(find_module(rt, "livepatch_foo").has_value());
}

TEST_F(ModuleFinderTest, OnlyLooksAtRunningKernel) {
    EXPECT_FALSE(find_module(rt, "old").has_value());
    EXPECT_FALSE(find_module(rt, "README").has_value());
}

TEST_F(ModuleFinderTest, FindsByPath) {
    test::add_binary(host, reader, "/tmp/build/baz.ko", "baz", "5.10.0", "");

    auto module = find_module(rt, "/tmp/build/baz.ko");
    ASSERT_TRUE(module.has_value());
    EXPECT_EQ(module->name, "baz");

    // Basename of a path that only exists in the install directory
    module = find_module(rt, "/nowhere/bar.ko");
    ASSERT_TRUE(module.has_value());
    EXPECT_EQ(module->path, "/var/lib/kpatch/5.10.0/bar.ko");
}

TEST_F(ModuleFinderTest, MissingModuleIsNotFound) {
    EXPECT_FALSE(find_module(rt, "nope").has_value());
    EXPECT_FALSE(find_module(rt, "/tmp/nope.ko").has_value());
}

TEST_F(ModuleFinderTest, EmbeddedNameWinsOverFileName) {
    test::add_binary(host, reader, "/var/lib/kpatch/5.10.0/renamed.ko", "original_name",
                     "5.10.0", "");
    auto module = find_module(rt, "renamed");
    ASSERT_TRUE(module.has_value());
    EXPECT_EQ(module->name, "original_name");
}

TEST_F(ModuleFinderTest, VermagicReleaseIsFirstWord) {
    EXPECT_EQ(binary_kernel_version(reader, "/var/lib/kpatch/4.18.0/old.ko").value_or(""),
              "4.18.0");
    EXPECT_EQ(binary_modinfo(reader, "/var/lib/kpatch/4.18.0/old.ko", "license").value_or(""),
              "GPL");
    EXPECT_FALSE(binary_checksum(reader, "/var/lib/kpatch/5.10.0/bar.ko").has_value());
}

}  // namespace
}  // namespace kpctl
