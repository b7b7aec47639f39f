#include <gtest/gtest.h>

#include "core/refcount.hpp"
#include "fake_host.hpp"

namespace kpctl {
namespace {

using test::FakeHost;
using test::FakeReader;

class RefcountTest : public ::testing::Test {
protected:
    FakeHost host;
    FakeReader reader;
    Runtime rt{host, reader, Config{}};

    void SetUp() override { host.add_file("/proc/kallsyms", "ffffffff81000000 T _stext\n"); }

    void drop_refcount_at(unsigned second) {
        host.tick_hooks.push_back([this, second](unsigned now) {
            if (now == second)
                host.files["/sys/module/foo/refcnt"] = "0\n";
        });
    }
};

TEST_F(RefcountTest, ZeroRefcountReturnsAtOnce) {
    host.add_file("/sys/module/foo/refcnt", "0\n");

    EXPECT_EQ(wait_for_zero_refcount(rt, "foo"), Status::Ok);
    EXPECT_EQ(host.now, 0u);
}

TEST_F(RefcountTest, WaitsUntilRefcountDrops) {
    host.add_file("/sys/module/foo/refcnt", "2\n");
    drop_refcount_at(4);

    EXPECT_EQ(wait_for_zero_refcount(rt, "foo"), Status::Ok);
    EXPECT_EQ(host.now, 4u);
}

TEST_F(RefcountTest, TimesOutWithNonZeroRefcount) {
    rt.config.module_ref_wait = 7;
    host.add_file("/sys/module/foo/refcnt", "1\n");

    EXPECT_EQ(wait_for_zero_refcount(rt, "foo"), Status::RefcountTimeout);
    EXPECT_EQ(host.now, 7u);
}

TEST_F(RefcountTest, SkippedWhenCorePinsModules) {
    host.files["/proc/kallsyms"] += "ffffffff81200000 T klp_force_transition\n";
    host.add_file("/sys/module/foo/refcnt", "1\n");

    EXPECT_EQ(wait_for_zero_refcount(rt, "foo"), Status::Ok);
    EXPECT_EQ(host.now, 0u);
}

TEST_F(RefcountTest, ModuleNotResidentIsSatisfied) {
    EXPECT_EQ(wait_for_zero_refcount(rt, "foo"), Status::Ok);
    EXPECT_FALSE(module_resident(host, "foo"));
}

}  // namespace
}  // namespace kpctl
