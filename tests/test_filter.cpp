#include <gtest/gtest.h>
#include "localization.hpp"
#include "package.hpp"

#include <atomic>
#include <string>

class FilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization();
    }

    static Packages make_packages(std::size_t n) {
        Packages out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            auto p = std::make_shared<Package>();
            p->name = "pkg" + std::to_string(i);
            p->index = i;
            out.push_back(p);
        }
        return out;
    }
};

TEST_F(FilterTest, SizesAroundSplitThreshold) {
    for (std::size_t n : {0u, 1u, 2999u, 3000u, 3001u, 4000u, 4001u, 6500u}) {
        Packages packages = make_packages(n);

        EXPECT_TRUE(filter_packages(packages, [](const Package&) { return false; }).empty()) << n;

        Packages all = filter_packages(packages, [](const Package&) { return true; });
        ASSERT_EQ(all.size(), n);
        for (std::size_t i = 0; i < n; ++i) {
            ASSERT_EQ(all[i], packages[i]) << "n=" << n << " i=" << i;
        }
    }
}

TEST_F(FilterTest, KeepsOriginalOrder) {
    Packages packages = make_packages(7001);
    Packages odd = filter_packages(packages, [](const Package& p) { return p.index % 2 == 1; });
    ASSERT_EQ(odd.size(), 3500u);
    for (std::size_t i = 1; i < odd.size(); ++i) {
        EXPECT_LT(odd[i - 1]->index, odd[i]->index);
    }
    EXPECT_EQ(odd.front()->name, "pkg1");
    EXPECT_EQ(odd.back()->name, "pkg6999");
}

TEST_F(FilterTest, VisitsEachPackageOnce) {
    Packages packages = make_packages(5000);
    std::atomic<std::size_t> calls{0};
    filter_packages(packages, [&calls](const Package&) { ++calls; return true; });
    EXPECT_EQ(calls.load(), 5000u);
}
