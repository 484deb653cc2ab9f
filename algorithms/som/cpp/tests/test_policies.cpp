/**
 * @file test_policies.cpp
 * @brief Tests for distances, restraints, influences and input adapters
 */

#include <gtest/gtest.h>

#include <cmath>
#include <random>

#include "../adapter.hpp"
#include "../distance.hpp"
#include "../influence.hpp"
#include "../restraint.hpp"

using namespace kohonen;

class DistanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        a = (Vector(3) << 1.0, 2.0, 3.0).finished();
        b = (Vector(3) << 4.0, 0.0, 3.5).finished();
    }

    template <typename Distance>
    void expect_metric(const Distance& d) {
        EXPECT_DOUBLE_EQ(d(a, a), 0.0);
        EXPECT_DOUBLE_EQ(d(b, b), 0.0);
        EXPECT_GT(d(a, b), 0.0);
        EXPECT_DOUBLE_EQ(d(a, b), d(b, a));

        std::mt19937 gen(42);
        std::uniform_real_distribution<> dis(-1.0, 1.0);
        for (int i = 0; i < 50; ++i) {
            Vector x(4), y(4);
            for (int k = 0; k < 4; ++k) {
                x(k) = dis(gen);
                y(k) = dis(gen);
            }
            EXPECT_GE(d(x, y), 0.0);
            EXPECT_DOUBLE_EQ(d(x, y), d(y, x));
        }
    }

    Vector a;
    Vector b;
};

TEST_F(DistanceTest, Euclidean) {
    EuclideanDistance d;
    EXPECT_DOUBLE_EQ(d(a, b), std::sqrt(9.0 + 4.0 + 0.25));
    expect_metric(d);
}

TEST_F(DistanceTest, Manhattan) {
    ManhattanDistance d;
    EXPECT_DOUBLE_EQ(d(a, b), 3.0 + 2.0 + 0.5);
    expect_metric(d);
}

TEST_F(DistanceTest, Chebyshev) {
    ChebyshevDistance d;
    EXPECT_DOUBLE_EQ(d(a, b), 3.0);
    expect_metric(d);
}

TEST_F(DistanceTest, WidthMismatchThrows) {
    Vector c = Vector::Zero(2);
    EXPECT_THROW(EuclideanDistance()(a, c), DimensionMismatch);
    EXPECT_THROW(ManhattanDistance()(a, c), DimensionMismatch);
    EXPECT_THROW(ChebyshevDistance()(c, a), DimensionMismatch);
}

TEST(RestraintTest, NoRestraintIsOne) {
    NoRestraint r;
    EXPECT_DOUBLE_EQ(r(0, 100), 1.0);
    EXPECT_DOUBLE_EQ(r(99, 100), 1.0);
}

TEST(RestraintTest, Simple) {
    SimpleRestraint r{2.0, 3.0};
    EXPECT_DOUBLE_EQ(r(0, 10), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(r(7, 10), 0.2);
}

TEST(RestraintTest, Exponential) {
    ExpRestraint r{0.5};
    EXPECT_DOUBLE_EQ(r(0, 100), 0.5);
    EXPECT_DOUBLE_EQ(r(50, 100), 0.5 * std::exp(-0.5));
    EXPECT_GT(r(10, 100), r(20, 100));
}

TEST(RestraintTest, ExponentialFixedTimeConstant) {
    ExpRestraint r{1.0, 10.0};
    EXPECT_DOUBLE_EQ(r(10, 1000), std::exp(-1.0));
    EXPECT_DOUBLE_EQ(r(10, 5), std::exp(-1.0));
}

TEST(InfluenceTest, BmuOnly) {
    BmuOnlyInfluence f;
    EXPECT_DOUBLE_EQ(f({2, 3}, 0, 10, {2, 3}), 1.0);
    EXPECT_DOUBLE_EQ(f({2, 3}, 0, 10, {2, 4}), 0.0);
    EXPECT_DOUBLE_EQ(f({2, 3}, 5, 10, {3, 3}), 0.0);
}

TEST(InfluenceTest, RadiusReducingShrinksToHalf) {
    RadiusReducingInfluence f{2.0};

    // t = 0: radius 2
    EXPECT_DOUBLE_EQ(f({5, 5}, 0, 100, {5, 5}), 1.0);
    EXPECT_DOUBLE_EQ(f({5, 5}, 0, 100, {7, 5}), 1.0);
    EXPECT_DOUBLE_EQ(f({5, 5}, 0, 100, {6, 6}), 1.0);
    EXPECT_DOUBLE_EQ(f({5, 5}, 0, 100, {7, 6}), 0.0);

    // t = 99: radius just above 1
    EXPECT_DOUBLE_EQ(f({5, 5}, 99, 100, {6, 5}), 1.0);
    EXPECT_DOUBLE_EQ(f({5, 5}, 99, 100, {7, 5}), 0.0);
    EXPECT_DOUBLE_EQ(f({5, 5}, 99, 100, {6, 6}), 0.0);
}

TEST(InfluenceTest, GaussianDecays) {
    GaussianInfluence f{2.0};

    EXPECT_DOUBLE_EQ(f({0, 0}, 0, 100, {0, 0}), 1.0);
    EXPECT_DOUBLE_EQ(f({0, 0}, 0, 100, {2, 0}), std::exp(-4.0 / 8.0));

    const double q = 2.0 * std::exp(-0.5);
    EXPECT_DOUBLE_EQ(f({0, 0}, 50, 100, {1, 1}), std::exp(-2.0 / (2.0 * q * q)));

    // Farther neurons and later iterations get less
    EXPECT_GT(f({0, 0}, 0, 100, {1, 0}), f({0, 0}, 0, 100, {2, 0}));
    EXPECT_GT(f({0, 0}, 0, 100, {1, 0}), f({0, 0}, 90, 100, {1, 0}));
    EXPECT_LE(f({0, 0}, 0, 100, {3, 3}), 1.0);
    EXPECT_GE(f({0, 0}, 0, 100, {3, 3}), 0.0);
}

TEST(InfluenceTest, GaussianWithCustomWidth) {
    GaussianWidthInfluence f{[](int t, int T) { return 3.0 * (1.0 - static_cast<double>(t) / T); }};

    EXPECT_DOUBLE_EQ(f({1, 1}, 0, 10, {1, 4}), std::exp(-9.0 / 18.0));
    EXPECT_DOUBLE_EQ(f({1, 1}, 5, 10, {1, 2}), std::exp(-1.0 / (2.0 * 1.5 * 1.5)));
}

TEST(InfluenceTest, GaussianZeroWidthKeepsBmuOnly) {
    GaussianWidthInfluence f{[](int, int) { return 0.0; }};
    EXPECT_DOUBLE_EQ(f({1, 1}, 3, 10, {1, 1}), 1.0);
    EXPECT_DOUBLE_EQ(f({1, 1}, 3, 10, {1, 2}), 0.0);
}

TEST(AdapterTest, IdentityLeavesInput) {
    Vector v = (Vector(2) << 3.0, -1.0).finished();
    const Vector expected = v;
    IdentityAdapter()(v);
    EXPECT_EQ(v, expected);
}

TEST(AdapterTest, MinMaxSingleCoordinate) {
    MinMaxAdapter adapter((Vector(1) << 0.0).finished(), (Vector(1) << 10.0).finished());
    Vector v = (Vector(1) << 5.0).finished();
    adapter(v);
    EXPECT_DOUBLE_EQ(v(0), 0.5);
}

TEST(AdapterTest, MinMaxPerCoordinate) {
    MinMaxAdapter adapter(Vector::Zero(3), (Vector(3) << 10.0, 20.0, 40.0).finished());
    Vector v = (Vector(3) << 10.0, 10.0, 10.0).finished();
    adapter(v);
    EXPECT_DOUBLE_EQ(v(0), 1.0);
    EXPECT_DOUBLE_EQ(v(1), 0.5);
    EXPECT_DOUBLE_EQ(v(2), 0.25);
}

TEST(AdapterTest, MinMaxConstantCoordinateMapsToZero) {
    MinMaxAdapter adapter((Vector(2) << 1.0, 2.0).finished(), (Vector(2) << 1.0, 4.0).finished());
    Vector v = (Vector(2) << 1.0, 3.0).finished();
    adapter(v);
    EXPECT_DOUBLE_EQ(v(0), 0.0);
    EXPECT_DOUBLE_EQ(v(1), 0.5);
}

TEST(AdapterTest, MinMaxWidthMismatchThrows) {
    EXPECT_THROW(MinMaxAdapter(Vector::Zero(2), Vector::Ones(3)), DimensionMismatch);

    MinMaxAdapter adapter(Vector::Zero(2), Vector::Ones(2));
    Vector v = Vector::Zero(3);
    EXPECT_THROW(adapter(v), DimensionMismatch);
}

TEST(AdapterTest, MinMaxFitFromDataset) {
    Dataset ds;
    ds.add_raw({1.0, -2.0});
    ds.add_raw({3.0, 6.0});
    ds.add_raw({2.0, 0.0});

    MinMaxAdapter adapter = MinMaxAdapter::fit(ds);
    EXPECT_EQ(adapter.min(), (Vector(2) << 1.0, -2.0).finished());
    EXPECT_EQ(adapter.max(), (Vector(2) << 3.0, 6.0).finished());

    Vector v = ds[2];
    adapter(v);
    EXPECT_DOUBLE_EQ(v(0), 0.5);
    EXPECT_DOUBLE_EQ(v(1), 0.25);

    EXPECT_THROW(MinMaxAdapter::fit(Dataset()), EmptyDataset);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
