#include <string.h>
#include <string>
#include <glog/logging.h>
#include <gtest/gtest.h>
#include "k256/k256.h"
#include "testData.hpp"

static bool same_point(const Point& pt, const curve_point& cp)
{
	if (cp.is_infinity()) return pt.inf != 0;
	return pt.inf == 0 && bignum<4>(pt.x) == cp.x().value() &&
		bignum<4>(pt.y) == cp.y().value();
}

static Point to_point(const curve_point& cp)
{
	Point	pt;
	memset(&pt, 0, sizeof(pt));
	pt.inf = cp.is_infinity();
	if (!pt.inf) {
		vli_set<4>(pt.x, cp.x().value().data());
		vli_set<4>(pt.y, cp.y().value().data());
	}
	return pt;
}

TEST(testCapi, TestParams)
{
	bn_words_t	p, n, half_n, gx, gy;
	ASSERT_EQ(k256_get_params(p, n, half_n, gx, gy), 0);
	EXPECT_EQ(bignum<4>(p), bignum<4>(secp256k1_p));
	EXPECT_EQ(bignum<4>(n), bignum<4>(secp256k1_n));
	EXPECT_EQ(bignum<4>(half_n), secp256k1::Instance().halfN());
	EXPECT_EQ(bignum<4>(gx), bignum<4>(secp256k1_gx));
	EXPECT_EQ(bignum<4>(gy), bignum<4>(secp256k1_gy));
	EXPECT_EQ(k256_get_params(nullptr, n, nullptr, nullptr, nullptr), 0);
}

TEST(testCapi, TestFieldOps)
{
	bn_words_t	a = { 7, 0, 0, 0 }, res;
	ASSERT_EQ(k256_fe_inverse(res, a), 0);
	EXPECT_EQ(field_elem(res).mul(7), field_elem(1));
	bn_words_t	zero = {};
	EXPECT_EQ(k256_fe_inverse(res, zero), -EDOM);
	EXPECT_EQ(k256_fe_inverse(res, secp256k1_p), -EDOM);
	EXPECT_EQ(k256_fe_inverse(nullptr, a), -EINVAL);

	bn_words_t	sq = { 49, 0, 0, 0 };
	ASSERT_EQ(k256_fe_sqrt(res, sq), 0);
	EXPECT_EQ(field_elem(res).sqr(), field_elem(49));
	bn_words_t	m1;
	vli_set<4>(m1, field_elem(-1).value().data());
	EXPECT_EQ(k256_fe_sqrt(res, m1), -ENOENT);

	u8	out[32];
	ASSERT_EQ(k256_fe_to_bytes(out, secp256k1_p), 0);
	for (int i = 0; i < 32; ++i) EXPECT_EQ(out[i], 0);
	ASSERT_EQ(k256_fe_to_bytes(out, a), 0);
	EXPECT_EQ(out[31], 7);
	EXPECT_EQ(k256_fe_to_bytes(out, nullptr), -EINVAL);
}

TEST(testCapi, TestPointFromXY)
{
	Point	pt;
	ASSERT_EQ(k256_point_from_xy(&pt, secp256k1_gx, secp256k1_gy), 0);
	EXPECT_TRUE(same_point(pt, G()));
	bn_words_t	y;
	vli_set<4>(y, secp256k1_gy);
	y[0] ^= 1;
	EXPECT_EQ(k256_point_from_xy(&pt, secp256k1_gx, y), -EINVAL);
	// x + p is not canonical
	bn_words_t	big = { 0, 0, 0, 0 };
	vli_set<4>(big, secp256k1_p);
	EXPECT_EQ(k256_point_from_xy(&pt, big, secp256k1_gy), -EINVAL);
}

TEST(testCapi, TestPointAdd)
{
	Point	g = to_point(G()), res;
	ASSERT_EQ(k256_point_add(&res, &g, &g), 0);
	EXPECT_TRUE(same_point(res, point_hex(g2x_hex, g2y_hex)));
	ASSERT_EQ(k256_point_add(&res, &res, &g), 0);
	EXPECT_TRUE(same_point(res, point_hex(g3x_hex, g3y_hex)));

	Point	ng = to_point(G().negate());
	ASSERT_EQ(k256_point_add(&res, &g, &ng), 0);
	EXPECT_NE(res.inf, 0);
	ASSERT_EQ(k256_point_add(&res, &res, &g), 0);
	EXPECT_TRUE(same_point(res, G()));

	Point	bad = g;
	bad.y[0] ^= 1;
	EXPECT_EQ(k256_point_add(&res, &g, &bad), -EINVAL);
	EXPECT_EQ(k256_point_add(&res, &bad, &g), -EINVAL);
	EXPECT_EQ(k256_point_add(&res, nullptr, &g), -EINVAL);
	EXPECT_EQ(k256_point_add(nullptr, &g, &g), -EINVAL);
	// same x, y not negated: rejected as off curve before the group law
	Point	half = g;
	vli_clear<4>(half.y);
	half.y[0] = 1;
	EXPECT_EQ(k256_point_add(&res, &g, &half), -EINVAL);
}

TEST(testCapi, TestPointMult)
{
	Point	res, g = to_point(G());
	bn_words_t	k = { 3, 0, 0, 0 };
	ASSERT_EQ(k256_point_mult(&res, &g, k), 0);
	EXPECT_TRUE(same_point(res, point_hex(g3x_hex, g3y_hex)));
	ASSERT_EQ(k256_point_mult_base(&res, k), 0);
	EXPECT_TRUE(same_point(res, point_hex(g3x_hex, g3y_hex)));
	ASSERT_EQ(k256_point_mult_base(&res, secp256k1_n), 0);
	EXPECT_NE(res.inf, 0);
	bn_words_t	zero = {};
	ASSERT_EQ(k256_point_mult(&res, &g, zero), 0);
	EXPECT_NE(res.inf, 0);
	EXPECT_EQ(k256_point_mult(&res, &g, nullptr), -EINVAL);
}

TEST(testCapi, TestLiftX)
{
	Point	res;
	ASSERT_EQ(k256_lift_x(&res, secp256k1_gx), 0);
	EXPECT_TRUE(same_point(res, G()));
	// x^3 + 7 is a non-residue for some small x
	int		absent = 0;
	for (u64 i = 1; i < 64; ++i) {
		bn_words_t	x = { i, 0, 0, 0 };
		int	ret = k256_lift_x(&res, x);
		if (ret == -ENOENT) {
			++absent;
			continue;
		}
		ASSERT_EQ(ret, 0);
		EXPECT_EQ(res.x[0], i);
		EXPECT_EQ(res.y[0] & 1, 0);
	}
	EXPECT_GT(absent, 0);
}

TEST(testCapi, TestStrerror)
{
	EXPECT_STREQ(k256_strerror(0), "success");
	EXPECT_STREQ(k256_strerror(-EDOM), "division by zero");
	EXPECT_STREQ(k256_strerror(-EFAULT), "internal consistency failure");
	EXPECT_STREQ(k256_strerror(-ENOENT), "no square root");
	EXPECT_STREQ(k256_strerror(-EINVAL),
			"invalid argument or point not on curve");
	EXPECT_STREQ(k256_strerror(12345), "unknown error");
}

int main(int argc, char *argv[])
{
	google::InitGoogleLogging(argv[0]);
	testing::InitGoogleTest(&argc, argv);
	print_compiler();
	return RUN_ALL_TESTS();
}
