#include <string.h>
#include <string>
#include <sstream>
#include <gtest/gtest.h>
#include "testData.hpp"

// bypasses the curve check, only for provoking inconsistent states
class raw_point : public curve_point {
public:
	raw_point(const field_elem& x, const field_elem& y) : curve_point(x, y) {}
};

static const curve_point	inf;

TEST(testCurve, TestParams)
{
	const secp256k1&	crv = secp256k1::Instance();
	ASSERT_TRUE(crv.valid());
	EXPECT_EQ(&crv, &secp256k1::Instance());
	EXPECT_EQ(crv.P(), bignum<4>(secp256k1_p));
	EXPECT_EQ(crv.N(), bignum<4>(secp256k1_n));
	EXPECT_EQ(order(), crv.N());
	bignum<4>	n(crv.halfN());
	n.lshift1();
	n.uadd_to(1);
	EXPECT_EQ(n, crv.N());
	EXPECT_EQ(crv.quadP(), bignum<4>(secp256k1_quad_p));
	EXPECT_EQ(crv.G().x(), field_elem(secp256k1_gx));
	EXPECT_EQ(crv.G().y(), field_elem(secp256k1_gy));
	EXPECT_EQ(G(), crv.G());
	// a valid instance never hands out the identity as generator
	EXPECT_FALSE(G().is_infinity());
	curve_point	res;
	ASSERT_EQ(G().scalar_mult(res, 2), 0);
	EXPECT_FALSE(res.is_infinity());
}

TEST(testCurve, TestFromXY)
{
	curve_point	pt;
	ASSERT_EQ(curve_point::from_xy(pt, field_elem(secp256k1_gx),
				field_elem(secp256k1_gy)), 0);
	EXPECT_EQ(pt, G());
	EXPECT_FALSE(pt.is_infinity());
	EXPECT_TRUE(curve_point::is_on_curve(pt.x(), pt.y()));

	curve_point	keep = G();
	EXPECT_EQ(curve_point::from_xy(keep, field_elem(secp256k1_gx),
				field_elem(secp256k1_gy).add(1)), -K256_ERR_NOT_ON_CURVE);
	EXPECT_EQ(keep, G());
	EXPECT_EQ(curve_point::from_xy(keep, field_elem(1), field_elem(1)),
				-K256_ERR_NOT_ON_CURVE);
	EXPECT_EQ(curve_point::from_xy(keep, field_elem(), field_elem()),
				-K256_ERR_NOT_ON_CURVE);
	EXPECT_TRUE(inf.is_infinity());
}

TEST(testCurve, TestIdentity)
{
	curve_point	res;
	ASSERT_EQ(G().add(res, inf), 0);
	EXPECT_EQ(res, G());
	ASSERT_EQ(inf.add(res, G()), 0);
	EXPECT_EQ(res, G());
	ASSERT_EQ(inf.add(res, inf), 0);
	EXPECT_TRUE(res.is_infinity());
	ASSERT_EQ(inf.dbl(res), 0);
	EXPECT_TRUE(res.is_infinity());
	EXPECT_EQ(inf.negate(), inf);
	EXPECT_NE(inf, G());
	EXPECT_NE(G(), inf);
}

TEST(testCurve, TestNegate)
{
	curve_point	ng = G().negate(), res;
	EXPECT_EQ(ng.x(), G().x());
	EXPECT_EQ(ng.y(), G().y().negate());
	EXPECT_TRUE(curve_point::is_on_curve(ng.x(), ng.y()));
	ASSERT_EQ(G().add(res, ng), 0);
	EXPECT_TRUE(res.is_infinity());
	EXPECT_EQ(ng.negate(), G());
}

TEST(testCurve, TestDouble)
{
	curve_point	g2 = point_hex(g2x_hex, g2y_hex);
	curve_point	g3 = point_hex(g3x_hex, g3y_hex);
	ASSERT_FALSE(g2.is_infinity());
	ASSERT_FALSE(g3.is_infinity());
	curve_point	res, res2;
	ASSERT_EQ(G().add(res, G()), 0);
	EXPECT_EQ(res, g2);
	ASSERT_EQ(G().dbl(res2), 0);
	EXPECT_EQ(res2, g2);
	ASSERT_EQ(G().scalar_mult(res2, 2), 0);
	EXPECT_EQ(res2, res);
	ASSERT_EQ(res.add(res, G()), 0);
	EXPECT_EQ(res, g3);
	ASSERT_EQ(G().scalar_mult(res, 3), 0);
	EXPECT_EQ(res, g3);
	ASSERT_EQ(g2.add(res, g3), 0);
	ASSERT_EQ(G().scalar_mult(res2, 5), 0);
	EXPECT_EQ(res, res2);
}

TEST(testCurve, TestScalarMult)
{
	curve_point	res;
	ASSERT_EQ(G().scalar_mult(res, 1), 0);
	EXPECT_EQ(res, G());
	ASSERT_EQ(G().scalar_mult(res, 0), 0);
	EXPECT_TRUE(res.is_infinity());
	ASSERT_EQ(G().scalar_mult(res, order()), 0);
	EXPECT_TRUE(res.is_infinity());
	EXPECT_TRUE(res.equals(inf));
	ASSERT_EQ(inf.scalar_mult(res, 12345), 0);
	EXPECT_TRUE(res.is_infinity());

	// (n - 1) G = -G
	bignum<4>	k(order());
	k.sub_from(bignum<4>(1));
	ASSERT_EQ(G().scalar_mult(res, k), 0);
	EXPECT_EQ(res, G().negate());

	// n + 1 reduces to 1
	k = order();
	k.uadd_to(1);
	ASSERT_EQ(G().scalar_mult(res, k), 0);
	EXPECT_EQ(res, G());

	// in place
	res = G();
	ASSERT_EQ(res.scalar_mult(res, 3), 0);
	EXPECT_EQ(res, point_hex(g3x_hex, g3y_hex));
}

TEST(testCurve, TestSignedScalar)
{
	curve_point	res, expect;
	ASSERT_EQ(G().scalar_mult(res, -1), 0);
	EXPECT_EQ(res, G().negate());
	ASSERT_EQ(G().scalar_mult(res, (s64)-2), 0);
	EXPECT_EQ(res, point_hex(g2x_hex, g2y_hex).negate());
	ASSERT_EQ(G().scalar_mult(res, (u64)-1), 0);
	ASSERT_EQ(G().scalar_mult(expect, bignum<4>((u64)-1)), 0);
	EXPECT_EQ(res, expect);
	curve_point	pos;
	ASSERT_EQ(G().scalar_mult(pos, 7), 0);
	ASSERT_EQ(G().scalar_mult(res, -7), 0);
	ASSERT_EQ(res.add(res, pos), 0);
	EXPECT_TRUE(res.is_infinity());
}

TEST(testCurve, TestWideScalar)
{
	curve_point	res;
	// n + 5 in 512 bits
	bignum<8>	k(order());
	k.uadd_to(5);
	k.set_bit(300);
	bignum<8>	k2;
	k2.set_bit(300);
	curve_point	expect, tmp;
	ASSERT_EQ(G().scalar_mult(expect, k2), 0);
	ASSERT_EQ(G().scalar_mult(tmp, 5), 0);
	ASSERT_EQ(expect.add(expect, tmp), 0);
	ASSERT_EQ(G().scalar_mult(res, k), 0);
	EXPECT_EQ(res, expect);

	u8	two[1] = { 2 };
	ASSERT_EQ(G().scalar_mult(res, two, sizeof(two)), 0);
	EXPECT_EQ(res, point_hex(g2x_hex, g2y_hex));
	u8	nb[64] = {};
	order().to_be_bytes(nb + 32);
	ASSERT_EQ(G().scalar_mult(res, nb, sizeof(nb)), 0);
	EXPECT_TRUE(res.is_infinity());
	u8	big[65] = {};
	EXPECT_EQ(G().scalar_mult(res, big, sizeof(big)), -EINVAL);
}

TEST(testCurve, TestLinearity)
{
	auto&	rd = bn_random<4>::Instance();
	for (int i = 0; i < 4; ++i) {
		bignum<4>	a = rd.get_random(), b = rd.get_random();
		if (a >= order()) a.sub_from(order());
		if (b >= order()) b.sub_from(order());
		bignum<4>	ab;
		if (ab.add(a, b) || ab >= order()) ab.sub_from(order());
		curve_point	pa, pb, pab, sum;
		ASSERT_EQ(G().scalar_mult(pa, a), 0);
		ASSERT_EQ(G().scalar_mult(pb, b), 0);
		ASSERT_EQ(G().scalar_mult(pab, ab), 0);
		ASSERT_EQ(pa.add(sum, pb), 0);
		EXPECT_EQ(sum, pab);
		EXPECT_TRUE(curve_point::is_on_curve(sum.x(), sum.y()));
	}
}

TEST(testCurve, TestLiftX)
{
	curve_point	pt;
	ASSERT_TRUE(curve_point::lift_x(pt, field_elem(secp256k1_gx)));
	EXPECT_EQ(pt, G());
	EXPECT_TRUE(pt.y().is_even());

	// -G has the odd root
	curve_point	ng = G().negate();
	EXPECT_FALSE(ng.y().is_even());
	ASSERT_TRUE(curve_point::lift_x(pt, ng.x()));
	EXPECT_EQ(pt, G());

	curve_point	g3 = point_hex(g3x_hex, g3y_hex);
	ASSERT_TRUE(curve_point::lift_x(pt, g3.x()));
	EXPECT_EQ(pt, g3);
	ASSERT_TRUE(curve_point::lift_x(pt, felem_hex(g2x_hex)));
	EXPECT_EQ(pt, point_hex(g2x_hex, g2y_hex));
	EXPECT_FALSE(g3.negate().y().is_even());
}

TEST(testCurve, TestLiftXAbsent)
{
	// (p - 1) / 2, Euler's criterion
	bignum<4>	half(secp256k1_p);
	half.rshift1();
	const field_elem	m1(-1);
	int		found = 0;
	for (int i = 1; i < 64; ++i) {
		field_elem	x(i);
		field_elem	rhs = x.sqr().mul(x).add(7);
		curve_point	pt = G();
		bool	ok = curve_point::lift_x(pt, x);
		EXPECT_EQ(ok, rhs.pow(half) != m1);
		if (ok) {
			EXPECT_EQ(pt.x(), x);
			EXPECT_TRUE(pt.y().is_even());
			continue;
		}
		EXPECT_EQ(pt, G());
		++found;
	}
	EXPECT_GT(found, 0);
}

TEST(testCurve, TestInconsistent)
{
	raw_point	bad(G().x(), field_elem(1));
	curve_point	res = G();
	EXPECT_EQ(G().add(res, bad), -K256_ERR_INCONSISTENT);
	EXPECT_EQ(res, G());
	EXPECT_EQ(bad.add(res, G()), -K256_ERR_INCONSISTENT);
	// vertical tangent
	raw_point	flat(field_elem(5), field_elem());
	ASSERT_EQ(flat.dbl(res), 0);
	EXPECT_TRUE(res.is_infinity());
}

TEST(testCurve, TestPrint)
{
	std::stringstream	ss;
	ss << inf;
	EXPECT_EQ(ss.str(), "inf");
	ss.str("");
	ss << G();
	EXPECT_EQ(ss.str(), "(" + G().x().hex() + ", " + G().y().hex() + ")");
	EXPECT_EQ(G().x().hex(),
	"79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
}

int main(int argc, char *argv[])
{
	testing::InitGoogleTest(&argc, argv);
	print_compiler();
	return RUN_ALL_TESTS();
}
