/*
 * Copyright(c) 2020 Jesse Kuang  <jkuang@21cn.com>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *  * Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *  * Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#include <glog/logging.h>
#include "k256/k256.h"
#include "k256/k256.hpp"

using namespace k256;

static bool curve_ready()
{
	const secp256k1&	crv = secp256k1::Instance();
	if ( unlikely(!crv.valid()) ) {
		LOG(ERROR) << "secp256k1 generator recovery failed";
		return false;
	}
	return true;
}

// coordinates must be canonical and on the curve
static int load_point(curve_point& res, const Point *pt)
{
	if (pt == nullptr) return -EINVAL;
	if (pt->inf) {
		res = curve_point();
		return 0;
	}
	bignum<4>	x(pt->x), y(pt->y);
	if (x >= field_elem::prime() || y >= field_elem::prime()) {
		LOG(WARNING) << "coordinate not reduced: " << x << ", " << y;
		return -EINVAL;
	}
	int	ret = curve_point::from_xy(res, field_elem(x), field_elem(y));
	if (ret != 0) LOG(WARNING) << "point not on curve: (" << x << ", "
					<< y << ")";
	return ret;
}

static void store_point(Point *res, const curve_point& pt)
{
	if (pt.is_infinity()) {
		vli_clear<4>(res->x);
		vli_clear<4>(res->y);
		res->inf = 1;
		return;
	}
	vli_set<4>(res->x, pt.x().value().data());
	vli_set<4>(res->y, pt.y().value().data());
	res->inf = 0;
}

static int log_failure(const int ret, const char *what)
{
	if (ret == -K256_ERR_INCONSISTENT) {
		LOG(ERROR) << what << ": " << k256_strerror(ret);
	} else if (ret != 0) {
		LOG(WARNING) << what << ": " << k256_strerror(ret);
	}
	return ret;
}

int k256_get_params(u64 *p, u64 *n, u64 *half_n, u64 *gx, u64 *gy)
{
	if ( !curve_ready() ) return -K256_ERR_INCONSISTENT;
	const secp256k1&	crv = secp256k1::Instance();
	if (p != nullptr) vli_set<4>(p, crv.P().data());
	if (n != nullptr) vli_set<4>(n, crv.N().data());
	if (half_n != nullptr) vli_set<4>(half_n, crv.halfN().data());
	if (gx != nullptr) vli_set<4>(gx, crv.G().x().value().data());
	if (gy != nullptr) vli_set<4>(gy, crv.G().y().value().data());
	return 0;
}

int k256_fe_inverse(u64 *res, const u64 *a)
{
	if (res == nullptr || a == nullptr) return -EINVAL;
	field_elem	inv;
	int	ret = field_elem(a).inverse(inv);
	if (ret != 0) return log_failure(ret, "k256_fe_inverse");
	vli_set<4>(res, inv.value().data());
	return 0;
}

int k256_fe_sqrt(u64 *res, const u64 *a)
{
	if (res == nullptr || a == nullptr) return -EINVAL;
	field_elem	val(a), root;
	if ( !val.sqrt(root) ) {
		VLOG(1) << "no square root for " << val;
		return -K256_ERR_NO_ROOT;
	}
	vli_set<4>(res, root.value().data());
	return 0;
}

int k256_fe_to_bytes(u8 *out, const u64 *a)
{
	if (out == nullptr || a == nullptr) return -EINVAL;
	field_elem(a).to_bytes(out);
	return 0;
}

int k256_point_from_xy(Point *res, const u64 *x, const u64 *y)
{
	if (res == nullptr || x == nullptr || y == nullptr) return -EINVAL;
	Point		pt;
	vli_set<4>(pt.x, x);
	vli_set<4>(pt.y, y);
	pt.inf = 0;
	curve_point	cp;
	int	ret = load_point(cp, &pt);
	if (ret != 0) return ret;
	store_point(res, cp);
	return 0;
}

int k256_point_add(Point *res, const Point *pt1, const Point *pt2)
{
	if (res == nullptr) return -EINVAL;
	curve_point	p1, p2, sum;
	int	ret = load_point(p1, pt1);
	if (ret == 0) ret = load_point(p2, pt2);
	if (ret != 0) return ret;
	ret = p1.add(sum, p2);
	if (ret != 0) return log_failure(ret, "k256_point_add");
	store_point(res, sum);
	return 0;
}

int k256_point_mult(Point *res, const Point *pt, const u64 *k)
{
	if (res == nullptr || k == nullptr) return -EINVAL;
	curve_point	base, prod;
	int	ret = load_point(base, pt);
	if (ret != 0) return ret;
	ret = base.scalar_mult(prod, bignum<4>(k));
	if (ret != 0) return log_failure(ret, "k256_point_mult");
	store_point(res, prod);
	return 0;
}

int k256_point_mult_base(Point *res, const u64 *k)
{
	if (res == nullptr || k == nullptr) return -EINVAL;
	if ( !curve_ready() ) return -K256_ERR_INCONSISTENT;
	curve_point	prod;
	int	ret = secp256k1::Instance().G().scalar_mult(prod, bignum<4>(k));
	if (ret != 0) return log_failure(ret, "k256_point_mult_base");
	store_point(res, prod);
	return 0;
}

int k256_lift_x(Point *res, const u64 *x)
{
	if (res == nullptr || x == nullptr) return -EINVAL;
	field_elem	fx(x);
	curve_point	pt;
	if ( !curve_point::lift_x(pt, fx) ) {
		VLOG(1) << "no point for x " << fx;
		return -K256_ERR_NO_ROOT;
	}
	store_point(res, pt);
	return 0;
}

const char *k256_strerror(int err)
{
	switch (err) {
	case 0:
		return "success";
	case -K256_ERR_NOT_ON_CURVE:
		return "invalid argument or point not on curve";
	case -K256_ERR_DIV_ZERO:
		return "division by zero";
	case -K256_ERR_INCONSISTENT:
		return "internal consistency failure";
	case -K256_ERR_NO_ROOT:
		return "no square root";
	default:
		return "unknown error";
	}
}
