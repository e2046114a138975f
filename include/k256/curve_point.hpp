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
#pragma once
#ifndef __K256_CURVE_POINT_HPP__
#define __K256_CURVE_POINT_HPP__

#include <string>
#include <iostream>
#include <type_traits>
#include "cdefs.h"
#include "bignum.hpp"
#include "curve_const.hpp"
#include "field_elem.hpp"

namespace k256 {

/**
 * class curve_point - affine point of secp256k1, y^2 = x^3 + 7 over GF(p)
 *
 * The default constructed point is the identity (point at infinity).
 * Finite points are only built by from_xy()/lift_x(), which check the
 * curve equation, or by the group law itself.
 *
 * Execution time depends on the operands, NOT constant time.
 */
class curve_point {
public:
	using felem_t = bignum<4>;

	// group order n
	static const felem_t& order() noexcept
	{
		static const felem_t	n_(secp256k1_n);
		return n_;
	}

	curve_point() = default;
	curve_point(const curve_point &) = default;
	curve_point& operator=(const curve_point &) = default;

	static bool is_on_curve(const field_elem& x, const field_elem& y) noexcept
	{
		return y.sqr() == x.sqr().mul(x).add(secp256k1_b);
	}
/**
 * from_xy() - build a finite point from affine coordinates
 *
 * @res:	the point, untouched on failure
 * @x:		x coordinate
 * @y:		y coordinate
 *
 * Return: 0, or -K256_ERR_NOT_ON_CURVE if y^2 != x^3 + 7.
 */
	static int from_xy(curve_point& res, const field_elem& x,
				const field_elem& y) noexcept
	{
		if ( unlikely(!is_on_curve(x, y)) ) return -K256_ERR_NOT_ON_CURVE;
		res = curve_point(x, y);
		return 0;
	}
/**
 * lift_x() - recover the point with even y for x
 *
 * @res:	the point, untouched if x^3 + 7 is a non-residue
 * @x:		x coordinate
 *
 * Return: false if no point has this x.
 */
	static bool lift_x(curve_point& res, const field_elem& x) noexcept
	{
		field_elem	y;
		if ( !x.sqr().mul(x).add(secp256k1_b).sqrt(y) ) return false;
		if (!y.is_even()) y = y.negate();
		return from_xy(res, x, y) == 0;
	}

	const field_elem& x() const noexcept { return _x; }
	const field_elem& y() const noexcept { return _y; }
	bool is_infinity() const noexcept { return _inf; }

	bool operator==(const curve_point& q) const noexcept
	{
		if (_inf || q._inf) return _inf == q._inf;
		return _x == q._x && _y == q._y;
	}
	bool operator!=(const curve_point& q) const noexcept
	{
		return !(*this == q);
	}
	bool equals(const curve_point& q) const noexcept { return *this == q; }

/**
 * add() - affine group law, res = this + q
 *
 * @res:	the sum, may alias this or q
 * @q:		the other summand
 *
 * Return: 0, or -K256_ERR_INCONSISTENT if two points share x but are not
 *	mutual negations.
 */
	int add(curve_point& res, const curve_point& q) const noexcept
	{
		if (_inf) {
			res = q;
			return 0;
		}
		if (q._inf) {
			res = *this;
			return 0;
		}
		field_elem	lambda;
		int		ret;
		if (_x == q._x) {
			if (_y != q._y) {
				if ( unlikely(!_y.add(q._y).is_zero()) )
					return -K256_ERR_INCONSISTENT;
				res = curve_point();
				return 0;
			}
			// vertical tangent
			if ( unlikely(_y.is_zero()) ) {
				res = curve_point();
				return 0;
			}
			// lambda = 3x^2 / 2y
			ret = _x.sqr().mul(3).div(lambda, _y.mul(2));
		} else {
			ret = _y.sub(q._y).div(lambda, _x.sub(q._x));
		}
		if ( unlikely(ret != 0) ) return ret;
		field_elem	x3 = lambda.sqr().sub(_x).sub(q._x);
		field_elem	y3 = lambda.mul(_x.sub(x3)).sub(_y);
		res = curve_point(x3, y3);
		return 0;
	}
	int dbl(curve_point& res) const noexcept { return add(res, *this); }
	curve_point negate() const noexcept
	{
		if (_inf) return curve_point();
		return curve_point(_x, _y.negate());
	}

/**
 * scalar_mult() - res = k * this, double and add from bit 255 down
 *
 * @res:	the product, may alias this
 * @k:		scalar, reduced modulo n first
 *
 * Return: 0 or the error of add(). k = 0 gives the identity.
 */
	int scalar_mult(curve_point& res, const felem_t& k) const noexcept
	{
		felem_t		e(k);
		// 2^256 < 2n
		if (e >= order()) e.sub_from(order());
		curve_point	acc;
		for (int i = 255; i >= 0; --i) {
			int	ret = acc.dbl(acc);
			if ( unlikely(ret != 0) ) return ret;
			if (!e.test_bit(i)) continue;
			ret = acc.add(acc, *this);
			if ( unlikely(ret != 0) ) return ret;
		}
		res = acc;
		return 0;
	}
	// negative k is taken as n - (|k| mod n)
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	int scalar_mult(curve_point& res, const T k) const noexcept
	{
		if (std::is_signed<T>::value && k < T(0)) {
			// |k| < 2^64 < n
			felem_t	e(order());
			e.sub_from(felem_t((u64)0 - (u64)k));
			return scalar_mult(res, e);
		}
		return scalar_mult(res, felem_t((u64)k));
	}
	template<const uint M>
	int scalar_mult(curve_point& res, const bignum<M>& k) const noexcept
	{
		static_assert(M > 4, "wide scalar only");
		bignum<M>	r;
		r.mod(k, bignum<M>(order()));
		return scalar_mult(res, felem_t(r));
	}
	// big endian scalar of at most 64 bytes
	int scalar_mult(curve_point& res, const u8 *src, const size_t len)
	const noexcept
	{
		bignum<8>	k;
		if ( unlikely(!k.from_be_bytes(src, len)) ) return -EINVAL;
		return scalar_mult(res, k);
	}

	friend std::ostream& operator<<(std::ostream& os, const curve_point& p)
	{
		if (p._inf) return os << "inf";
		return os << "(" << p._x << ", " << p._y << ")";
	}
protected:
	// no curve check, for results of the group law
	curve_point(const field_elem& x, const field_elem& y) noexcept :
		_x(x), _y(y), _inf(false) {}
private:
	field_elem	_x;
	field_elem	_y;
	bool		_inf = true;
};


/**
 * class secp256k1 - curve constants, computed once per process
 *
 * G is recovered with lift_x from its x coordinate and checked against
 * the published y coordinate. valid() is false if the check failed, G()
 * is then the identity and every multiple of it too. Callers outside
 * the C ABI check valid() once before relying on G().
 */
class secp256k1 {
public:
	using felem_t = bignum<4>;
	static const secp256k1& Instance()
	{
		static const secp256k1	ins_;
		return ins_;
	}
	secp256k1(const secp256k1 &) = delete;
	secp256k1& operator=(const secp256k1 &) = delete;

	const felem_t& P() const noexcept { return _p; }
	const felem_t& N() const noexcept { return _n; }
	const felem_t& halfN() const noexcept { return _half_n; }
	// (p + 1) / 4
	const felem_t& quadP() const noexcept { return _quad_p; }
	const curve_point& G() const noexcept { return _g; }
	bool valid() const noexcept { return _valid; }
private:
	secp256k1() noexcept : _p(field_elem::prime()), _n(curve_point::order()),
		_half_n(curve_point::order()), _quad_p(field_elem::quad_p())
	{
		_half_n.rshift1();
		curve_point	g;
		if ( !curve_point::lift_x(g, field_elem(secp256k1_gx)) ) return;
		if (g.y() != field_elem(secp256k1_gy)) return;
		_g = g;
		_valid = true;
	}
	felem_t		_p;
	felem_t		_n;
	felem_t		_half_n;
	felem_t		_quad_p;
	curve_point	_g;
	bool		_valid = false;
};

// identity unless secp256k1::Instance().valid()
inline const curve_point& G() noexcept { return secp256k1::Instance().G(); }
inline const bignum<4>& order() noexcept { return secp256k1::Instance().N(); }

}	// namespace k256

#endif	//	__K256_CURVE_POINT_HPP__
