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
#ifndef __K256_FIELD_ELEM_HPP__
#define __K256_FIELD_ELEM_HPP__

#include <string>
#include <iostream>
#include <type_traits>
#include "cdefs.h"
#include "vli.hpp"
#include "bignum.hpp"
#include "curve_const.hpp"

namespace k256 {

/**
 * class field_elem - element of GF(p), p = 2^256 - 2^32 - 977
 *
 * Immutable value, always holding the canonical residue in [0, p).
 * Every operation returns a new element. Integer operands are converted
 * explicitly through the field_elem constructor.
 *
 * Execution time depends on the operands, do NOT use with secret data
 * where timing attacks matter.
 */
class field_elem {
public:
	using felem_t = bignum<4>;

	static const felem_t& prime() noexcept
	{
		static const felem_t	p_(secp256k1_p);
		return p_;
	}
	// (p + 1) / 4, p = 3 mod 4
	static const felem_t& quad_p() noexcept
	{
		static const felem_t	q_ = calc_quad_p();
		return q_;
	}

	field_elem() = default;
	field_elem(const field_elem &) = default;
	field_elem& operator=(const field_elem &) = default;
	// negative values map to p - (|v| mod p)
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	explicit field_elem(const T v) noexcept
	{
		if (std::is_signed<T>::value && v < T(0)) {
			// |v| < 2^64 < p, no further reduction
			_v = prime();
			_v.sub_from(felem_t((u64)0 - (u64)v));
		} else {
			_v = felem_t((u64)v);
		}
	}
	template<const uint M>
	explicit field_elem(const bignum<M>& v) noexcept : _v(reduce(v)) {}
	explicit field_elem(const u64 *words) noexcept : _v(reduce(felem_t(words)))
	{
	}

	// big endian, at most 64 bytes, reduced modulo p
	static bool from_bytes(field_elem& res, const u8 *src, const size_t len)
	noexcept
	{
		bignum<8>	bn;
		if ( unlikely(!bn.from_be_bytes(src, len)) ) return false;
		res._v = reduce(bn);
		return true;
	}
	// at most 128 hex digits, reduced modulo p
	static bool from_hex(field_elem& res, const std::string& hex) noexcept
	{
		bignum<8>	bn;
		if ( unlikely(!bn.from_hex(hex)) ) return false;
		res._v = reduce(bn);
		return true;
	}

	const felem_t& value() const noexcept { return _v; }
	bool is_zero() const noexcept { return _v.is_zero(); }
	bool is_even() const noexcept { return _v.is_even(); }
	bool operator==(const field_elem& n) const noexcept { return _v == n._v; }
	bool operator!=(const field_elem& n) const noexcept { return _v != n._v; }
	bool equals(const field_elem& n) const noexcept { return _v == n._v; }
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	bool equals(const T n) const noexcept { return equals(field_elem(n)); }

	field_elem add(const field_elem& n) const noexcept
	{
		field_elem	res;
		if (res._v.add(_v, n._v) || res._v >= prime())
			res._v.sub_from(prime());
		return res;
	}
	field_elem sub(const field_elem& n) const noexcept
	{
		field_elem	res;
		if (res._v.sub(_v, n._v)) res._v.add_to(prime());
		return res;
	}
	field_elem mul(const field_elem& n) const noexcept
	{
		bn_prod<4>	pd;
		pd.mult(_v, n._v);
		field_elem	res;
		vli_mmod_special<4>(res._v.raw_data(), pd.data(), secp256k1_p);
		return res;
	}
	field_elem sqr() const noexcept { return mul(*this); }
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	field_elem add(const T n) const noexcept { return add(field_elem(n)); }
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	field_elem sub(const T n) const noexcept { return sub(field_elem(n)); }
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	field_elem mul(const T n) const noexcept { return mul(field_elem(n)); }

	field_elem negate() const noexcept
	{
		field_elem	res;
		if ( likely(!_v.is_zero()) ) res._v.sub(prime(), _v);
		return res;
	}

	// right to left binary method, one squaring per exponent bit
	field_elem pow(const felem_t& e) const noexcept
	{
		field_elem	res(1), base(*this);
		const uint	nbits = e.num_bits();
		for (uint i = 0; i < nbits; ++i) {
			if (e.test_bit(i)) res = res.mul(base);
			base = base.sqr();
		}
		return res;
	}
	field_elem pow(const field_elem& e) const noexcept { return pow(e._v); }
	field_elem pow(const u64 e) const noexcept { return pow(felem_t(e)); }

/**
 * inverse() - modular inverse, extended Euclidean algorithm over (this, p)
 *
 * @res:	1/this mod p
 *
 * Return: 0, or -K256_ERR_DIV_ZERO for the zero element.
 */
	int inverse(field_elem& res) const noexcept
	{
		if ( unlikely(_v.is_zero()) ) return -K256_ERR_DIV_ZERO;
		const felem_t	one(1);
		felem_t		a(_v), m(prime());
		bignumz<4>	x0(0), x1(1);
		while (a.cmp(one) > 0) {
			felem_t	q, r;
			if ( unlikely(!vli_divmod<4>(q.raw_data(), r.raw_data(),
							a.data(), m.data())) )
				return -K256_ERR_INCONSISTENT;
			a = m;
			m = r;
			// x0, x1 = x1 - q * x0, x0
			bignumz<4>	t(x0);
			if ( unlikely(!x0.sub_mul(x1, q, x0)) )
				return -K256_ERR_INCONSISTENT;
			x1 = t;
		}
		res._v = x1.to_mod(prime());
		return 0;
	}
	// res = this / n
	int div(field_elem& res, const field_elem& n) const noexcept
	{
		field_elem	inv;
		int		ret = n.inverse(inv);
		if ( unlikely(ret != 0) ) return ret;
		res = mul(inv);
		return 0;
	}
	template<typename T,
		typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
	int div(field_elem& res, const T n) const noexcept
	{
		return div(res, field_elem(n));
	}

/**
 * sqrt() - square root, p = 3 mod 4 so a root is this^((p+1)/4)
 *
 * @res:	one of the two roots, untouched if none
 *
 * Return: false if this is a quadratic non-residue.
 */
	bool sqrt(field_elem& res) const noexcept
	{
		field_elem	s = pow(quad_p());
		if (s.sqr() != *this) return false;
		res = s;
		return true;
	}

	// 32 bytes big endian
	void to_bytes(u8 *dest) const noexcept { _v.to_be_bytes(dest); }
	// 64 lowercase hex digits
	std::string hex() const { return _v.hex(); }
	friend std::ostream& operator<<(std::ostream& os, const field_elem& x)
	{
		return os << x._v;
	}
private:
	static felem_t calc_quad_p() noexcept
	{
		felem_t	q(secp256k1_p);
		q.rshift1();
		q.rshift1();
		q.uadd_to(1);
		return q;
	}
	static felem_t reduce(const felem_t& v) noexcept
	{
		felem_t	r(v);
		// 2^256 < 2p
		if (r >= prime()) r.sub_from(prime());
		return r;
	}
	template<const uint M>
	static felem_t reduce(const bignum<M>& v) noexcept
	{
		static_assert(M >= 4, "at least 256 bits");
		bignum<M>	r;
		r.mod(v, bignum<M>(prime()));
		return felem_t(r);
	}
	felem_t		_v;
};

}	// namespace k256

#endif	//	__K256_FIELD_ELEM_HPP__
