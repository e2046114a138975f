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
#ifndef __K256_BIGNUM_HPP__
#define __K256_BIGNUM_HPP__

#include <stddef.h>
#include <string>
#include <iostream>
#include "cdefs.h"
#include "vli.hpp"

namespace k256 {

template<const uint N>
class bignum {
public:
	bignum() noexcept : d{} {}
	bignum(const bignum &) = default;
	bignum& operator=(const bignum &) = default;
	explicit bignum(const u64 v) noexcept : d{}
	{
		d[0] = v;
	}
	explicit bignum(const u64 *src) noexcept
	{
		vli_set<N>(d, src);
	}
	// narrow or widen, dropping or zero filling the high digits
	template<const uint M>
	explicit bignum(const bignum<M>& src) noexcept : d{}
	{
		for (uint i = 0; i < N && i < M; ++i) d[i] = src.data()[i];
	}
	void clear() noexcept { vli_clear<N>(d); }
	const u64* data() const noexcept { return d; }
	u64* raw_data() noexcept { return d; }
	static constexpr uint ndigits() noexcept { return N; }

	bool is_zero() const noexcept { return vli_is_zero<N>(d); }
	bool is_one() const noexcept
	{
		u64	v = d[0] ^ 1;
		for (uint i = 1; i < N; i++) v |= d[i];
		return v == 0;
	}
	bool is_even() const noexcept { return (d[0] & 1) == 0; }
	bool test_bit(const uint bit) const noexcept
	{
		return vli_test_bit<N>(d, bit);
	}
	void set_bit(const uint bit) noexcept
	{
		if (bit < N*64) d[bit >> 6] |= (1ull << (bit & 0x3f));
	}
	uint num_bits() const noexcept { return vli_num_bits<N>(d); }

	int cmp(const bignum& right) const noexcept
	{
		return vli_cmp<N>(d, right.d);
	}
	bool operator==(const bignum& bn) const noexcept { return cmp(bn) == 0; }
	bool operator!=(const bignum& bn) const noexcept { return cmp(bn) != 0; }
	bool operator<(const bignum& bn) const noexcept { return cmp(bn) < 0; }
	bool operator>=(const bignum& bn) const noexcept { return cmp(bn) >= 0; }

/* Computes this = left + right, returning carry. Can modify in place. */
	bool add(const bignum& left, const bignum& right) noexcept
	{
		return vli_add<N>(d, left.d, right.d);
	}
	bool add_to(const bignum& right) noexcept
	{
		return vli_add_to<N>(d, right.d);
	}
	bool uadd_to(const u64 right) noexcept
	{
		return vli_uadd_to<N>(d, right);
	}
/* Computes this = left - right, returning borrow. Can modify in place. */
	bool sub(const bignum& left, const bignum& right) noexcept
	{
		return vli_sub<N>(d, left.d, right.d);
	}
	bool sub_from(const bignum& right) noexcept
	{
		return vli_sub_from<N>(d, right.d);
	}
	u64 lshift1() noexcept
	{
		return vli_lshift1<N>(d, d);
	}
/* this <<= cnt, cnt < 64, returning the bits shifted out */
	u64 lshift(const uint cnt) noexcept
	{
		if ( unlikely(cnt == 0) ) return 0;
		u64 carry = 0;
		for (uint i = 0; i < N; i++) {
			u64 temp = d[i];
			d[i] = (temp << cnt) | carry;
			carry = temp >> (64 - cnt);
		}
		return carry;
	}
	void rshift1(const bool carry=false) noexcept
	{
		vli_rshift1<N>(d, carry);
	}
	// this = left % mod, false if mod is zero
	bool mod(const bignum& left, const bignum& m) noexcept
	{
		return vli_divmod<N>(nullptr, d, left.d, m.d);
	}

/**
 * from_be_bytes() - Load from a big-endian byte string
 *
 * @src:		source bytes
 * @len:		length of @src, at most 8*N
 *
 * Return: false if @len is too large for N digits.
 */
	bool from_be_bytes(const u8 *src, const size_t len) noexcept
	{
		if ( unlikely(len > N*8) ) return false;
		clear();
		for (size_t i = 0; i < len; ++i) {
			size_t	pos = len - 1 - i;	// byte index from lsb
			d[pos >> 3] |= (u64)src[i] << ((pos & 7) * 8);
		}
		return true;
	}
	/* fixed width, 8*N bytes big endian */
	void to_be_bytes(u8 *dest) const noexcept
	{
		for (uint i = 0; i < N*8; ++i) {
			uint	pos = N*8 - 1 - i;
			dest[i] = (u8)(d[pos >> 3] >> ((pos & 7) * 8));
		}
	}
	// at most 16*N hex digits, optional 0x prefix
	bool from_hex(const std::string& hex) noexcept
	{
		size_t	off = 0;
		if (hex.size() > 1 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
			off = 2;
		if (hex.size() == off || hex.size() - off > N*16) return false;
		clear();
		for (size_t i = off; i < hex.size(); ++i) {
			int		nib = hex_digit(hex[i]);
			if (nib < 0) return false;
			lshift(4);
			d[0] |= (u64)nib;
		}
		return true;
	}
	/* fixed width, 16*N lowercase digits */
	std::string hex() const
	{
		static const char digits[] = "0123456789abcdef";
		std::string	res(N*16, '0');
		for (uint i = 0; i < N*16; ++i) {
			uint	pos = N*16 - 1 - i;	// nibble index from lsb
			res[i] = digits[(d[pos >> 4] >> ((pos & 0xf) * 4)) & 0xf];
		}
		return res;
	}
	friend std::ostream& operator<<(std::ostream& os, const bignum& x)
	{
		return os << x.hex();
	}
protected:
	static int hex_digit(const char c) noexcept
	{
		if (c >= '0' && c <= '9') return c - '0';
		if (c >= 'a' && c <= 'f') return c - 'a' + 10;
		if (c >= 'A' && c <= 'F') return c - 'A' + 10;
		return -1;
	}
	u64		d[N];
};


template<const uint N>
class bn_prod: public bignum<N*2> {
public:
	bn_prod() = default;
	bn_prod(const bn_prod &) = default;
	bignum<N> m_low() const noexcept
	{
		return bignum<N>(this->d);
	}
	bignum<N> m_high() const noexcept
	{
		return bignum<N>(this->d + N);
	}
	// this = left * right
	void mult(const bignum<N>& left, const bignum<N>& right) noexcept
	{
		vli_mult<N>(this->d, left.data(), right.data());
	}
};


/*
 * signed magnitude integer, |value| < 2^(64*N)
 * used for the Bezout coefficients of the extended Euclidean algorithm
 */
template<const uint N>
class bignumz {
public:
	bignumz() = default;
	bignumz(const bignumz &) = default;
	bignumz& operator=(const bignumz &) = default;
	explicit bignumz(const s64 v) noexcept :
		_mag(v < 0 ? (u64)0 - (u64)v : (u64)v), _neg(v < 0) {}
	bignumz(const bignum<N>& mag, const bool neg) noexcept :
		_mag(mag), _neg(neg && !mag.is_zero()) {}
	bool is_negative() const noexcept { return _neg; }
	bool is_zero() const noexcept { return _mag.is_zero(); }
	const bignum<N>& abs() const noexcept { return _mag; }
	bool operator==(const bignumz& bn) const noexcept
	{
		return _neg == bn._neg && _mag == bn._mag;
	}
/*
 * this = left - q * right
 * Return: false if the magnitude overflows N digits.
 */
	bool sub_mul(const bignumz& left, const bignum<N>& q, const bignumz& right)
	noexcept
	{
		bn_prod<N>	pd;
		pd.mult(q, right._mag);
		if ( unlikely(!pd.m_high().is_zero()) ) return false;
		bignum<N>	t = pd.m_low();
		bool		tneg = !right._neg;		// sign of -(q * right)
		bignum<N>	res;
		bool		rneg;
		if (left._neg == tneg) {
			if ( unlikely(res.add(left._mag, t)) ) return false;
			rneg = left._neg;
		} else if (left._mag >= t) {
			res.sub(left._mag, t);
			rneg = left._neg;
		} else {
			res.sub(t, left._mag);
			rneg = tneg;
		}
		_mag = res;
		_neg = rneg && !res.is_zero();
		return true;
	}
	// canonical residue in [0, m), |this| <= m required
	bignum<N> to_mod(const bignum<N>& m) const noexcept
	{
		bignum<N>	res(_mag);
		if (res >= m) res.sub_from(m);
		if (_neg && !res.is_zero()) res.sub(m, res);
		return res;
	}
	friend std::ostream& operator<<(std::ostream& os, const bignumz& x)
	{
		return os << (x._neg ? "-" : "") << x._mag;
	}
private:
	bignum<N>	_mag;
	bool		_neg = false;
};

}	// namespace k256

#endif	//	__K256_BIGNUM_HPP__
