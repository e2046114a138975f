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
#ifndef __K256_VLI_HPP__
#define __K256_VLI_HPP__

#include <stdint.h>
#include <stdbool.h>
#include <type_traits>
#include "cdefs.h"

#if	__cplusplus < 201103L
# error "C++ std MUST at least c++11"
#endif

/*
 * Very long integers: little endian arrays of N 64-bit digits.
 * None of the routines below run in constant time.
 */
namespace k256 {

class alignas(16) uint128_t {
public:
	uint128_t(const __uint128_t vd=0) : _data(vd) { };
	uint128_t(const u64 vl, const u64 vh) :
		_data( (((__uint128_t)vh) << 64) | vl)
	{
	}
	uint128_t(const uint128_t &) = default;
	uint128_t& operator=(const uint128_t &) = default;
	u64 m_low() const noexcept { return (u64)_data; }
	u64 m_high() const noexcept { return (u64)(_data >> 64); }
	uint128_t& operator+=(const u64 b) noexcept
	{
		_data += b;
		return *this;
	}
	uint128_t& mul_64_64(const u64 left, const u64 right) noexcept
	{
		_data = (__uint128_t)left * right;
		return *this;
	}
private:
	__uint128_t	_data;
};


// result = a + b + carry, set new carry
static forceinline u64 u64_addc(const u64 a, const u64 b, u64& carry) noexcept
{
#ifndef	NO_BUILTIN_OVERFLOW
	u64		ret;
	bool	c1 = __builtin_add_overflow(a, b, &ret);
	bool	c2 = __builtin_add_overflow(ret, carry, &ret);
	carry = c1 | c2;
	return ret;
#else
	u64		ret;
	ret = a + b + carry;
	if (ret != a) carry = ret < a;
	return ret;
#endif
}

// result = a - b - borrow, set new borrow
static forceinline u64 u64_subc(const u64 a, const u64 b, u64& borrow) noexcept
{
#ifndef	NO_BUILTIN_OVERFLOW
	u64		ret;
	bool	c1 = __builtin_sub_overflow(a, b, &ret);
	bool	c2 = __builtin_sub_overflow(ret, borrow, &ret);
	borrow = c1 | c2;
	return ret;
#else
	u64		ret;
	ret = a - b - borrow;
	if (ret != a) borrow = ret > a;
	return ret;
#endif
}


template<const uint N> forceinline
static void vli_clear(u64 *vli) noexcept
{
	for (uint i = 0; i < N; i++)
		vli[i] = 0;
}

/* Sets dest = src. */
template<const uint N> forceinline
static void vli_set(u64 *dest, const u64 *src) noexcept
{
	for (uint i = 0; i < N; i++)
		dest[i] = src[i];
}

template<const uint N> forceinline
static bool vli_is_zero(const u64 *vli) noexcept
{
	u64	v = vli[0];
	for (uint i = 1; i < N; i++)
		v |= vli[i];
	return v == 0;
}

/* Returns true if bit of vli is set, false beyond N*64 bits. */
template<const uint N> forceinline
static bool vli_test_bit(const u64 *vli, const uint bit) noexcept
{
	if ( bit >= N*64 ) return false;
	return (vli[bit >> 6] >> (bit & 0x3f)) & 1;
}

/**
 * vli_cmp() - compare left and right vlis
 *
 * Returns sign of @left - @right, i.e. -1 if @left < @right,
 * 0 if @left == @right, 1 if @left > @right.
 */
template<const uint N> forceinline
static int vli_cmp(const u64 *left, const u64 *right) noexcept
{
	for (int i = N - 1; i >= 0; --i) {
		if (left[i] > right[i]) return 1;
		else if (left[i] < right[i]) return -1;
	}
	return 0;
}

/* Counts the number of 64-bit digits in vli. */
template<const uint N> forceinline
static uint vli_num_digits(const u64 *vli) noexcept
{
	int i;
	for (i = N - 1; i >= 0 && vli[i] == 0; i--);
	return (i + 1);
}

/* Counts the number of bits required for vli. */
template<const uint N> forceinline
static uint vli_num_bits(const u64 *vli) noexcept
{
	auto ndigits = vli_num_digits<N>(vli);
	if (ndigits == 0) return 0;
	auto i = 64 - __builtin_clzl(vli[ndigits - 1]);
	return ((ndigits - 1) * 64 + i);
}

/* result = in << 1, returning the bit shifted out. Can modify in place. */
template<const uint N> forceinline
static u64 vli_lshift1(u64 *result, const u64 *in) noexcept
{
	u64 carry = 0;
	for (uint i = 0; i < N; i++) {
		u64 temp = in[i];
		result[i] = (temp << 1) | carry;
		carry = temp >> 63;
	}
	return carry;
}

/* vli = vli >> 1, carry goes into the top bit. */
template<const uint N> forceinline
static void vli_rshift1(u64 *vli, const bool carry=false) noexcept
{
	u64	hbit = carry ? (1ull << 63) : 0;
	for (int i = N - 1; i >= 0; i--) {
		u64 temp = vli[i];
		vli[i] = (temp >> 1) | hbit;
		hbit = temp << 63;
	}
}

/* Computes result = left + right, returning carry. Can modify in place. */
template<const uint N> forceinline
static bool vli_add(u64 *result, const u64 *left, const u64 *right) noexcept
{
	u64 carry = 0;
	for (uint i = 0; i < N; ++i)
		result[i] = u64_addc(left[i], right[i], carry);
	return carry != 0;
}

template<const uint N> forceinline
static bool vli_add_to(u64 *result, const u64 *right) noexcept
{
	return vli_add<N>(result, result, right);
}

/* Computes result += right for a single digit right, returning carry. */
template<const uint N> forceinline
static bool vli_uadd_to(u64 *result, const u64 right) noexcept
{
	u64 carry = 0;
	result[0] = u64_addc(result[0], right, carry);
	for (uint i = 1; i < N && carry; i++)
		result[i] = u64_addc(result[i], 0, carry);
	return carry != 0;
}

/* Computes result = left - right, returning borrow. Can modify in place. */
template<const uint N> forceinline
static bool vli_sub(u64 *result, const u64 *left, const u64 *right) noexcept
{
	u64 borrow = 0;
	for (uint i = 0; i < N; i++)
		result[i] = u64_subc(left[i], right[i], borrow);
	return borrow != 0;
}

template<const uint N> forceinline
static bool vli_sub_from(u64 *result, const u64 *right) noexcept
{
	return vli_sub<N>(result, result, right);
}

/* result[2N] = left * right, operand scanning */
template<const uint N> forceinline
static void vli_mult(u64 *result, const u64 *left, const u64 *right) noexcept
{
	vli_clear<N * 2>(result);
	for (uint i = 0; i < N; ++i) {
		u64		carry = 0;
		for (uint j = 0; j < N; ++j) {
			uint128_t	product;
			product.mul_64_64(left[i], right[j]);
			// (2^64-1)^2 + 2*(2^64-1) never overflows 128 bits
			product += result[i + j];
			product += carry;
			result[i + j] = product.m_low();
			carry = product.m_high();
		}
		result[i + N] = carry;
	}
}

/* result[N+1] = left * right, for a single digit right. */
template<const uint N> forceinline
static void vli_umult(u64 *result, const u64 *left, const u64 right) noexcept
{
	u64		carry = 0;
	for (uint k = 0; k < N; k++) {
		uint128_t	product;
		product.mul_64_64(left[k], right);
		product += carry;
		result[k] = product.m_low();
		carry = product.m_high();
	}
	result[N] = carry;
}

/*
 * Computes result = product % mod
 * for special form moduli: mod = 2^(64*N) - c, c < 2^64
 * i.e. mod[1 .. N-1] all ones.
 *
 * References:
 * R. Crandall, C. Pomerance. Prime Numbers: A Computational Perspective.
 * 9 Fast Algorithms for Large-Integer Arithmetic. 9.2.3 Moduli of special form
 * Algorithm 9.2.13 (Fast mod operation for special-form moduli).
 */
template<const uint N> forceinline
static void
vli_mmod_special(u64 *result, const u64 *product, const u64 *mod) noexcept
{
	const u64 c = -mod[0];
	u64 t[N * 2];
	u64 r[N * 2];

	vli_set<N * 2>(r, product);
	while (!vli_is_zero<N>(r + N)) {
		// high * 2^(64N) == high * c  (mod)
		vli_umult<N>(t, r + N, c);
		vli_clear<N - 1>(t + N + 1);
		vli_clear<N>(r + N);
		vli_add_to<N * 2>(r, t);
	}
	while (vli_cmp<N>(r, mod) >= 0)
		vli_sub_from<N>(r, mod);
	vli_set<N>(result, r);
}

/*
 * quot = left / mod, rem = left % mod, binary long division.
 * Returns false for a zero modulus.
 */
template<const uint N> forceinline
static bool
vli_divmod(u64 *quot, u64 *rem, const u64 *left, const u64 *mod) noexcept
{
	if ( unlikely(vli_is_zero<N>(mod)) ) return false;
	u64		q[N], r[N];
	vli_clear<N>(q);
	vli_clear<N>(r);
	for (int i = (int)vli_num_bits<N>(left) - 1; i >= 0; --i) {
		auto carry = vli_lshift1<N>(r, r);
		r[0] |= vli_test_bit<N>(left, i);
		if (carry || vli_cmp<N>(r, mod) >= 0) {
			vli_sub_from<N>(r, mod);
			q[i >> 6] |= (1ull << (i & 0x3f));
		}
	}
	if (quot != nullptr) vli_set<N>(quot, q);
	if (rem != nullptr) vli_set<N>(rem, r);
	return true;
}

}	// namespace k256

#endif	//	__K256_VLI_HPP__
