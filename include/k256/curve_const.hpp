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
#ifndef __K256_CURVE_CONST_HPP__
#define __K256_CURVE_CONST_HPP__
#include "cdefs.h"

namespace k256 {

// secp256k1, y^2 = x^3 + 7, little endian 64-bit digits
// p = 2^256 - 2^32 - 977
constexpr u64 secp256k1_p[] = { 0xFFFFFFFEFFFFFC2Full, 0xFFFFFFFFFFFFFFFFull,
				0xFFFFFFFFFFFFFFFFull, 0xFFFFFFFFFFFFFFFFull };
// 2^256 - p, p is special form 2^256 - c
constexpr u64 secp256k1_p_c = 0x1000003D1ull;
constexpr u64 secp256k1_n[] = { 0xBFD25E8CD0364141ull, 0xBAAEDCE6AF48A03Bull,
				0xFFFFFFFFFFFFFFFEull, 0xFFFFFFFFFFFFFFFFull };
constexpr u64 secp256k1_b = 7;
constexpr u64 secp256k1_gx[]= { 0x59F2815B16F81798ull, 0x029BFCDB2DCE28D9ull,
				0x55A06295CE870B07ull, 0x79BE667EF9DCBBACull };
// only for checking the recovered generator
constexpr u64 secp256k1_gy[]= { 0x9C47D08FFB10D4B8ull, 0xFD17B448A6855419ull,
				0x5DA4FBFC0E1108A8ull, 0x483ADA7726A3C465ull };

}	// namespace k256

#endif	// __K256_CURVE_CONST_HPP__
