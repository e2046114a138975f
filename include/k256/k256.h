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
#ifndef __K256_H__
#define __K256_H__

#include "cdefs.h"

/* One digit is u64 qword, 4 digits little endian per value. */

#ifdef	__cplusplus
extern "C" {
#endif

/**
 * k256_get_params() - Export the curve constants
 *
 * @p:		field prime, may be NULL
 * @n:		group order, may be NULL
 * @half_n:	n >> 1, may be NULL
 * @gx:		generator x, may be NULL
 * @gy:		generator y, may be NULL
 *
 * Return: 0, or -EFAULT if the generator failed to recover.
 */
int k256_get_params(u64 *p, u64 *n, u64 *half_n, u64 *gx, u64 *gy);

/**
 * k256_fe_inverse() - Modular inverse in GF(p)
 *
 * @res:	1/a mod p
 * @a:		field element, reduced modulo p first
 *
 * Return: 0, -EDOM if a is zero mod p, -EINVAL for NULL arguments.
 */
int k256_fe_inverse(u64 *res, const u64 *a);

/**
 * k256_fe_sqrt() - Square root in GF(p)
 *
 * @res:	one root of a
 * @a:		field element, reduced modulo p first
 *
 * Return: 0, -ENOENT if a is a non-residue, -EINVAL for NULL arguments.
 */
int k256_fe_sqrt(u64 *res, const u64 *a);

/**
 * k256_fe_to_bytes() - Encode a reduced field element
 *
 * @out:	32 bytes, big endian
 * @a:		field element, reduced modulo p first
 *
 * Return: 0, -EINVAL for NULL arguments.
 */
int k256_fe_to_bytes(u8 *out, const u64 *a);

/**
 * k256_point_from_xy() - Validate affine coordinates
 *
 * @res:	the point
 * @x:		x coordinate, must be less than p
 * @y:		y coordinate, must be less than p
 *
 * Return: 0 if y^2 = x^3 + 7, -EINVAL otherwise.
 */
int k256_point_from_xy(Point *res, const u64 *x, const u64 *y);

/**
 * k256_point_add() - Group addition
 *
 * @res:	pt1 + pt2, may alias the operands
 * @pt1:	point, validated
 * @pt2:	point, validated
 *
 * Return: 0, -EINVAL for invalid points or NULL arguments.
 */
int k256_point_add(Point *res, const Point *pt1, const Point *pt2);

/**
 * k256_point_mult() - Scalar multiplication
 *
 * @res:	k * pt
 * @pt:		point, validated
 * @k:		256 bits scalar, reduced modulo n
 *
 * Return: 0, -EINVAL for an invalid point or NULL arguments.
 */
int k256_point_mult(Point *res, const Point *pt, const u64 *k);

/**
 * k256_point_mult_base() - Scalar multiplication of the generator
 *
 * @res:	k * G
 * @k:		256 bits scalar, reduced modulo n
 *
 * Return: 0, -EFAULT if the generator failed to recover, -EINVAL for NULL
 *	arguments.
 */
int k256_point_mult_base(Point *res, const u64 *k);

/**
 * k256_lift_x() - Recover the point with even y
 *
 * @res:	the point
 * @x:		x coordinate, reduced modulo p first
 *
 * Return: 0, -ENOENT if no point has this x.
 */
int k256_lift_x(Point *res, const u64 *x);

/**
 * k256_strerror() - Describe a return code
 *
 * @err:	return code of the functions above, negative or 0
 *
 * Return: static string, never NULL.
 */
const char *k256_strerror(int err);

#ifdef	__cplusplus
}
#endif

#endif	//	__K256_H__
