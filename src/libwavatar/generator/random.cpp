// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/generator/random.h"
#include <QByteArray>

namespace wavatar {
namespace generator {

namespace {

constexpr quint64 FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr quint64 FNV_PRIME = 0x100000001b3ULL;

constexpr quint64 MUL_HI = 0x2360ed051fc65da4ULL;
constexpr quint64 MUL_LO = 0x4385df649fccf645ULL;
constexpr quint64 INC_HI = 0x5851f42d4c957f2dULL;
constexpr quint64 INC_LO = 0x14057b7ef767814fULL;

constexpr quint64 CHEAP_MUL = 0xda942042e4dd58b5ULL;

// Full 64x64 -> 128 bit product
void mul64(quint64 x, quint64 y, quint64 &hi, quint64 &lo)
{
	const quint64 mask32 = 0xffffffffULL;
	const quint64 x0 = x & mask32;
	const quint64 x1 = x >> 32;
	const quint64 y0 = y & mask32;
	const quint64 y1 = y >> 32;

	const quint64 w0 = x0 * y0;
	const quint64 t = x1 * y0 + (w0 >> 32);
	quint64 w1 = t & mask32;
	const quint64 w2 = t >> 32;
	w1 += x0 * y1;

	hi = x1 * y1 + w2 + (w1 >> 32);
	lo = x * y;
}

}

quint64 fnv1a64(const QByteArray &data)
{
	quint64 h = FNV_OFFSET;
	for(char c : data) {
		h ^= quint64(uchar(c));
		h *= FNV_PRIME;
	}
	return h;
}


Pcg::Pcg(quint64 seedHi, quint64 seedLo)
	: m_hi(seedHi)
	, m_lo(seedLo)
{
}

Pcg Pcg::fromDigest(quint64 digest)
{
	// The stream word must be odd
	return Pcg(digest, (digest >> 1) | 1);
}

void Pcg::step()
{
	// state = state * MUL + INC (mod 2^128)
	quint64 hi, lo;
	mul64(m_lo, MUL_LO, hi, lo);
	hi += m_hi * MUL_LO + m_lo * MUL_HI;

	const quint64 sum = lo + INC_LO;
	const quint64 carry = sum < lo ? 1 : 0;
	m_lo = sum;
	m_hi = hi + INC_HI + carry;
}

quint64 Pcg::next()
{
	step();

	quint64 hi = m_hi;
	hi ^= hi >> 32;
	hi *= CHEAP_MUL;
	hi ^= hi >> 48;
	hi *= (m_lo | 1);
	return hi;
}

quint64 Pcg::uniform(quint64 n)
{
	Q_ASSERT(n > 0);

	if((n & (n - 1)) == 0) {
		return next() & (n - 1);
	}

	quint64 hi, lo;
	mul64(next(), n, hi, lo);
	if(lo < n) {
		const quint64 threshold = (0 - n) % n;
		while(lo < threshold) {
			mul64(next(), n, hi, lo);
		}
	}
	return hi;
}

}
}
