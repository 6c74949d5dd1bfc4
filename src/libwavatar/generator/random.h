// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_GENERATOR_RANDOM_H
#define LIBWAVATAR_GENERATOR_RANDOM_H
#include <QtGlobal>

class QByteArray;

namespace wavatar {
namespace generator {

//! 64-bit FNV-1a hash of the given bytes
quint64 fnv1a64(const QByteArray &data);

/**
 * @brief Permuted congruential generator with 128 bits of state
 *
 * Uses the DXSM ("double xorshift multiply") output function. The output
 * sequence is fully determined by the two seed words, so this must never
 * be swapped for a platform or library generator.
 *
 * Not cryptographically secure.
 */
class Pcg final {
public:
	Pcg(quint64 seedHi, quint64 seedLo);

	//! Seed the generator from a digest the way avatars are derived
	static Pcg fromDigest(quint64 digest);

	//! Next raw 64-bit output
	quint64 next();

	/**
	 * @brief Uniformly distributed value in [0, n)
	 *
	 * Powers of two are masked, other bounds use multiply-shift with
	 * rejection of the biased low range.
	 */
	quint64 uniform(quint64 n);

private:
	void step();

	quint64 m_hi;
	quint64 m_lo;
};

}
}

#endif
