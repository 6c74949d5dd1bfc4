// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_GENERATOR_PARAMETERS_H
#define LIBWAVATAR_GENERATOR_PARAMETERS_H
#include <QtGlobal>

class QByteArray;
class QDebug;

namespace wavatar {
namespace generator {

class Pcg;

//! The variant and color choices that make up one avatar
struct AvatarParameters {
	int face;
	int backgroundHue;
	int fade;
	int waveHue;
	int brow;
	int eyes;
	int pupil;
	int mouth;

	bool operator==(const AvatarParameters &other) const;
	bool operator!=(const AvatarParameters &other) const
	{
		return !(*this == other);
	}
};

/**
 * @brief Draw the parameters from the given generator
 *
 * Each value is drawn in declaration order of AvatarParameters. Changing
 * the order changes the avatar of every input.
 */
AvatarParameters drawParameters(Pcg &rng);

/**
 * @brief Derive the avatar parameters for the given input
 *
 * Typically the input is the MD5 hash of an email address, but any byte
 * sequence (including an empty one) is accepted.
 */
AvatarParameters deriveParameters(const QByteArray &input);

}
}

QDebug operator<<(QDebug debug, const wavatar::generator::AvatarParameters &p);

#endif
