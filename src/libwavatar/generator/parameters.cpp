// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/generator/parameters.h"
#include "libwavatar/assets/layerid.h"
#include "libwavatar/color/hsl.h"
#include "libwavatar/generator/random.h"
#include <QByteArray>
#include <QDebug>

namespace wavatar {
namespace generator {

bool AvatarParameters::operator==(const AvatarParameters &other) const
{
	return face == other.face && backgroundHue == other.backgroundHue &&
		   fade == other.fade && waveHue == other.waveHue &&
		   brow == other.brow && eyes == other.eyes && pupil == other.pupil &&
		   mouth == other.mouth;
}

static int draw(Pcg &rng, int count)
{
	return int(rng.uniform(quint64(count))) + 1;
}

AvatarParameters drawParameters(Pcg &rng)
{
	using assets::LayerCategory;
	using assets::variantCount;

	// Separate statements: the draw order is fixed
	AvatarParameters p;
	p.face = draw(rng, variantCount(LayerCategory::Mask));
	p.backgroundHue = draw(rng, color::HSL_MAX);
	p.fade = draw(rng, variantCount(LayerCategory::Fade));
	p.waveHue = draw(rng, color::HSL_MAX);
	p.brow = draw(rng, variantCount(LayerCategory::Brow));
	p.eyes = draw(rng, variantCount(LayerCategory::Eyes));
	p.pupil = draw(rng, variantCount(LayerCategory::Pupils));
	p.mouth = draw(rng, variantCount(LayerCategory::Mouth));
	return p;
}

AvatarParameters deriveParameters(const QByteArray &input)
{
	Pcg rng = Pcg::fromDigest(fnv1a64(input));
	return drawParameters(rng);
}

}
}

QDebug operator<<(QDebug debug, const wavatar::generator::AvatarParameters &p)
{
	QDebugStateSaver saver(debug);
	debug.nospace() << "AvatarParameters(face=" << p.face
					<< ", bg=" << p.backgroundHue << ", fade=" << p.fade
					<< ", wave=" << p.waveHue << ", brow=" << p.brow
					<< ", eyes=" << p.eyes << ", pupil=" << p.pupil
					<< ", mouth=" << p.mouth << ')';
	return debug;
}
