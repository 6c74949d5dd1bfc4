// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/assets/layerid.h"
#include <QRegularExpression>

namespace wavatar {
namespace assets {

const LayerCategory ALL_CATEGORIES[7] = {
	LayerCategory::Fade,  LayerCategory::Mask,	 LayerCategory::Shine,
	LayerCategory::Brow,  LayerCategory::Eyes,	 LayerCategory::Pupils,
	LayerCategory::Mouth,
};

int variantCount(LayerCategory category)
{
	switch(category) {
	case LayerCategory::Fade:
		return 4;
	case LayerCategory::Mask:
	case LayerCategory::Shine:
		// Masks and shines come in pairs sharing the face variant
		return 11;
	case LayerCategory::Brow:
		return 8;
	case LayerCategory::Eyes:
		return 13;
	case LayerCategory::Pupils:
		return 11;
	case LayerCategory::Mouth:
		return 19;
	}
	qWarning("Unhandled layer category %d in %s", int(category), __func__);
	return 0;
}

QString categoryName(LayerCategory category)
{
	switch(category) {
	case LayerCategory::Fade:
		return QStringLiteral("fade");
	case LayerCategory::Mask:
		return QStringLiteral("mask");
	case LayerCategory::Shine:
		return QStringLiteral("shine");
	case LayerCategory::Brow:
		return QStringLiteral("brow");
	case LayerCategory::Eyes:
		return QStringLiteral("eyes");
	case LayerCategory::Pupils:
		return QStringLiteral("pupils");
	case LayerCategory::Mouth:
		return QStringLiteral("mouth");
	}
	qWarning("Unhandled layer category %d in %s", int(category), __func__);
	return QString();
}

bool categoryFromName(const QString &name, LayerCategory *outCategory)
{
	for(LayerCategory category : ALL_CATEGORIES) {
		if(categoryName(category) == name) {
			if(outCategory) {
				*outCategory = category;
			}
			return true;
		}
	}
	return false;
}

bool LayerId::isValid() const
{
	return variant >= 1 && variant <= variantCount(category);
}

QString LayerId::fileName() const
{
	return QStringLiteral("%1%2.png").arg(categoryName(category)).arg(variant);
}

QString LayerId::toString() const
{
	return QStringLiteral("%1/%2").arg(categoryName(category)).arg(variant);
}

LayerId LayerId::fromFileName(const QString &fileName)
{
	static const QRegularExpression re(
		QStringLiteral("\\A([a-z]+)([0-9]{1,3})\\.png\\z"));
	const QRegularExpressionMatch m = re.match(fileName);
	LayerCategory category;
	if(m.hasMatch() && categoryFromName(m.captured(1), &category)) {
		const LayerId id(category, m.captured(2).toInt());
		if(id.isValid()) {
			return id;
		}
	}
	return LayerId();
}

}
}
