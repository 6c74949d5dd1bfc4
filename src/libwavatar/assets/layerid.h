// SPDX-License-Identifier: GPL-3.0-or-later
#ifndef LIBWAVATAR_ASSETS_LAYERID_H
#define LIBWAVATAR_ASSETS_LAYERID_H
#include "libwavatar/utils/qtcompat.h"
#include <QHash>
#include <QMetaType>
#include <QString>

namespace wavatar {
namespace assets {

//! Width and height of every layer image, and thus of every avatar
static constexpr int LAYER_SIZE = 80;

enum class LayerCategory {
	Fade,
	Mask,
	Shine,
	Brow,
	Eyes,
	Pupils,
	Mouth,
};

//! Number of variants available for the given category
int variantCount(LayerCategory category);

//! Lowercase name of the category as used in asset file names
QString categoryName(LayerCategory category);

//! Find a category by its name. Returns false if no such category exists
bool categoryFromName(const QString &name, LayerCategory *outCategory);

/**
 * @brief Identifies one pre-drawn avatar layer
 *
 * Variant numbers start from 1.
 */
struct LayerId {
	LayerCategory category = LayerCategory::Fade;
	int variant = 0;

	LayerId() = default;
	LayerId(LayerCategory c, int v)
		: category(c)
		, variant(v)
	{
	}

	//! Is the variant number within the category's range
	bool isValid() const;

	//! File name of the layer's image, e.g. "mouth12.png"
	QString fileName() const;

	//! Human readable form, e.g. "mouth/12"
	QString toString() const;

	/**
	 * @brief Parse a file name in the format produced by fileName()
	 *
	 * Returns an invalid LayerId if the name doesn't match.
	 */
	static LayerId fromFileName(const QString &fileName);

	bool operator==(const LayerId &other) const
	{
		return category == other.category && variant == other.variant;
	}
	bool operator!=(const LayerId &other) const { return !(*this == other); }
};

inline compat::HashValue qHash(const LayerId &id, compat::HashValue seed = 0)
{
	return ::qHash(int(id.category) * 1000 + id.variant, seed);
}

//! All categories, in the order their layers are stacked
extern const LayerCategory ALL_CATEGORIES[7];

}
}

Q_DECLARE_METATYPE(wavatar::assets::LayerId)

#endif
