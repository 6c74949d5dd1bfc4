// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/paint/compositor.h"
#include "libwavatar/assets/assetprovider.h"
#include "libwavatar/color/hsl.h"
#include "libwavatar/paint/floodfill.h"
#include <QByteArray>
#include <QLoggingCategory>
#include <QPainter>

Q_LOGGING_CATEGORY(lcWavatarCompositor, "wavatar.compositor", QtWarningMsg)

namespace wavatar {
namespace paint {

using assets::LayerCategory;
using assets::LayerId;

LayerCompositor::LayerCompositor(const assets::AssetProvider *provider)
	: m_provider(provider)
{
	Q_ASSERT(m_provider);
}

AvatarResult LayerCompositor::generate(const QByteArray &input) const
{
	const generator::AvatarParameters params =
		generator::deriveParameters(input);
	qCDebug(lcWavatarCompositor) << "Input of" << input.size() << "bytes:"
								 << params;
	return compose(params);
}

AvatarResult
LayerCompositor::compose(const generator::AvatarParameters &params) const
{
	const QVector<LayerId> layers = layerSequence(params);
	AvatarResult result;

	QImage canvas(SIZE, SIZE, QImage::Format_ARGB32_Premultiplied);
	canvas.fill(backgroundColor(params));

	// Fade and mask go below the wave fill, the rest on top of it
	const int belowFill = 2;
	for(int i = 0; i < belowFill; ++i) {
		if(!applyLayer(canvas, layers[i], result)) {
			return result;
		}
	}

	const int filled = floodFill(canvas, fillPoint(), waveColor(params));
	qCDebug(lcWavatarCompositor) << "Wave fill covered" << filled << "pixels";

	for(int i = belowFill; i < layers.size(); ++i) {
		if(!applyLayer(canvas, layers[i], result)) {
			return result;
		}
	}

	result.image = canvas;
	return result;
}

QVector<LayerId>
LayerCompositor::layerSequence(const generator::AvatarParameters &params)
{
	return {
		LayerId(LayerCategory::Fade, params.fade),
		LayerId(LayerCategory::Mask, params.face),
		LayerId(LayerCategory::Shine, params.face),
		LayerId(LayerCategory::Brow, params.brow),
		LayerId(LayerCategory::Eyes, params.eyes),
		LayerId(LayerCategory::Pupils, params.pupil),
		LayerId(LayerCategory::Mouth, params.mouth),
	};
}

QColor LayerCompositor::backgroundColor(const generator::AvatarParameters &params)
{
	return color::hslToRgb(
		params.backgroundHue, color::HSL_MAX, BACKGROUND_LIGHTNESS);
}

QColor LayerCompositor::waveColor(const generator::AvatarParameters &params)
{
	return color::hslToRgb(params.waveHue, color::HSL_MAX, WAVE_LIGHTNESS);
}

bool LayerCompositor::applyLayer(
	QImage &canvas, const LayerId &id, AvatarResult &result) const
{
	QString error;
	const QImage layer = m_provider->layer(id, &error);
	if(layer.isNull()) {
		qCWarning(lcWavatarCompositor) << "Can't get layer" << id.toString()
									   << "from" << m_provider->describe()
									   << ":" << error;
		result.image = QImage();
		result.failedLayer = id;
		result.error = QStringLiteral("%1: %2").arg(id.toString(), error);
		return false;
	}

	QPainter painter(&canvas);
	painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
	painter.drawImage(0, 0, layer);
	return true;
}

AvatarResult
generate(const QByteArray &input, const assets::AssetProvider &provider)
{
	return LayerCompositor(&provider).generate(input);
}

}
}
