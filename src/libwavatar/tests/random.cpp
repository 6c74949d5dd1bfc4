// SPDX-License-Identifier: GPL-3.0-or-later
#include "libwavatar/generator/parameters.h"
#include "libwavatar/generator/random.h"

#include <QtTest/QtTest>
#include <QCryptographicHash>

using namespace wavatar::generator;

class TestRandom final : public QObject
{
	Q_OBJECT
private slots:
	void testFnv()
	{
		QCOMPARE(fnv1a64(QByteArray()), Q_UINT64_C(0xcbf29ce484222325));
		QCOMPARE(fnv1a64(QByteArray("a")), Q_UINT64_C(0xaf63dc4c8601ec8c));
		QCOMPARE(fnv1a64(QByteArray("test@example.com")), Q_UINT64_C(0x67d72223300e8928));

		// Order sensitive
		QVERIFY(fnv1a64(QByteArray("ab")) != fnv1a64(QByteArray("ba")));
	}

	void testPcgSequence()
	{
		Pcg rng(1, 2);
		QCOMPARE(rng.next(), Q_UINT64_C(0xc4f5a58656eef510));
		QCOMPARE(rng.next(), Q_UINT64_C(0x9dcec3ad077dec6c));
		QCOMPARE(rng.next(), Q_UINT64_C(0xc8d04605312f8088));
	}

	void testPcgReseedRepeats()
	{
		Pcg a = Pcg::fromDigest(0x0123456789abcdefULL);
		Pcg b = Pcg::fromDigest(0x0123456789abcdefULL);
		for(int i = 0; i < 100; ++i) {
			QCOMPARE(a.next(), b.next());
		}
	}

	void testUniformBounds()
	{
		Pcg rng(123, 457);
		const quint64 bounds[] = {1, 2, 3, 4, 11, 19, 240, 1000};
		for(quint64 n : bounds) {
			for(int i = 0; i < 1000; ++i) {
				QVERIFY(rng.uniform(n) < n);
			}
		}
	}

	void testUniformCoversRange()
	{
		Pcg rng(7, 9);
		QVector<int> seen(13);
		for(int i = 0; i < 2000; ++i) {
			++seen[int(rng.uniform(13))];
		}
		for(int count : seen) {
			QVERIFY(count > 0);
		}
	}

	void testDrawOrder()
	{
		// Seed pair as derived from a digest of 42
		Pcg rng(42, (42 >> 1) | 1);
		const AvatarParameters p = drawParameters(rng);
		QCOMPARE(p.face, 6);
		QCOMPARE(p.backgroundHue, 234);
		QCOMPARE(p.fade, 4);
		QCOMPARE(p.waveHue, 212);
		QCOMPARE(p.brow, 4);
		QCOMPARE(p.eyes, 6);
		QCOMPARE(p.pupil, 7);
		QCOMPARE(p.mouth, 2);
	}

	void testDeriveGolden_data()
	{
		QTest::addColumn<QByteArray>("input");
		QTest::addColumn<QVector<int>>("expected");

		QTest::newRow("empty") << QByteArray() << QVector<int>{5, 39, 2, 139, 7, 5, 10, 18};
		QTest::newRow("email") << QByteArray("test@example.com") << QVector<int>{6, 31, 3, 28, 7, 1, 2, 2};
		QTest::newRow("user1") << QByteArray("user1@example.com") << QVector<int>{11, 162, 4, 240, 6, 2, 2, 4};
		QTest::newRow("user2") << QByteArray("user2@example.com") << QVector<int>{11, 23, 2, 88, 2, 11, 10, 2};
		QTest::newRow("md5")
			<< QCryptographicHash::hash("test@example.com", QCryptographicHash::Md5)
			<< QVector<int>{6, 85, 2, 3, 1, 4, 7, 7};
	}

	void testDeriveGolden()
	{
		QFETCH(QByteArray, input);
		QFETCH(QVector<int>, expected);

		const AvatarParameters p = deriveParameters(input);
		const QVector<int> actual{
			p.face, p.backgroundHue, p.fade, p.waveHue,
			p.brow, p.eyes, p.pupil, p.mouth};
		QCOMPARE(actual, expected);
	}

	void testDeriveRanges()
	{
		for(int i = 0; i < 500; ++i) {
			const AvatarParameters p = deriveParameters(QByteArray::number(i));
			QVERIFY(p.face >= 1 && p.face <= 11);
			QVERIFY(p.backgroundHue >= 1 && p.backgroundHue <= 240);
			QVERIFY(p.fade >= 1 && p.fade <= 4);
			QVERIFY(p.waveHue >= 1 && p.waveHue <= 240);
			QVERIFY(p.brow >= 1 && p.brow <= 8);
			QVERIFY(p.eyes >= 1 && p.eyes <= 13);
			QVERIFY(p.pupil >= 1 && p.pupil <= 11);
			QVERIFY(p.mouth >= 1 && p.mouth <= 19);
		}
	}

	void testDeriveIsDeterministic()
	{
		QByteArray large(1024 * 1024, '\0');
		for(int i = 0; i < large.size(); ++i) {
			large[i] = char(i % 256);
		}
		QCOMPARE(deriveParameters(large), deriveParameters(large));
		QVERIFY(deriveParameters("user1@example.com") != deriveParameters("user2@example.com"));
	}
};


QTEST_GUILESS_MAIN(TestRandom)
#include "random.moc"
