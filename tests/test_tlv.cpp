/**
 * Unit tests for the BER-TLV codec
 */

#include <QTest>
#include "pgpcard-qt/tlv.h"
#include "mocks/card_fixture.h"

using namespace PgpCard;

class TestTlv : public QObject {
    Q_OBJECT

private slots:
    void testEmptyInput() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray());
        QVERIFY(result.isSuccess());
        QVERIFY(result.value().isEmpty());
    }

    void testPrimitive() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("5B03414243"));
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().size(), 1);
        QCOMPARE(result.value().value("5B"), QByteArray("ABC"));
        QCOMPARE(result.value().length("5B").value_or(-1), 3);
    }

    void testSiblings() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("C10101C2020203"));
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().paths(), QStringList({"C1", "C2"}));
        QCOMPARE(result.value().value("C2"), QByteArray::fromHex("0203"));
    }

    void testNestedPaths() {
        // 6E { 4F, 73 { C5 } }
        QByteArray data = QByteArray::fromHex("6E0B" "4F02D276" "7305" "C503AABBCC");
        Result<TLV::TagMap> result = TLV::parse(data);
        QVERIFY(result.isSuccess());

        const TLV::TagMap& map = result.value();
        QCOMPARE(map.paths(), QStringList({"6E", "6E.4F", "6E.73", "6E.73.C5"}));
        QCOMPARE(map.value("6E.73.C5"), QByteArray::fromHex("AABBCC"));
        // Constructed elements keep their full value
        QCOMPARE(map.value("6E.73"), QByteArray::fromHex("C503AABBCC"));
        QCOMPARE(map.length("6E").value_or(-1), 11);
    }

    void testMultiByteTag() {
        QByteArray data = QByteArray::fromHex("7F4906" "8101AA" "820103");
        Result<TLV::TagMap> result = TLV::parse(data);
        QVERIFY(result.isSuccess());
        QVERIFY(result.value().contains("7F49"));
        QCOMPARE(result.value().value("7F49.81"), QByteArray::fromHex("AA"));
        QCOMPARE(result.value().value("7F49.82"), QByteArray::fromHex("03"));
    }

    void testThreeByteTag() {
        // 5F FF 01: continuation bit set on the second byte
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("5FFF0101AA"));
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().value("5FFF01"), QByteArray::fromHex("AA"));
    }

    void testTagTooLong() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("5F8181810101AA"));
        QVERIFY(result.isError());
        QCOMPARE(result.errorCode(), ErrorCode::MalformedTlv);
    }

    void testTruncatedTag() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("7F"));
        QCOMPARE(result.errorCode(), ErrorCode::MalformedTlv);
    }

    void testLongFormLength() {
        QByteArray value(200, 'x');
        QByteArray data = QByteArray::fromHex("C581C8") + value;
        Result<TLV::TagMap> result = TLV::parse(data);
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().length("C5").value_or(-1), 200);

        QByteArray big(300, 'y');
        result = TLV::parse(QByteArray::fromHex("C582012C") + big);
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().value("C5"), big);
    }

    void testLengthExceedsData() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("5B0541"));
        QVERIFY(result.isError());
        QCOMPARE(result.errorCode(), ErrorCode::MalformedTlv);
        QVERIFY(result.error().contains("5B"));
    }

    void testTruncatedNestedFailsWhole() {
        // Outer length is fine, inner C5 claims more than the outer value holds
        QByteArray data = QByteArray::fromHex("4F01AA" "7304" "C505AABB");
        Result<TLV::TagMap> result = TLV::parse(data);
        QVERIFY(result.isError());
        QVERIFY(result.value().isEmpty());
    }

    void testMissingLength() {
        QCOMPARE(TLV::parse(QByteArray::fromHex("5B")).errorCode(), ErrorCode::MalformedTlv);
    }

    void testIndefiniteLengthRejected() {
        QCOMPARE(TLV::parse(QByteArray::fromHex("7380C10101")).errorCode(), ErrorCode::MalformedTlv);
    }

    void testTooManyLengthBytes() {
        QCOMPARE(TLV::parse(QByteArray::fromHex("5B850000000001AA")).errorCode(), ErrorCode::MalformedTlv);
    }

    void testDuplicateFirstWins() {
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("C10101C10102"));
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().size(), 1);
        QCOMPARE(result.value().value("C1"), QByteArray::fromHex("01"));
    }

    void testAbsentPath() {
        TLV::TagMap map = TLV::parse(QByteArray::fromHex("5B0141")).value();
        QVERIFY(!map.contains("65.5B"));
        QVERIFY(!map.length("65.5B").has_value());
        QVERIFY(map.value("65.5B").isEmpty());
    }

    void testZeroLengthValue() {
        TLV::TagMap map = TLV::parse(QByteArray::fromHex("DE00")).value();
        QVERIFY(map.contains("DE"));
        QCOMPARE(map.length("DE").value_or(-1), 0);
    }

    void testMerge() {
        TLV::TagMap a = TLV::parse(QByteArray::fromHex("6E034F0101")).value();
        TLV::TagMap b = TLV::parse(QByteArray::fromHex("65035B0141")).value();
        a.merge(b);
        QCOMPARE(a.paths(), QStringList({"65", "65.5B", "6E", "6E.4F"}));
    }

    void testNestingAtLimit() {
        // 15 constructed levels around one primitive: 16 path components
        QByteArray data = TLV::encode(0xC1, QByteArray("x"));
        for (int i = 1; i < TLV::MaxNestingDepth; i++) {
            data = TLV::encode(0x73, data);
        }

        Result<TLV::TagMap> result = TLV::parse(data);
        QVERIFY2(result.isSuccess(), qPrintable(result.error()));

        QStringList components;
        for (int i = 1; i < TLV::MaxNestingDepth; i++) {
            components.append("73");
        }
        components.append("C1");
        const QString path = components.join('.');
        QCOMPARE(result.value().value(path), QByteArray("x"));
        QCOMPARE(result.value().size(), TLV::MaxNestingDepth);
    }

    void testNestingTooDeep() {
        QByteArray data = TLV::encode(0xC1, QByteArray("x"));
        for (int i = 0; i < TLV::MaxNestingDepth; i++) {
            data = TLV::encode(0x73, data);
        }

        Result<TLV::TagMap> result = TLV::parse(data);
        QCOMPARE(result.errorCode(), ErrorCode::MalformedTlv);
        QVERIFY(result.error().contains("nested deeper"));
    }

    void testHugeNestingRejected() {
        // 50000 empty-bodied wrappers "20 83 LL LL LL", each holding the rest
        const int levels = 50000;
        const int header = 5;
        QByteArray data;
        data.reserve(levels * header);
        for (int i = 0; i < levels; i++) {
            const int length = (levels - 1 - i) * header;
            data.append(static_cast<char>(0x20));
            data.append(static_cast<char>(0x83));
            data.append(static_cast<char>((length >> 16) & 0xFF));
            data.append(static_cast<char>((length >> 8) & 0xFF));
            data.append(static_cast<char>(length & 0xFF));
        }

        Result<TLV::TagMap> result = TLV::parse(data);
        QCOMPARE(result.errorCode(), ErrorCode::MalformedTlv);
        QVERIFY(result.value().isEmpty());
    }

    void testDuplicateNestedFirstWins() {
        // Two sibling 73 templates both carrying C1
        Result<TLV::TagMap> result = TLV::parse(QByteArray::fromHex("7303C10101" "7303C10102"));
        QVERIFY(result.isSuccess());
        QCOMPARE(result.value().value("73.C1"), QByteArray::fromHex("01"));
        QCOMPARE(result.value().value("73"), QByteArray::fromHex("C10101"));
    }

    void testParseLength() {
        int offset = 0;
        Result<quint32> shortForm = TLV::parseLength(QByteArray::fromHex("7F"), offset);
        QCOMPARE(shortForm.value(), quint32(127));
        QCOMPARE(offset, 1);

        offset = 1;
        Result<quint32> longForm = TLV::parseLength(QByteArray::fromHex("00820100"), offset);
        QCOMPARE(longForm.value(), quint32(256));
        QCOMPARE(offset, 4);

        offset = 0;
        QCOMPARE(TLV::parseLength(QByteArray::fromHex("8201"), offset).errorCode(), ErrorCode::MalformedTlv);
    }

    void testEncodeLength() {
        QCOMPARE(TLV::encodeLength(0), QByteArray::fromHex("00"));
        QCOMPARE(TLV::encodeLength(127), QByteArray::fromHex("7F"));
        QCOMPARE(TLV::encodeLength(128), QByteArray::fromHex("8180"));
        QCOMPARE(TLV::encodeLength(255), QByteArray::fromHex("81FF"));
        QCOMPARE(TLV::encodeLength(256), QByteArray::fromHex("820100"));
        QCOMPARE(TLV::encodeLength(0x10000), QByteArray::fromHex("83010000"));
    }

    void testEncode() {
        QCOMPARE(TLV::encode(0x5B, QByteArray("AB")), QByteArray::fromHex("5B024142"));
        QCOMPARE(TLV::encode(QByteArray::fromHex("7F49"), QByteArray::fromHex("8100")),
                 QByteArray::fromHex("7F49028100"));
    }

    void testCardResponse() {
        TLV::TagMap map = Test::CardFixture::tags();
        QCOMPARE(map.value("6E.4F"), Test::CardFixture::aid());
        QCOMPARE(map.length("6E.73.C5").value_or(-1), 60);
        QCOMPARE(map.length("6E.73.CD").value_or(-1), 12);
        QCOMPARE(map.value("6E.73.C0"), Test::CardFixture::extendedCapabilities());
        QCOMPARE(map.value("65.5B"), QByteArray("DOE<<JOHN"));
    }

    void testTagName() {
        QCOMPARE(TLV::tagName(QByteArray::fromHex("5f50")), QString("5F50"));
        QCOMPARE(TLV::tagName(QByteArray::fromHex("c5")), QString("C5"));
    }
};

QTEST_MAIN(TestTlv)
#include "test_tlv.moc"
