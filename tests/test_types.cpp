/**
 * Unit tests for types and type parsers
 */

#include <QTest>
#include "pgpcard-qt/types.h"
#include "pgpcard-qt/types_parser.h"
#include "pgpcard-qt/types/key_slot_array.h"

using namespace PgpCard;

class TestTypes : public QObject {
    Q_OBJECT
    
private slots:
    void testCardHolderName_data() {
        QTest::addColumn<QByteArray>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("surname and forename") << QByteArray("DOE<<JOHN") << QString("JOHN\nDOE");
        QTest::newRow("surname only") << QByteArray("DOE") << QString("DOE");
        QTest::newRow("empty") << QByteArray() << QString("[not set]");
        QTest::newRow("compound surname") << QByteArray("VAN<DER<BERG<<ANNA") << QString("ANNA\nVAN DER BERG");
        QTest::newRow("trailing separator") << QByteArray("DOE<<") << QString("DOE");
        QTest::newRow("forename only") << QByteArray("<<JOHN") << QString("JOHN\n");
        QTest::newRow("forename keeps filler") << QByteArray("DOE<<JOHN<PAUL") << QString("JOHN<PAUL\nDOE");
        QTest::newRow("utf-8") << QByteArray("M\xC3\x9CLLER<<J\xC3\x96RG") << QString::fromUtf8("J\xC3\x96RG\nM\xC3\x9CLLER");
    }

    void testCardHolderName() {
        QFETCH(QByteArray, input);
        QFETCH(QString, expected);
        QCOMPARE(parseCardHolderName(input), expected);
    }

    void testAlgorithmAttributes() {
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("010800002000")).value(), QString("RSA 2048"));
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("020C00")).value(), QString("RSA 3072"));
        // ECDH / ECDSA / EdDSA ids
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("12")).value(), QString("Alg=18  "));
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("13")).value(), QString("Alg=19  "));
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("16")).value(), QString("Alg=22  "));
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("FF")).value(), QString("Alg=255 "));
        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("00")).value(), QString("Alg=0   "));

        QCOMPARE(parseAlgorithmAttributes(QByteArray::fromHex("0108")).errorCode(), ErrorCode::NoSuchAlgorithm);
        QCOMPARE(parseAlgorithmAttributes(QByteArray()).errorCode(), ErrorCode::NotFound);
    }

    void testKeyOrigin() {
        QCOMPARE(parseKeyOrigin(0).value(), KeyOrigin::NotPresent);
        QCOMPARE(parseKeyOrigin(1).value(), KeyOrigin::Empty);
        QCOMPARE(parseKeyOrigin(2).value(), KeyOrigin::Generated);
        QCOMPARE(parseKeyOrigin(3).value(), KeyOrigin::Imported);
        QCOMPARE(parseKeyOrigin(4).errorCode(), ErrorCode::UnknownKeyOrigin);
        QCOMPARE(parseKeyOrigin(0xFF).errorCode(), ErrorCode::UnknownKeyOrigin);
    }

    void testNames() {
        QCOMPARE(keyTypeName(KeyType::Signature), QString("Sig"));
        QCOMPARE(keyTypeName(KeyType::Decryption), QString("Dec"));
        QCOMPARE(keyTypeName(KeyType::Authentication), QString("Aut"));
        QCOMPARE(keyTypeName(KeyType::Attestation), QString("Att"));

        QCOMPARE(keyOriginName(KeyOrigin::Generated), QString("generated"));
        QCOMPARE(secureMessagingName(SecureMessagingAlgorithm::SCP11b), QString("SCP11b"));
    }

    void testKeyIndex() {
        QCOMPARE(keyIndex(KeyType::Signature), 0);
        QCOMPARE(keyIndex(KeyType::Attestation), 3);
        QCOMPARE(FingerprintArray::offset(KeyType::Authentication), 40);
        QCOMPARE(CreationDateArray::offset(KeyType::Decryption), 4);
    }

    void testKeySlotArray() {
        QByteArray dates = QByteArray::fromHex("00000001" "00000002" "00000003");
        CreationDateArray array(dates);
        QVERIFY(array.covers(KeyType::Authentication));
        QVERIFY(!array.covers(KeyType::Attestation));
        QCOMPARE(array.slice(KeyType::Decryption).value(), QByteArray::fromHex("00000002"));
        QCOMPARE(array.slice(KeyType::Attestation).errorCode(), ErrorCode::TooShort);

        // A partial trailing slot is not covered
        KeyOriginArray origins(QByteArray::fromHex("0203"));
        QCOMPARE(origins.slice(KeyType::Decryption).value(), QByteArray::fromHex("03"));
        QCOMPARE(origins.slice(KeyType::Authentication).errorCode(), ErrorCode::TooShort);
        QCOMPARE(FingerprintArray(QByteArray(59, 0)).slice(KeyType::Authentication).errorCode(), ErrorCode::TooShort);
    }

    void testCapabilityFlags() {
        const uint8_t yubikey = 0x7D;
        QVERIFY(!hasCapability(yubikey, ExtendedCapability::SecureMessaging));
        QVERIFY(hasCapability(yubikey, ExtendedCapability::GetChallenge));
        QVERIFY(hasCapability(yubikey, ExtendedCapability::KeyImport));
        QVERIFY(!hasCapability(yubikey, ExtendedCapability::PSODecEncWithAES));
        QVERIFY(hasCapability(yubikey, ExtendedCapability::KDFSupported));
    }
};

QTEST_MAIN(TestTypes)
#include "test_types.moc"
