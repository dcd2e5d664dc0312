/**
 * Unit tests for APDU::Response
 */

#include <QTest>
#include <QDebug>
#include "pgpcard-qt/apdu/response.h"

using namespace PgpCard;

class TestAPDUResponse : public QObject {
    Q_OBJECT
    
private slots:
    void testSuccessResponse() {
        // Test: Response with SW=0x9000 (success)
        APDU::Response resp(QByteArray::fromHex("9000"));
        
        QCOMPARE(resp.sw(), (uint16_t)0x9000);
        QVERIFY(resp.isOK());
        QVERIFY(!resp.hasMoreData());
        QVERIFY(resp.data().isEmpty());
        QCOMPARE(resp.errorMessage(), QString("Success"));
    }
    
    void testResponseWithData() {
        // Test: Response with data + SW
        APDU::Response resp(QByteArray::fromHex("AABBCCDD9000"));
        
        QVERIFY(resp.isOK());
        QCOMPARE(resp.data(), QByteArray::fromHex("AABBCCDD"));
    }
    
    void testErrorResponse() {
        // Referenced data not found (e.g. GET DATA of an absent DO)
        APDU::Response resp(QByteArray::fromHex("6A88"));
        
        QCOMPARE(resp.sw(), (uint16_t)0x6A88);
        QVERIFY(!resp.isOK());
        QVERIFY(resp.data().isEmpty());
        QCOMPARE(resp.errorMessage(), QString("Referenced data not found"));
    }

    void testApplicationNotFound() {
        APDU::Response resp(QByteArray::fromHex("6A82"));
        QCOMPARE(resp.errorMessage(), QString("File or application not found"));
    }
    
    void testMoreDataAvailable() {
        APDU::Response resp(QByteArray::fromHex("AABB6110"));
        
        QVERIFY(!resp.isOK());
        QVERIFY(resp.hasMoreData());
        QCOMPARE(resp.remainingBytes(), 16);
        QCOMPARE(resp.data(), QByteArray::fromHex("AABB"));
        QCOMPARE(resp.errorMessage(), QString("More data available: 16 bytes"));

        APDU::Response unknown(QByteArray::fromHex("6100"));
        QCOMPARE(unknown.remainingBytes(), 0);
        
        APDU::Response ok(QByteArray::fromHex("9000"));
        QCOMPARE(ok.remainingBytes(), -1);
    }
    
    void testStatusWordMessages_data() {
        QTest::addColumn<QByteArray>("raw");
        QTest::addColumn<QString>("message");

        QTest::newRow("termination state") << QByteArray::fromHex("6285") << QString("Selected file in termination state");
        QTest::newRow("wrong length") << QByteArray::fromHex("6700") << QString("Wrong length");
        QTest::newRow("chaining") << QByteArray::fromHex("6884") << QString("Command chaining not supported");
        QTest::newRow("security") << QByteArray::fromHex("6982") << QString("Security condition not satisfied");
        QTest::newRow("conditions") << QByteArray::fromHex("6985") << QString("Conditions not satisfied");
        QTest::newRow("p1p2") << QByteArray::fromHex("6B00") << QString("Wrong parameters P1-P2");
        QTest::newRow("ins") << QByteArray::fromHex("6D00") << QString("Instruction not supported");
        QTest::newRow("cla") << QByteArray::fromHex("6E00") << QString("Class not supported");
        QTest::newRow("no diagnosis") << QByteArray::fromHex("6F00") << QString("No precise diagnosis");
        // Retry counters belong to PIN verification, which is not decoded here
        QTest::newRow("retry counter") << QByteArray::fromHex("63C2") << QString("Unknown error: 0x63c2");
    }

    void testStatusWordMessages() {
        QFETCH(QByteArray, raw);
        QFETCH(QString, message);

        APDU::Response resp(raw);
        QVERIFY(!resp.isOK());
        QCOMPARE(resp.errorMessage(), message);
    }

    void testStatusConstants() {
        QCOMPARE(APDU::Response(QByteArray::fromHex("9000")).sw(), APDU::SW_OK);
        QCOMPARE(APDU::Response(QByteArray::fromHex("6A88")).sw(), APDU::SW_REFERENCED_DATA_NOT_FOUND);
        QCOMPARE(APDU::Response(QByteArray()).sw(), APDU::SW_NO_PRECISE_DIAGNOSIS);
        QVERIFY(APDU::Response(QByteArray::fromHex("61FF")).hasMoreData());
        QVERIFY(!APDU::Response(QByteArray::fromHex("6281")).hasMoreData());
    }

    void testUnknownStatus() {
        APDU::Response resp(QByteArray::fromHex("6FAB"));
        QCOMPARE(resp.errorMessage(), QString("Unknown error: 0x6fab"));
    }
    
    void testInvalidResponse() {
        // Test: Response too short (< 2 bytes)
        APDU::Response resp(QByteArray::fromHex("90"));
        
        QVERIFY(!resp.isOK());
        QCOMPARE(resp.sw(), (uint16_t)0x6F00);
        QVERIFY(resp.data().isEmpty());
    }

    void testSetDataReplacesPrevious() {
        APDU::Response resp(QByteArray::fromHex("AABB6102"));
        resp.setData(QByteArray::fromHex("9000"));
        QVERIFY(resp.isOK());
        QVERIFY(resp.data().isEmpty());
    }
};

QTEST_MAIN(TestAPDUResponse)
#include "test_apdu_response.moc"
