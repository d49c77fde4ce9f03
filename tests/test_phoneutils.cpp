/**
 * @file test_phoneutils.cpp
 * @brief Unit tests for the phone number helpers
 */

#include <QtTest/QtTest>
#include "backup/phoneutils.h"

class TestPhoneUtils : public QObject
{
    Q_OBJECT

private slots:
    void testExtractDigits_data();
    void testExtractDigits();

    void testTrailingDigits();
    void testTrailingDigitsShortInput();

    void testIsPhoneNumber_data();
    void testIsPhoneNumber();

    void testNormalizeToE164_data();
    void testNormalizeToE164();

    void testFormatsShareTrailingKey();
};

void TestPhoneUtils::testExtractDigits_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("formatted") << "(555) 123-4567" << "5551234567";
    QTest::newRow("dots") << "555.123.4567" << "5551234567";
    QTest::newRow("plus") << "+1 555 123 4567" << "15551234567";
    QTest::newRow("email") << "someone@example.com" << "";
    QTest::newRow("empty") << "" << "";
}

void TestPhoneUtils::testExtractDigits()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(PhoneUtils::extractDigits(input), expected);
}

void TestPhoneUtils::testTrailingDigits()
{
    QCOMPARE(PhoneUtils::trailingDigits("+1 (555) 123-4567"), QString("5551234567"));
    QCOMPARE(PhoneUtils::trailingDigits("+44 20 7946 0958"), QString("2079460958"));
    QCOMPARE(PhoneUtils::trailingDigits("5551234567", 4), QString("4567"));
}

void TestPhoneUtils::testTrailingDigitsShortInput()
{
    QCOMPARE(PhoneUtils::trailingDigits("12345"), QString("12345"));
    QCOMPARE(PhoneUtils::trailingDigits(""), QString());
}

void TestPhoneUtils::testIsPhoneNumber_data()
{
    QTest::addColumn<QString>("handle");
    QTest::addColumn<bool>("expected");

    QTest::newRow("us formatted") << "(555) 123-4567" << true;
    QTest::newRow("e164") << "+15551234567" << true;
    QTest::newRow("seven digits") << "1234567" << true;
    QTest::newRow("six digits") << "123456" << false;
    QTest::newRow("email") << "john@example.com" << false;
    QTest::newRow("email with digits") << "12345678@example.com" << false;
    QTest::newRow("empty") << "" << false;
}

void TestPhoneUtils::testIsPhoneNumber()
{
    QFETCH(QString, handle);
    QFETCH(bool, expected);
    QCOMPARE(PhoneUtils::isPhoneNumber(handle), expected);
}

void TestPhoneUtils::testNormalizeToE164_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("10 digit us") << "5551234567" << "+15551234567";
    QTest::newRow("11 digit us") << "15551234567" << "+15551234567";
    QTest::newRow("formatted") << "(555) 123-4567" << "+15551234567";
    QTest::newRow("spaces") << "+1 555 123 4567" << "+15551234567";
    QTest::newRow("dots") << "555.123.4567" << "+15551234567";
    QTest::newRow("international") << "+44 20 7946 0958" << "+442079460958";
    QTest::newRow("short") << "1234567" << "+1234567";
    QTest::newRow("empty") << "" << "+";
}

void TestPhoneUtils::testNormalizeToE164()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(PhoneUtils::normalizeToE164(input), expected);
}

void TestPhoneUtils::testFormatsShareTrailingKey()
{
    const QStringList formats = {
        "(555) 123-4567",
        "555-123-4567",
        "+1 555 123 4567",
        "15551234567",
        "5551234567"
    };

    for (const QString &format : formats) {
        const QString key = PhoneUtils::trailingDigits(PhoneUtils::normalizeToE164(format));
        QCOMPARE(key, QString("5551234567"));
    }
}

QTEST_MAIN(TestPhoneUtils)
#include "test_phoneutils.moc"
