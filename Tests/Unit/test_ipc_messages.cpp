#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QtEndian>
#include "core/ipc/message.h"
#include "core/shared/ipc_messages.h"

#include <cstring>

using Status = hr::IpcMessage::DecodeResult::Status;

class TestIpcMessages : public QObject {
    Q_OBJECT

private slots:
    // ── Encode/Decode ────────────────────────────────────────────
    void testEncodeDecodeRequest();
    void testEncodeDecodeError();
    void testEncodeDecodeNotification();

    // ── Message structure ────────────────────────────────────────
    void testMakeRequestEmptyParams();
    void testMakeErrorStructure();
    void testErrorCodeStrings();
    void testRequestIdMissing();

    // ── Decode edge cases ────────────────────────────────────────
    void testDecodeShortHeaderIsIncomplete();
    void testDecodePartialMessageIsIncomplete();
    void testDecodeMultipleMessagesConsumesOnlyFirst();
    void testDecodeRejectsOversizedLength();
    void testDecodeInvalidJsonConsumesFrame();
    void testDecodeNonObjectRootIsMalformed();

    // ── Unicode content ──────────────────────────────────────────
    void testUnicodeContentSurvives();

private:
    static QByteArray frame(const QByteArray& payload);
};

QByteArray TestIpcMessages::frame(const QByteArray& payload)
{
    QByteArray buf(4, '\0');
    const quint32 len = qToBigEndian(static_cast<quint32>(payload.size()));
    std::memcpy(buf.data(), &len, 4);
    buf.append(payload);
    return buf;
}

// ── Encode/Decode ────────────────────────────────────────────────

void TestIpcMessages::testEncodeDecodeRequest()
{
    auto req = hr::IpcMessage::makeRequest(42, QStringLiteral("query"),
        QJsonObject{{QStringLiteral("question"), QStringLiteral("hello")}});
    const QByteArray encoded = hr::IpcMessage::encode(req);
    QVERIFY(!encoded.isEmpty());

    const auto decoded = hr::IpcMessage::decode(encoded);
    QCOMPARE(decoded.status, Status::Complete);
    QCOMPARE(decoded.bytesConsumed, static_cast<int>(encoded.size()));
    QCOMPARE(decoded.json[QStringLiteral("type")].toString(), QStringLiteral("request"));
    QCOMPARE(decoded.json[QStringLiteral("id")].toInteger(), 42);
    QCOMPARE(decoded.json[QStringLiteral("method")].toString(), QStringLiteral("query"));
    QCOMPARE(decoded.json[QStringLiteral("params")].toObject()[QStringLiteral("question")].toString(),
             QStringLiteral("hello"));
}

void TestIpcMessages::testEncodeDecodeError()
{
    auto err = hr::IpcMessage::makeError(
        7, hr::IpcErrorCode::NotFound, QStringLiteral("Unknown method: foo"));
    const auto decoded = hr::IpcMessage::decode(hr::IpcMessage::encode(err));

    QCOMPARE(decoded.status, Status::Complete);
    QCOMPARE(decoded.json[QStringLiteral("type")].toString(), QStringLiteral("error"));
    const QJsonObject errObj = decoded.json[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(), static_cast<int>(hr::IpcErrorCode::NotFound));
    QCOMPARE(errObj[QStringLiteral("message")].toString(), QStringLiteral("Unknown method: foo"));
}

void TestIpcMessages::testEncodeDecodeNotification()
{
    auto notif = hr::IpcMessage::makeNotification(
        QStringLiteral("index_updated"), QJsonObject{{QStringLiteral("indexed"), 3}});
    const auto decoded = hr::IpcMessage::decode(hr::IpcMessage::encode(notif));

    QCOMPARE(decoded.status, Status::Complete);
    QCOMPARE(decoded.json[QStringLiteral("type")].toString(), QStringLiteral("notification"));
    QVERIFY(!decoded.json.contains(QStringLiteral("id")));
}

// ── Message structure ────────────────────────────────────────────

void TestIpcMessages::testMakeRequestEmptyParams()
{
    auto req = hr::IpcMessage::makeRequest(1, QStringLiteral("ping"));
    QVERIFY(!req.contains(QStringLiteral("params")));
}

void TestIpcMessages::testMakeErrorStructure()
{
    auto err = hr::IpcMessage::makeError(
        3, hr::IpcErrorCode::InvalidParams, QStringLiteral("Unknown search_mode: bm25_only"));
    QCOMPARE(err[QStringLiteral("id")].toInteger(), 3);

    const QJsonObject errObj = err[QStringLiteral("error")].toObject();
    QCOMPARE(errObj[QStringLiteral("code")].toInt(), 1);
    QCOMPARE(errObj[QStringLiteral("codeString")].toString(), QStringLiteral("INVALID_PARAMS"));
}

void TestIpcMessages::testErrorCodeStrings()
{
    QCOMPARE(hr::ipcErrorCodeToString(hr::IpcErrorCode::NotFound), QStringLiteral("NOT_FOUND"));
    QCOMPARE(hr::ipcErrorCodeToString(hr::IpcErrorCode::ServiceUnavailable),
             QStringLiteral("SERVICE_UNAVAILABLE"));
    QCOMPARE(hr::ipcErrorCodeToString(hr::IpcErrorCode::Timeout), QStringLiteral("TIMEOUT"));
}

void TestIpcMessages::testRequestIdMissing()
{
    QCOMPARE(hr::IpcMessage::requestId(QJsonObject{}), uint64_t{0});
    QCOMPARE(hr::IpcMessage::requestId(hr::IpcMessage::makeRequest(77, QStringLiteral("x"))),
             uint64_t{77});
}

// ── Decode edge cases ────────────────────────────────────────────

void TestIpcMessages::testDecodeShortHeaderIsIncomplete()
{
    QByteArray buf;
    buf.append('\x00');
    buf.append('\x00');
    const auto result = hr::IpcMessage::decode(buf);
    QCOMPARE(result.status, Status::Incomplete);
    QCOMPARE(result.bytesConsumed, 0);

    QCOMPARE(hr::IpcMessage::decode(QByteArray()).status, Status::Incomplete);
}

void TestIpcMessages::testDecodePartialMessageIsIncomplete()
{
    const QByteArray encoded = hr::IpcMessage::encode(
        hr::IpcMessage::makeRequest(1, QStringLiteral("health")));
    const QByteArray partial = encoded.left(4 + (encoded.size() - 4) / 2);
    QCOMPARE(hr::IpcMessage::decode(partial).status, Status::Incomplete);
}

void TestIpcMessages::testDecodeMultipleMessagesConsumesOnlyFirst()
{
    QByteArray combined = hr::IpcMessage::encode(
        hr::IpcMessage::makeRequest(1, QStringLiteral("first")));
    combined.append(hr::IpcMessage::encode(
        hr::IpcMessage::makeRequest(2, QStringLiteral("second"))));

    const auto first = hr::IpcMessage::decode(combined);
    QCOMPARE(first.status, Status::Complete);
    QCOMPARE(first.json[QStringLiteral("method")].toString(), QStringLiteral("first"));
    QVERIFY(first.bytesConsumed < combined.size());

    const auto second = hr::IpcMessage::decode(combined.mid(first.bytesConsumed));
    QCOMPARE(second.status, Status::Complete);
    QCOMPARE(second.json[QStringLiteral("method")].toString(), QStringLiteral("second"));
}

void TestIpcMessages::testDecodeRejectsOversizedLength()
{
    QByteArray buf(4, '\0');
    const quint32 hugeLen = qToBigEndian(static_cast<quint32>(20 * 1024 * 1024));
    std::memcpy(buf.data(), &hugeLen, 4);
    buf.append(QByteArray(100, 'x'));

    const auto result = hr::IpcMessage::decode(buf);
    QCOMPARE(result.status, Status::Malformed);
    QCOMPARE(result.bytesConsumed, static_cast<int>(buf.size()));
}

void TestIpcMessages::testDecodeInvalidJsonConsumesFrame()
{
    QByteArray buf = frame(QByteArrayLiteral("{not json"));
    const int badFrameSize = static_cast<int>(buf.size());
    buf.append(hr::IpcMessage::encode(hr::IpcMessage::makeRequest(5, QStringLiteral("ping"))));

    const auto bad = hr::IpcMessage::decode(buf);
    QCOMPARE(bad.status, Status::Malformed);
    QCOMPARE(bad.bytesConsumed, badFrameSize);

    const auto next = hr::IpcMessage::decode(buf.mid(bad.bytesConsumed));
    QCOMPARE(next.status, Status::Complete);
    QCOMPARE(next.json[QStringLiteral("method")].toString(), QStringLiteral("ping"));
}

void TestIpcMessages::testDecodeNonObjectRootIsMalformed()
{
    const auto result = hr::IpcMessage::decode(frame(QByteArrayLiteral("[1,2,3]")));
    QCOMPARE(result.status, Status::Malformed);
}

// ── Unicode content ──────────────────────────────────────────────

void TestIpcMessages::testUnicodeContentSurvives()
{
    const QString question = QString::fromUtf8("\xC3\xA9\xC3\xA0\xC3\xBC \xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e");
    auto req = hr::IpcMessage::makeRequest(1, QStringLiteral("query"),
        QJsonObject{{QStringLiteral("question"), question}});
    const auto decoded = hr::IpcMessage::decode(hr::IpcMessage::encode(req));

    QCOMPARE(decoded.status, Status::Complete);
    QCOMPARE(decoded.json[QStringLiteral("params")].toObject()[QStringLiteral("question")].toString(),
             question);
}

QTEST_MAIN(TestIpcMessages)
#include "test_ipc_messages.moc"
