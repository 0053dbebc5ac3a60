#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/ipc/service_base.h"
#include "core/ipc/socket_server.h"
#include "ipc_test_utils.h"

#include <QDir>
#include <QLocalSocket>
#include <QTemporaryDir>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadPrevious(qEnvironmentVariableIsSet(key))
        , m_previous(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadPrevious) {
            qputenv(m_key, m_previous);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadPrevious = false;
    QByteArray m_previous;
};

class EchoService final : public hr::ServiceBase {
public:
    explicit EchoService(const QString& serviceName)
        : hr::ServiceBase(serviceName)
    {
    }

    QJsonObject dispatch(const QJsonObject& request)
    {
        return handleRequest(request);
    }

protected:
    QJsonObject handleRequest(const QJsonObject& request) override
    {
        if (request.value(QStringLiteral("method")).toString() == QLatin1String("echo")) {
            return hr::IpcMessage::makeResponse(hr::IpcMessage::requestId(request),
                                                request.value(QStringLiteral("params")).toObject());
        }
        return hr::ServiceBase::handleRequest(request);
    }
};

} // namespace

class TestServiceBase : public QObject {
    Q_OBJECT

private slots:
    void testRuntimeDirectoryOverride();
    void testHandlePingRequest();
    void testUnknownMethodReturnsNotFoundError();
    void testSocketRoundTrip();
};

void TestServiceBase::testRuntimeDirectoryOverride()
{
    const QByteArray runtimeRaw = "/tmp/hr-runtime/./nested/..";
    ScopedEnvVar runtimeEnv("HYBRIDRAG_RUNTIME_DIR", runtimeRaw);

    const QString runtime = QDir::cleanPath(QString::fromUtf8(runtimeRaw));
    QCOMPARE(hr::ServiceBase::runtimeDirectory(), runtime);
    QCOMPARE(hr::ServiceBase::socketPath(QStringLiteral("rag")),
             runtime + QStringLiteral("/rag.sock"));
}

void TestServiceBase::testHandlePingRequest()
{
    EchoService service(QStringLiteral("service-base-unit"));
    const QJsonObject response = service.dispatch(hr::IpcMessage::makeRequest(11, QStringLiteral("ping")));

    QVERIFY(hr::test::isResponse(response));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 11);

    const QJsonObject result = hr::test::resultPayload(response);
    QCOMPARE(result.value(QStringLiteral("pong")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("service")).toString(), QStringLiteral("service-base-unit"));
    QVERIFY(result.value(QStringLiteral("timestamp")).toInteger() > 0);
}

void TestServiceBase::testUnknownMethodReturnsNotFoundError()
{
    EchoService service(QStringLiteral("service-base-unit"));
    const QJsonObject response =
        service.dispatch(hr::IpcMessage::makeRequest(27, QStringLiteral("unknown.method")));

    QVERIFY(hr::test::isError(response));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 27);

    const QJsonObject error = hr::test::errorPayload(response);
    QCOMPARE(hr::test::errorCode(response), static_cast<int>(hr::IpcErrorCode::NotFound));
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(),
             hr::ipcErrorCodeToString(hr::IpcErrorCode::NotFound));
    QVERIFY(error.value(QStringLiteral("message")).toString().contains(QStringLiteral("unknown.method")));
}

void TestServiceBase::testSocketRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/echo.sock");

    hr::SocketServer server;
    server.setRequestHandler([](const QJsonObject& request) {
        return hr::IpcMessage::makeResponse(hr::IpcMessage::requestId(request),
                                            request.value(QStringLiteral("params")).toObject());
    });
    QVERIFY(server.listen(path));
    QVERIFY(server.isListening());

    QLocalSocket client;
    client.connectToServer(path);
    QVERIFY(client.waitForConnected(2000));

    QJsonObject params;
    params[QStringLiteral("question")] = QStringLiteral("round trip");
    client.write(hr::IpcMessage::encode(hr::IpcMessage::makeRequest(5, QStringLiteral("echo"), params)));
    QVERIFY(client.waitForBytesWritten(2000));

    QByteArray buffer;
    auto frameArrived = [&]() {
        buffer += client.readAll();
        return hr::IpcMessage::decode(buffer).status
            == hr::IpcMessage::DecodeResult::Status::Complete;
    };
    QTRY_VERIFY_WITH_TIMEOUT(frameArrived(), 3000);

    const hr::IpcMessage::DecodeResult decoded = hr::IpcMessage::decode(buffer);
    QVERIFY(hr::test::isResponse(decoded.json));
    QCOMPARE(hr::IpcMessage::requestId(decoded.json), uint64_t{5});
    QCOMPARE(hr::test::resultPayload(decoded.json).value(QStringLiteral("question")).toString(),
             QStringLiteral("round trip"));

    client.disconnectFromServer();
    server.close();
}

QTEST_MAIN(TestServiceBase)
#include "test_service_base.moc"
