#include <QtTest>
#include <QSignalSpy>

#include "services/r2storageclient.h"
#include "services/s3storageclient.h"
#include "services/storageclientfactory.h"

class TestS3StorageClient : public QObject
{
    Q_OBJECT

private:
    ServerConfig makeConfig(const QString &address, const QString &cdnUrl = QString()) const
    {
        ServerConfig config;
        config.id = "profile-1";
        config.name = "Test";
        config.address = address;
        config.accessKeyId = "AKIDEXAMPLE";
        config.secretAccessKey = "secret";
        config.bucket = "media";
        config.cdnUrl = cdnUrl;
        return config;
    }

private slots:
    void init();

    // Listing XML
    void testParseListingFoldersThenObjects();
    void testParseListingContinuationToken();
    void testParseListingRejectsOtherDocuments();

    // Error classification
    void testClassifyTransportErrors();
    void testClassifyS3ErrorBody();
    void testClassifyUnparsedBody();

    // Addressing
    void testPathStyleForCustomEndpoint();
    void testVirtualHostStyleForAws();
    void testObjectUrlEncodesKeyAndQuery();
    void testGetFileUrl();

    // Backends
    void testR2Detection();
    void testFactoryPicksBackend();

    void testUnreadableSourceFailsAsynchronously();
};

void TestS3StorageClient::init()
{
    qRegisterMetaType<StorageError>();
}

void TestS3StorageClient::testParseListingFoldersThenObjects()
{
    QByteArray xml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<Name>media</Name><Prefix>photos/</Prefix><KeyCount>3</KeyCount>"
        "<MaxKeys>1000</MaxKeys><Delimiter>/</Delimiter><IsTruncated>false</IsTruncated>"
        "<Contents><Key>photos/cat.jpg</Key>"
        "<LastModified>2024-03-01T12:30:00.000Z</LastModified>"
        "<ETag>&quot;9b2cf535f27731c974343645a3985328&quot;</ETag>"
        "<Size>2048</Size><StorageClass>STANDARD</StorageClass></Contents>"
        "<CommonPrefixes><Prefix>photos/2023/</Prefix></CommonPrefixes>"
        "<CommonPrefixes><Prefix>photos/2024/</Prefix></CommonPrefixes>"
        "</ListBucketResult>";

    QList<StorageEntry> entries;
    QString token = "stale";
    QVERIFY(S3StorageClient::parseListObjectsResponse(xml, &entries, &token));
    QVERIFY(token.isEmpty());

    QCOMPARE(entries.size(), 3);
    QVERIFY(entries[0].isDirectory);
    QCOMPARE(entries[0].key, QString("photos/2023/"));
    QCOMPARE(entries[0].name(), QString("2023"));
    QCOMPARE(entries[1].key, QString("photos/2024/"));

    const StorageEntry &cat = entries[2];
    QVERIFY(!cat.isDirectory);
    QCOMPARE(cat.key, QString("photos/cat.jpg"));
    QCOMPARE(cat.name(), QString("cat.jpg"));
    QCOMPARE(cat.size, qint64(2048));
    QCOMPARE(cat.eTag, QString("9b2cf535f27731c974343645a3985328"));
    QCOMPARE(cat.lastModified.date(), QDate(2024, 3, 1));
}

void TestS3StorageClient::testParseListingContinuationToken()
{
    QByteArray xml =
        "<ListBucketResult><IsTruncated>true</IsTruncated>"
        "<NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>"
        "<Contents><Key>a.txt</Key><Size>1</Size></Contents>"
        "</ListBucketResult>";

    QList<StorageEntry> entries;
    QString token;
    QVERIFY(S3StorageClient::parseListObjectsResponse(xml, &entries, &token));
    QCOMPARE(token, QString("1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM="));
    QCOMPARE(entries.size(), 1);
}

void TestS3StorageClient::testParseListingRejectsOtherDocuments()
{
    QList<StorageEntry> entries;
    QString token;
    QVERIFY(!S3StorageClient::parseListObjectsResponse(
        "<Error><Code>AccessDenied</Code></Error>", &entries, &token));
    QVERIFY(!S3StorageClient::parseListObjectsResponse("<ListBucketResult><Contents>",
                                                       &entries, &token));
}

void TestS3StorageClient::testClassifyTransportErrors()
{
    StorageError refused = S3StorageClient::classifyReply(
        QNetworkReply::ConnectionRefusedError, 0, QByteArray(), "Connection refused");
    QCOMPARE(refused.kind, StorageError::Kind::Transport);
    QCOMPARE(refused.message, QString("Connection refused"));

    StorageError timeout = S3StorageClient::classifyReply(
        QNetworkReply::OperationCanceledError, 0, QByteArray(), "Operation canceled");
    QCOMPARE(timeout.kind, StorageError::Kind::Transport);

    StorageError dns = S3StorageClient::classifyReply(
        QNetworkReply::HostNotFoundError, 0, QByteArray(), "Host nowhere.invalid not found");
    QCOMPARE(dns.kind, StorageError::Kind::Transport);
}

void TestS3StorageClient::testClassifyS3ErrorBody()
{
    QByteArray body =
        "<Error><Code>SignatureDoesNotMatch</Code>"
        "<Message>The request signature we calculated does not match the signature you provided.</Message>"
        "</Error>";

    StorageError error = S3StorageClient::classifyReply(
        QNetworkReply::ContentAccessDenied, 403, body, "Forbidden");
    QCOMPARE(error.kind, StorageError::Kind::Authorization);
    QCOMPARE(error.message,
             QString("SignatureDoesNotMatch: The request signature we calculated does not "
                     "match the signature you provided. (HTTP 403)"));

    StorageError missing = S3StorageClient::classifyReply(
        QNetworkReply::ContentNotFoundError, 404,
        "<Error><Code>NoSuchBucket</Code><Message>The specified bucket does not exist</Message></Error>",
        "Not Found");
    QCOMPARE(missing.kind, StorageError::Kind::NotFound);
}

void TestS3StorageClient::testClassifyUnparsedBody()
{
    QByteArray body = QByteArray("<html>") + QByteArray(500, 'x') + "</html>";
    StorageError error = S3StorageClient::classifyReply(
        QNetworkReply::InternalServerError, 502, body, "Bad Gateway");

    QCOMPARE(error.kind, StorageError::Kind::Unknown);
    QVERIFY(error.message.startsWith("Bad Gateway - Response: <html>"));
    QVERIFY(error.message.endsWith("(HTTP 502)"));
    QVERIFY(error.message.size() < 260);
}

void TestS3StorageClient::testPathStyleForCustomEndpoint()
{
    S3StorageClient client(makeConfig("http://localhost:9000"));
    QVERIFY(client.usesPathStyle());
    QCOMPARE(client.region(), QString("us-east-1"));
    QCOMPARE(client.objectUrl("docs/a.txt").toString(),
             QString("http://localhost:9000/media/docs/a.txt"));
    QCOMPARE(client.objectUrl(QString()).toString(), QString("http://localhost:9000/media"));
}

void TestS3StorageClient::testVirtualHostStyleForAws()
{
    ServerConfig config = makeConfig("https://s3.eu-west-1.amazonaws.com");
    config.region = "eu-west-1";
    S3StorageClient client(config);

    QVERIFY(!client.usesPathStyle());
    QCOMPARE(client.region(), QString("eu-west-1"));
    QCOMPARE(client.objectUrl("docs/a.txt").toString(),
             QString("https://media.s3.eu-west-1.amazonaws.com/docs/a.txt"));
}

void TestS3StorageClient::testObjectUrlEncodesKeyAndQuery()
{
    S3StorageClient client(makeConfig("http://localhost:9000"));
    QUrl url = client.objectUrl(QString(), {{"list-type", "2"}, {"prefix", "my docs/"}});

    QCOMPARE(QString::fromLatin1(url.toEncoded()),
             QString("http://localhost:9000/media?list-type=2&prefix=my%20docs%2F"));
    QCOMPARE(QString::fromLatin1(client.objectUrl("a b+c.txt").toEncoded()),
             QString("http://localhost:9000/media/a%20b%2Bc.txt"));
}

void TestS3StorageClient::testGetFileUrl()
{
    // Path style: the bucket is part of the path
    S3StorageClient plain(makeConfig("https://storage.example.com/"));
    QCOMPARE(plain.getFileUrl("uploads/a.txt"),
             QString("https://storage.example.com/media/uploads/a.txt"));
    QCOMPARE(plain.getFileUrl("uploads/my file.txt"),
             QString("https://storage.example.com/media/uploads/my%20file.txt"));

    // Virtual-host style: the bucket is part of the host
    ServerConfig aws = makeConfig("https://s3.eu-west-1.amazonaws.com");
    aws.region = "eu-west-1";
    S3StorageClient virtualHost(aws);
    QCOMPARE(virtualHost.getFileUrl("uploads/a.txt"),
             QString("https://media.s3.eu-west-1.amazonaws.com/uploads/a.txt"));

    S3StorageClient cdn(makeConfig("https://storage.example.com", "https://cdn.example.com//"));
    QCOMPARE(cdn.getFileUrl("uploads/a.txt"), QString("https://cdn.example.com/uploads/a.txt"));
    QCOMPARE(cdn.getFileUrl("uploads/a b.txt"), QString("https://cdn.example.com/uploads/a%20b.txt"));
}

void TestS3StorageClient::testR2Detection()
{
    const QString address = "https://0123456789abcdef.r2.cloudflarestorage.com";
    QVERIFY(R2StorageClient::isR2Endpoint(address));
    QVERIFY(!R2StorageClient::isR2Endpoint("https://s3.amazonaws.com"));
    QVERIFY(!R2StorageClient::isR2Endpoint("https://r2.cloudflarestorage.com.evil.example"));

    ServerConfig config = makeConfig(address);
    config.region = "us-east-1";
    R2StorageClient client(config);
    QVERIFY(client.usesPathStyle());
    QCOMPARE(client.region(), QString("auto"));
    QCOMPARE(client.objectUrl("x.txt").toString(), address + "/media/x.txt");
}

void TestS3StorageClient::testFactoryPicksBackend()
{
    ServerConfig r2 = makeConfig("https://acct.r2.cloudflarestorage.com");
    ServerConfig minio = makeConfig("http://minio.local:9000");

    QCOMPARE(StorageClientFactory::backendFor(r2), StorageClientFactory::Backend::R2);
    QCOMPARE(StorageClientFactory::backendFor(minio), StorageClientFactory::Backend::S3);

    QObject owner;
    IStorageClient *client = StorageClientFactory::create(r2, &owner);
    QVERIFY(qobject_cast<R2StorageClient *>(client) != nullptr);
    QCOMPARE(client->parent(), &owner);
    QCOMPARE(client->bucketName(), QString("media"));
    QCOMPARE(client->id(), QString("profile-1"));

    IStorageClient *generic = StorageClientFactory::create(minio, &owner);
    QVERIFY(qobject_cast<R2StorageClient *>(generic) == nullptr);
    QVERIFY(qobject_cast<S3StorageClient *>(generic) != nullptr);
}

void TestS3StorageClient::testUnreadableSourceFailsAsynchronously()
{
    S3StorageClient client(makeConfig("http://localhost:9000"));
    QBuffer closed;  // Never opened

    StorageReply *reply = client.uploadStream("a.txt", &closed, 0);
    QVERIFY(!reply->isFinished());

    QSignalSpy finishedSpy(reply, &StorageReply::finished);
    QVERIFY(finishedSpy.wait(1000));
    QVERIFY(reply->hasError());
    QCOMPARE(reply->error().kind, StorageError::Kind::LocalFilesystem);
    reply->deleteLater();
}

QTEST_MAIN(TestS3StorageClient)
#include "test_s3storageclient.moc"
