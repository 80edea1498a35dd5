#include <QtTest>
#include <QSettings>
#include <QSignalSpy>

#include "models/serverconfig.h"
#include "services/appsettings.h"
#include "services/serverconfigstore.h"

class TestServerConfigStore : public QObject
{
    Q_OBJECT

private:
    ServerConfig makeConfig(const QString &name) const
    {
        ServerConfig config;
        config.name = name;
        config.address = "https://s3.us-east-1.amazonaws.com";
        config.accessKeyId = "AKID-" + name;
        config.secretAccessKey = "secret-" + name;
        config.bucket = name.toLower() + "-bucket";
        return config;
    }

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QCoreApplication::setOrganizationName("s3ui-tests");
        QCoreApplication::setApplicationName("test_serverconfigstore");
    }

    void init()
    {
        QSettings settings;
        settings.clear();
        settings.sync();
    }

    void testServerConfigValidation()
    {
        ServerConfig config = makeConfig("Main");
        QVERIFY(config.isValid());

        ServerConfig noBucket = config;
        noBucket.bucket.clear();
        QVERIFY(!noBucket.isValid());

        ServerConfig noSecret = config;
        noSecret.secretAccessKey.clear();
        QVERIFY(!noSecret.isValid());

        ServerConfig ftp = config;
        ftp.address = "ftp://files.example.com";
        QVERIFY(!ftp.isValid());

        ServerConfig noHost = config;
        noHost.address = "not a url";
        QVERIFY(!noHost.isValid());
    }

    void testServerConfigJsonOmitsEmptyOptionals()
    {
        ServerConfig config = makeConfig("Main");
        config.id = "abc";
        QJsonObject json = config.toJson();
        QVERIFY(!json.contains("region"));
        QVERIFY(!json.contains("cdnUrl"));

        config.region = "eu-central-1";
        config.cdnUrl = "https://cdn.example.com";
        ServerConfig restored = ServerConfig::fromJson(config.toJson());
        QCOMPARE(restored.id, QString("abc"));
        QCOMPARE(restored.region, QString("eu-central-1"));
        QCOMPARE(restored.cdnUrl, QString("https://cdn.example.com"));
        QCOMPARE(restored.secretAccessKey, config.secretAccessKey);
    }

    void testUpsertAssignsIdAndPersists()
    {
        QString id;
        {
            ServerConfigStore store;
            QCOMPARE(store.count(), 0);
            QSignalSpy changedSpy(&store, &ServerConfigStore::configsChanged);

            id = store.upsert(makeConfig("Main"));
            QVERIFY(!id.isEmpty());
            QCOMPARE(changedSpy.count(), 1);
        }

        ServerConfigStore reloaded;
        QCOMPARE(reloaded.count(), 1);
        QCOMPARE(reloaded.configs().first().id, id);
        QCOMPARE(reloaded.configs().first().bucket, QString("main-bucket"));
    }

    void testUpsertReplacesSameId()
    {
        ServerConfigStore store;
        QString id = store.upsert(makeConfig("Main"));

        ServerConfig changed = *store.find(id);
        changed.bucket = "renamed";
        QCOMPARE(store.upsert(changed), id);

        QCOMPARE(store.count(), 1);
        QCOMPARE(store.find(id)->bucket, QString("renamed"));
    }

    void testFindByIdOrName()
    {
        ServerConfigStore store;
        QString mainId = store.upsert(makeConfig("Main"));
        store.upsert(makeConfig("Backup"));

        QCOMPARE(store.find(mainId)->name, QString("Main"));
        QCOMPARE(store.find("Backup")->bucket, QString("backup-bucket"));
        QVERIFY(!store.find("Nope").has_value());
    }

    void testRemove()
    {
        ServerConfigStore store;
        store.upsert(makeConfig("Main"));
        store.upsert(makeConfig("Backup"));

        QVERIFY(store.remove("Main"));
        QVERIFY(!store.remove("Main"));
        QCOMPARE(store.count(), 1);

        ServerConfigStore reloaded;
        QCOMPARE(reloaded.count(), 1);
        QCOMPARE(reloaded.configs().first().name, QString("Backup"));
    }

    void testLoadSkipsCorruptEntries()
    {
        ServerConfig good = makeConfig("Good");
        good.id = "good-id";
        {
            QSettings settings;
            settings.setValue("servers/configs", QStringList{
                "{not json",
                QString::fromUtf8(QJsonDocument(good.toJson()).toJson(QJsonDocument::Compact)),
                "[1, 2, 3]"
            });
        }

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("ServerConfigStore: skipping.*"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("ServerConfigStore: skipping.*"));
        ServerConfigStore store;
        QCOMPARE(store.count(), 1);
        QCOMPARE(store.configs().first().id, QString("good-id"));
    }

    void testAppSettingsDefaultsAndPersistence()
    {
        {
            AppSettings settings;
            QCOMPARE(settings.language(), QString("en"));
            QCOMPARE(settings.theme(), QString("system"));
            QVERIFY(settings.downloadDirectory().isEmpty());
            QVERIFY(settings.activeProfileId().isEmpty());

            QSignalSpy changedSpy(&settings, &AppSettings::settingsChanged);
            settings.setDownloadDirectory("/tmp/s3ui-downloads");
            settings.setDownloadDirectory("/tmp/s3ui-downloads");
            settings.setActiveProfileId("profile-7");
            settings.setTheme("dark");
            QCOMPARE(changedSpy.count(), 3);
            settings.save();
        }

        AppSettings reloaded;
        QCOMPARE(reloaded.downloadDirectory(), QString("/tmp/s3ui-downloads"));
        QCOMPARE(reloaded.activeProfileId(), QString("profile-7"));
        QCOMPARE(reloaded.theme(), QString("dark"));
    }
};

QTEST_MAIN(TestServerConfigStore)
#include "test_serverconfigstore.moc"
