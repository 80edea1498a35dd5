#include <QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>

#include "mocks/mockstorageclient.h"
#include "models/uploadqueue.h"

class TestUploadQueue : public QObject
{
    Q_OBJECT

private:
    MockStorageClient *mock = nullptr;
    UploadQueue *queue = nullptr;
    QTemporaryDir *tempDir = nullptr;
    QStringList completedKeys;

    QString createFile(const QString &name, const QByteArray &content)
    {
        QString path = tempDir->filePath(name);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(content);
        file.close();
        return path;
    }

    // Runs the deferred drain loop and completes mock operations until idle
    void flushAndProcess()
    {
        int iterations = 0;
        const int kMaxIterations = 100;

        while (iterations++ < kMaxIterations) {
            queue->flushEventQueue();
            if (mock->mockPendingOperationCount() == 0) {
                break;
            }
            mock->mockProcessAllOperations();
        }
        queue->flushEventQueue();
    }

    void flushAndProcessNext()
    {
        queue->flushEventQueue();
        mock->mockProcessNextOperation();
        queue->flushEventQueue();
    }

    TransferItem::Status statusAt(int row) const
    {
        return queue->items().at(row).status;
    }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        completedKeys.clear();
        mock = new MockStorageClient(this);
        queue = new UploadQueue(mock, [this](const TransferItem &item) {
            completedKeys.append(item.key);
        }, this);
    }

    void cleanup()
    {
        delete queue;
        delete mock;
        delete tempDir;
        queue = nullptr;
        mock = nullptr;
        tempDir = nullptr;
    }

    void testAddToQueueCreatesPendingItems()
    {
        QString a = createFile("a.txt", "alpha");
        QString b = createFile("b.txt", "bravo!");
        QSignalSpy changedSpy(queue, &UploadQueue::queueChanged);

        QStringList ids = queue->addToQueue({a, b}, "uploads/");

        QCOMPARE(ids.size(), 2);
        QVERIFY(changedSpy.count() >= 1);

        const QList<TransferItem> items = queue->items();
        QCOMPARE(items.size(), 2);
        QCOMPARE(items[0].id, ids[0]);
        QCOMPARE(items[0].key, QString("uploads/a.txt"));
        QCOMPARE(items[0].fileName, QString("a.txt"));
        QCOMPARE(items[0].localPath, a);
        QCOMPARE(items[0].status, TransferItem::Status::Pending);
        QCOMPARE(items[0].progress, 0.0);
        QVERIFY(items[0].size.has_value());
        QCOMPARE(*items[0].size, qint64(5));
        QCOMPARE(items[1].key, QString("uploads/b.txt"));
        QCOMPARE(items[1].direction, TransferDirection::Upload);

        // Nothing starts until the event loop runs
        QCOMPARE(mock->mockGetUploadRequests().size(), 0);
    }

    void testEmptyPrefixUsesFileName()
    {
        QString a = createFile("a.txt", "alpha");
        queue->addToQueue({a}, QString());
        QCOMPARE(queue->items().first().key, QString("a.txt"));
        QCOMPARE(UploadQueue::objectKey("", "x.bin"), QString("x.bin"));
        QCOMPARE(UploadQueue::objectKey("docs/", "x.bin"), QString("docs/x.bin"));
    }

    void testFifoOrderAndSingleActive()
    {
        QString a = createFile("a.txt", "1");
        QString b = createFile("b.txt", "2");
        QString c = createFile("c.txt", "3");
        queue->addToQueue({a, b, c}, "q/");

        queue->flushEventQueue();
        QCOMPARE(statusAt(0), TransferItem::Status::Active);
        QCOMPARE(statusAt(1), TransferItem::Status::Pending);
        QCOMPARE(statusAt(2), TransferItem::Status::Pending);
        QCOMPARE(queue->activeCount(), 1);
        QCOMPARE(mock->mockPendingOperationCount(), 1);

        flushAndProcessNext();
        QCOMPARE(statusAt(0), TransferItem::Status::Success);
        QCOMPARE(statusAt(1), TransferItem::Status::Active);
        QCOMPARE(statusAt(2), TransferItem::Status::Pending);
        QCOMPARE(queue->activeCount(), 1);

        flushAndProcessNext();
        QCOMPARE(statusAt(1), TransferItem::Status::Success);
        QCOMPARE(statusAt(2), TransferItem::Status::Active);

        flushAndProcessNext();
        QCOMPARE(queue->activeCount(), 0);
        QCOMPARE(mock->mockGetUploadRequests(),
                 QStringList({"q/a.txt", "q/b.txt", "q/c.txt"}));
    }

    void testEndToEndSuccess()
    {
        QString a = createFile("a.txt", "first file");
        QString b = createFile("b.txt", "second file");
        mock->mockSetBaseUrl("https://files.example.com");
        QSignalSpy completedSpy(queue, &UploadQueue::transferCompleted);
        QSignalSpy finishedSpy(queue, &UploadQueue::allTransfersFinished);

        queue->addToQueue({a, b}, "uploads/");
        flushAndProcess();

        const QList<TransferItem> items = queue->items();
        QCOMPARE(items.size(), 2);
        for (const TransferItem &item : items) {
            QCOMPARE(item.status, TransferItem::Status::Success);
            QCOMPARE(item.progress, 1.0);
            QVERIFY(item.errorMessage.isEmpty());
        }
        QCOMPARE(items[0].resultUrl, QString("https://files.example.com/uploads/a.txt"));
        QCOMPARE(items[1].resultUrl, QString("https://files.example.com/uploads/b.txt"));

        QCOMPARE(mock->mockGetUploadedData("uploads/a.txt"), QByteArray("first file"));
        QCOMPARE(mock->mockGetUploadedData("uploads/b.txt"), QByteArray("second file"));
        QCOMPARE(mock->mockGetUploadContentType("uploads/a.txt"), QString("text/plain"));

        QCOMPARE(completedKeys, QStringList({"uploads/a.txt", "uploads/b.txt"}));
        QCOMPARE(completedSpy.count(), 2);
        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY(!queue->hasActiveTransfers());
    }

    void testAuthorizationFailureThenRetry()
    {
        QString a = createFile("a.txt", "secret");
        QSignalSpy failedSpy(queue, &UploadQueue::transferFailed);
        mock->mockSetNextOperationFails(
            StorageError::authorization("AccessDenied: Access Denied (HTTP 403)"));

        QString id = queue->addToQueue({a}, "uploads/").first();
        flushAndProcess();

        TransferItem failed = *queue->item(id);
        QCOMPARE(failed.status, TransferItem::Status::Failed);
        QCOMPARE(failed.errorKind, StorageError::Kind::Authorization);
        QVERIFY(failed.errorMessage.contains("AccessDenied"));
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.first().at(0).toString(), id);
        QVERIFY(completedKeys.isEmpty());
        QVERIFY(!queue->hasActiveTransfers());

        QVERIFY(queue->retry(id));
        TransferItem reset = *queue->item(id);
        QCOMPARE(reset.status, TransferItem::Status::Pending);
        QVERIFY(reset.errorMessage.isEmpty());
        QCOMPARE(reset.progress, 0.0);
        QCOMPARE(reset.id, id);

        flushAndProcess();
        TransferItem done = *queue->item(id);
        QCOMPARE(done.status, TransferItem::Status::Success);
        QCOMPARE(done.progress, 1.0);
        QCOMPARE(completedKeys, QStringList({"uploads/a.txt"}));
    }

    void testRetryKeepsListPosition()
    {
        QString a = createFile("a.txt", "a");
        QString b = createFile("b.txt", "b");
        QString c = createFile("c.txt", "c");
        mock->mockSetKeyFails("p/b.txt", StorageError::transport("Connection refused"));

        QStringList ids = queue->addToQueue({a, b, c}, "p/");
        flushAndProcess();

        QCOMPARE(statusAt(0), TransferItem::Status::Success);
        QCOMPARE(statusAt(1), TransferItem::Status::Failed);
        QCOMPARE(statusAt(2), TransferItem::Status::Success);

        mock->mockClearKeyFailure("p/b.txt");
        QVERIFY(queue->retry(ids[1]));
        QCOMPARE(queue->items().at(1).id, ids[1]);

        flushAndProcess();
        QCOMPARE(queue->items().at(1).id, ids[1]);
        QCOMPARE(statusAt(1), TransferItem::Status::Success);
    }

    void testRetryRejectsNonFailedItems()
    {
        QString a = createFile("a.txt", "a");
        QString id = queue->addToQueue({a}, "").first();

        QVERIFY(!queue->retry(id));
        QVERIFY(!queue->retry("no-such-id"));

        flushAndProcess();
        QVERIFY(!queue->retry(id));
    }

    void testClearAllRefusedWhileTransfersPending()
    {
        QString a = createFile("a.txt", "a");
        QString b = createFile("b.txt", "b");
        queue->addToQueue({a, b}, "");

        QVERIFY(!queue->clearAll());
        QCOMPARE(queue->items().size(), 2);

        queue->flushEventQueue();
        QVERIFY(!queue->clearAll());
        QCOMPARE(queue->items().size(), 2);

        flushAndProcess();
        QSignalSpy changedSpy(queue, &UploadQueue::queueChanged);
        QVERIFY(queue->clearAll());
        QCOMPARE(queue->items().size(), 0);
        QCOMPARE(queue->rowCount(), 0);
        QCOMPARE(changedSpy.count(), 1);
    }

    void testClearCompletedKeepsFailures()
    {
        QString a = createFile("a.txt", "a");
        QString b = createFile("b.txt", "b");
        mock->mockSetKeyFails("b.txt", StorageError::unknown("Internal error"));
        queue->addToQueue({a, b}, "");
        flushAndProcess();

        queue->clearCompleted();
        const QList<TransferItem> items = queue->items();
        QCOMPARE(items.size(), 1);
        QCOMPARE(items[0].key, QString("b.txt"));
        QCOMPARE(items[0].status, TransferItem::Status::Failed);
    }

    void testRemoveActiveItemDoesNotOverlapTransfers()
    {
        QString a = createFile("a.txt", "a");
        QString b = createFile("b.txt", "b");
        QStringList ids = queue->addToQueue({a, b}, "");

        queue->flushEventQueue();
        QCOMPARE(statusAt(0), TransferItem::Status::Active);

        QVERIFY(queue->remove(ids[0]));
        QCOMPARE(queue->items().size(), 1);
        QVERIFY(!queue->item(ids[0]).has_value());

        // The orphaned upload is still in flight, so b must wait
        queue->flushEventQueue();
        QVERIFY(queue->isProcessing());
        QCOMPARE(queue->items().at(0).status, TransferItem::Status::Pending);
        QCOMPARE(mock->mockGetUploadRequests().size(), 1);

        flushAndProcessNext();
        QCOMPARE(queue->items().at(0).status, TransferItem::Status::Active);
        QCOMPARE(mock->mockGetUploadRequests(), QStringList({"a.txt", "b.txt"}));
        QVERIFY(completedKeys.contains("a.txt"));

        flushAndProcess();
        QCOMPARE(queue->items().at(0).status, TransferItem::Status::Success);
    }

    void testRemovePendingItem()
    {
        QString a = createFile("a.txt", "a");
        QString b = createFile("b.txt", "b");
        QStringList ids = queue->addToQueue({a, b}, "");

        QVERIFY(queue->remove(ids[1]));
        QVERIFY(!queue->remove(ids[1]));
        flushAndProcess();

        QCOMPARE(mock->mockGetUploadRequests(), QStringList({"a.txt"}));
    }

    void testMissingLocalFileFailsAndLoopContinues()
    {
        QString b = createFile("b.txt", "b");
        queue->addToQueue({tempDir->filePath("missing.txt"), b}, "");
        flushAndProcess();

        const QList<TransferItem> items = queue->items();
        QCOMPARE(items[0].status, TransferItem::Status::Failed);
        QCOMPARE(items[0].errorKind, StorageError::Kind::LocalFilesystem);
        QVERIFY(!items[0].errorMessage.isEmpty());
        QCOMPARE(items[1].status, TransferItem::Status::Success);
        QCOMPARE(mock->mockGetUploadRequests(), QStringList({"b.txt"}));
    }

    void testClientDestroyedMidUploadFailsItem()
    {
        QString a = createFile("a.txt", "a");
        QSignalSpy failedSpy(queue, &UploadQueue::transferFailed);
        QString id = queue->addToQueue({a}, "uploads/").first();

        queue->flushEventQueue();
        QCOMPARE(statusAt(0), TransferItem::Status::Active);

        delete mock;
        mock = nullptr;

        QCOMPARE(queue->item(id)->status, TransferItem::Status::Failed);
        QCOMPARE(failedSpy.count(), 1);
        QVERIFY(!queue->isProcessing());
        QVERIFY(completedKeys.isEmpty());
    }

    void testIdsUniqueForRepeatedKeys()
    {
        QString a = createFile("a.txt", "a");
        QStringList ids = queue->addToQueue({a, a, a}, "same/");

        QCOMPARE(ids.size(), 3);
        QCOMPARE(QSet<QString>(ids.begin(), ids.end()).size(), 3);
        for (const TransferItem &item : queue->items()) {
            QCOMPARE(item.key, QString("same/a.txt"));
        }
    }

    void testProgressIsMonotonic()
    {
        QString a = createFile("a.txt", QByteArray(1000, 'x'));
        QString id = queue->addToQueue({a}, "").first();

        QList<double> observed;
        connect(queue, &UploadQueue::queueChanged, this, [this, id, &observed]() {
            if (auto item = queue->item(id)) {
                if (item->status == TransferItem::Status::Active
                    || item->status == TransferItem::Status::Success) {
                    observed.append(item->progress);
                }
            }
        });

        flushAndProcess();

        QVERIFY(observed.size() >= 2);
        for (int i = 1; i < observed.size(); ++i) {
            QVERIFY(observed[i] >= observed[i - 1]);
        }
        QCOMPARE(observed.last(), 1.0);
    }

    void testModelRoles()
    {
        QString a = createFile("a.txt", "abc");
        QString id = queue->addToQueue({a}, "docs/").first();

        QCOMPARE(queue->rowCount(), 1);
        QModelIndex index = queue->index(0);
        QCOMPARE(queue->data(index, UploadQueue::IdRole).toString(), id);
        QCOMPARE(queue->data(index, UploadQueue::KeyRole).toString(), QString("docs/a.txt"));
        QCOMPARE(queue->data(index, Qt::DisplayRole).toString(), QString("a.txt"));
        QCOMPARE(queue->data(index, UploadQueue::SizeRole).toLongLong(), qint64(3));
        QCOMPARE(queue->data(index, UploadQueue::StatusRole).toInt(),
                 static_cast<int>(TransferItem::Status::Pending));
        QVERIFY(queue->roleNames().values().contains("resultUrl"));
    }
};

QTEST_MAIN(TestUploadQueue)
#include "test_uploadqueue.moc"
