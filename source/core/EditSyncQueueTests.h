#ifndef EDITSYNCQUEUETESTS_H
#define EDITSYNCQUEUETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <memory>

#include "EditSyncQueue.h"
#include "../net/MockBackend.h"

/**
 * Unit tests for EditSyncQueue.
 * Run with: transdesk --test-sync
 *
 * Timers are set far apart (or flushes are triggered by hand) so every test
 * controls exactly when a flush happens.
 */
class EditSyncQueueTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<MockBackend> m_backend;
    std::unique_ptr<EditSyncQueue> m_queue;

    int updates() const { return m_backend->callCount(MockBackend::Op::UpdateTranslation); }

    void addRecord(const QString& sourceId, const QString& recordId, const QString& content) {
        TranslationRecord rec;
        rec.id = recordId;
        rec.content = content;
        rec.isMine = true;

        TranslationSource source;
        source.id = sourceId;
        source.position = QPointF(0.5, 0.5);
        source.records.append(rec);
        source.refreshDerivedState();
        m_backend->addSource("file-1", source);
    }

private slots:
    void init() {
        m_backend.reset(new MockBackend());
        m_queue.reset(new EditSyncQueue(m_backend.get()));
        m_queue->setDebounceInterval(10000);
        m_queue->setAutoSyncInterval(10000);
        addRecord("s1", "r1", "base");
        addRecord("s2", "r2", "other");
    }

    void cleanup() {
        m_queue.reset();
        m_backend.reset();
    }

    void testDebounceCoalescesEdits() {
        m_queue->setDebounceInterval(150);
        m_queue->enqueueContent("r1", "a", "base");
        QTest::qWait(50);
        m_queue->enqueueContent("r1", "ab", "base");
        QTest::qWait(50);
        m_queue->enqueueContent("r1", "abc", "base");

        QCOMPARE(updates(), 0);
        QTRY_COMPARE(updates(), 1);
        QCOMPARE(*m_backend->calls().last().update.content, QString("abc"));

        QTest::qWait(300);
        QCOMPARE(updates(), 1);
    }

    void testFieldsMergePerRecord() {
        m_queue->enqueueContent("r1", "text", "base");
        m_queue->enqueueProofread("r1", "proof", "");
        m_queue->enqueueSelected("r1", true);
        m_queue->enqueueContent("r2", "changed", "other");
        QCOMPARE(m_queue->pendingCount(), 2);

        QSignalSpy started(m_queue.get(), &EditSyncQueue::flushStarted);
        m_queue->flush();
        QCOMPARE(started.count(), 1);
        QCOMPARE(started.first().at(0).toInt(), 2);
        QVERIFY(!m_queue->hasPending());

        const auto calls = m_backend->callsOf(MockBackend::Op::UpdateTranslation);
        QCOMPARE(calls.size(), 2);
        for (const MockBackend::Call& call : calls) {
            if (call.target == "r1") {
                QCOMPARE(*call.update.content, QString("text"));
                QCOMPARE(*call.update.proofreadContent, QString("proof"));
                QCOMPARE(*call.update.selected, true);
            } else {
                QCOMPARE(call.target, QString("r2"));
                QVERIFY(call.update.content.has_value());
                QVERIFY(!call.update.proofreadContent.has_value());
                QVERIFY(!call.update.selected.has_value());
            }
        }
    }

    void testValueEqualToBaselineIsDropped() {
        m_queue->enqueueContent("r1", "edited", "base");
        QVERIFY(m_queue->hasPendingContent("r1"));
        m_queue->enqueueContent("r1", "base", "base");
        QVERIFY(!m_queue->hasPendingContent("r1"));

        m_queue->flush();
        QCOMPARE(updates(), 0);
    }

    void testRevertWhileInFlightIsSent() {
        m_backend->setNextLatency(MockBackend::Op::UpdateTranslation, 50);
        QSignalSpy acked(m_queue.get(), &EditSyncQueue::recordAcknowledged);
        m_queue->enqueueContent("r1", "edited", "base");
        m_queue->flush();
        QCOMPARE(updates(), 1);

        // Back to the saved text while "edited" is still on its way
        m_queue->enqueueContent("r1", "base", "base");
        QVERIFY(m_queue->hasPendingContent("r1"));

        QTRY_COMPARE(acked.count(), 1);
        m_queue->flush();
        QCOMPARE(updates(), 2);
        QCOMPARE(*m_backend->calls().last().update.content, QString("base"));
        QTRY_COMPARE(acked.count(), 2);
        QCOMPARE(m_backend->serverSource("s1")->record("r1")->content, QString("base"));
    }

    void testRepeatingInFlightValueIsNotResent() {
        m_backend->setNextLatency(MockBackend::Op::UpdateTranslation, 50);
        QSignalSpy acked(m_queue.get(), &EditSyncQueue::recordAcknowledged);
        m_queue->enqueueProofread("r1", "checked", "");
        m_queue->flush();

        m_queue->enqueueProofread("r1", "checked!", "");
        QVERIFY(m_queue->hasPendingProofread("r1"));
        m_queue->enqueueProofread("r1", "checked", "");
        QVERIFY(!m_queue->hasPendingProofread("r1"));

        QTRY_COMPARE(acked.count(), 1);
        m_queue->flush();
        QCOMPARE(updates(), 1);

        // Settled again: the acknowledged text is the reference
        m_queue->enqueueProofread("r1", "", "checked");
        QVERIFY(m_queue->hasPendingProofread("r1"));
    }

    void testAcknowledgementCarriesServerRecord() {
        QSignalSpy acked(m_queue.get(), &EditSyncQueue::recordAcknowledged);
        m_queue->enqueueContent("r1", "new", "base");
        m_queue->flush();

        QTRY_COMPARE(acked.count(), 1);
        const TranslationRecord record = acked.first().at(0).value<TranslationRecord>();
        QCOMPARE(record.id, QString("r1"));
        QCOMPARE(record.content, QString("new"));
        QCOMPARE(m_queue->inFlightCount(), 0);
    }

    void testNotFoundDropsWithoutRetry() {
        QSignalSpy dropped(m_queue.get(), &EditSyncQueue::recordDropped);
        m_queue->enqueueContent("missing", "text", "");
        m_queue->flush();

        QTRY_COMPARE(dropped.count(), 1);
        QCOMPARE(dropped.first().at(0).toString(), QString("missing"));
        QVERIFY(!m_queue->hasPending());

        m_queue->flush();
        m_queue->forceFlush();
        QTest::qWait(20);
        QCOMPARE(updates(), 1);
    }

    void testTransientFailureKeepsNewerValue() {
        m_backend->setNextLatency(MockBackend::Op::UpdateTranslation, 50);
        m_backend->failNext(MockBackend::Op::UpdateTranslation, BackendError::transient("timeout"));

        m_queue->enqueueContent("r1", "first", "base");
        m_queue->flush();
        QCOMPARE(m_queue->inFlightCount(), 1);

        // Typed while the failing request was in flight
        m_queue->enqueueContent("r1", "second", "base");

        QTRY_COMPARE(m_queue->inFlightCount(), 0);
        QCOMPARE(*m_queue->pendingUpdate("r1").content, QString("second"));
    }

    void testTransientFailureIsRestored() {
        m_backend->failNext(MockBackend::Op::UpdateTranslation, BackendError::transient("offline"));
        m_queue->enqueueProofread("r1", "proof", "");
        m_queue->flush();

        QTRY_COMPARE(m_queue->inFlightCount(), 0);
        QVERIFY(m_queue->hasPendingProofread("r1"));
        QVERIFY(!m_queue->isParked("r1"));
    }

    void testBackoffThenPark() {
        m_backend->failAlways(MockBackend::Op::UpdateTranslation, BackendError::transient("server down", 503));
        QSignalSpy stalled(m_queue.get(), &EditSyncQueue::syncStalled);

        m_queue->enqueueContent("r1", "text", "base");

        // Flush cycles sat out after the n-th consecutive failure
        const int skips[] = { 1, 2, 4, 8, 8 };
        int expected = 0;
        for (int attempt = 0; attempt < 6; ++attempt) {
            m_queue->flush();
            ++expected;
            QCOMPARE(updates(), expected);
            QTRY_COMPARE(m_queue->inFlightCount(), 0);

            if (attempt < 5) {
                for (int s = 0; s < skips[attempt]; ++s) {
                    m_queue->flush();
                    QCOMPARE(updates(), expected);
                }
            }
        }

        QVERIFY(m_queue->isParked("r1"));
        QCOMPARE(stalled.count(), 1);
        QVERIFY(m_queue->hasPendingContent("r1"));

        for (int i = 0; i < 20; ++i) {
            m_queue->flush();
        }
        QCOMPARE(updates(), 6);

        // A forced flush still tries parked records once
        bool done = false;
        m_queue->forceFlush([&done]() { done = true; });
        QCOMPARE(updates(), 7);
        QTRY_VERIFY(done);

        // A new edit gives the record a fresh start
        m_backend->clearFailures();
        m_queue->enqueueContent("r1", "text again", "base");
        QVERIFY(!m_queue->isParked("r1"));
        m_queue->flush();
        QCOMPARE(updates(), 8);
        QTRY_VERIFY(!m_queue->hasPending());
    }

    void testForceFlushWaitsForInFlight() {
        m_backend->setLatency(80);
        m_queue->enqueueContent("r1", "a", "base");
        m_queue->flush();
        QCOMPARE(m_queue->inFlightCount(), 1);

        m_queue->enqueueContent("r2", "b", "other");
        bool done = false;
        m_queue->forceFlush([&done]() { done = true; });
        QCOMPARE(m_queue->inFlightCount(), 2);
        QVERIFY(!done);

        QTRY_VERIFY(done);
        QCOMPARE(m_queue->inFlightCount(), 0);
        QCOMPARE(updates(), 2);
    }

    void testForceFlushWithNothingPendingAnswersAsync() {
        bool done = false;
        m_queue->forceFlush([&done]() { done = true; });
        QVERIFY(!done);
        QTRY_VERIFY(done);
        QCOMPARE(updates(), 0);
    }

    void testAutoSyncFlushesWithoutPause() {
        m_queue->setAutoSyncInterval(60);
        m_queue->start();
        QVERIFY(m_queue->isRunning());

        m_queue->enqueueContent("r1", "typing", "base");
        QTRY_COMPARE(updates(), 1);

        m_queue->stop();
        QVERIFY(!m_queue->isRunning());
    }

    void testDiscardForgetsRecord() {
        m_queue->enqueueContent("r1", "x", "base");
        m_queue->enqueueSelected("r1", true);
        m_queue->discard("r1");
        QVERIFY(!m_queue->hasPending());
        m_queue->flush();
        QCOMPARE(updates(), 0);
    }
};

#endif // EDITSYNCQUEUETESTS_H
