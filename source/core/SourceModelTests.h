#ifndef SOURCEMODELTESTS_H
#define SOURCEMODELTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <memory>

#include "SourceModel.h"
#include "EditSyncQueue.h"
#include "ViewportTransform.h"
#include "../net/MockBackend.h"

/**
 * Unit tests for SourceModel and TranslationSource.
 * Run with: transdesk --test-sources
 *
 * The page image is 1000x1000 at zoom 1 with no pan, so a screen point
 * (300, 400) is the normalized point (0.3, 0.4).
 */
class SourceModelTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<MockBackend> m_backend;
    std::unique_ptr<EditSyncQueue> m_queue;
    std::unique_ptr<ViewportTransform> m_viewport;
    std::unique_ptr<SourceModel> m_model;

    static TranslationRecord makeRecord(const QString& id, const QString& content,
                                        bool mine = false, bool selected = false) {
        TranslationRecord rec;
        rec.id = id;
        rec.content = content;
        rec.isMine = mine;
        rec.selected = selected;
        return rec;
    }

    static TranslationSource makeSource(const QString& id, const QPointF& pos,
                                        const QVector<TranslationRecord>& records = {}) {
        TranslationSource source;
        source.id = id;
        source.position = pos;
        source.records = records;
        source.refreshDerivedState();
        return source;
    }

    /// Seed the same source locally and on the backend.
    void seed(const TranslationSource& source) {
        m_backend->addSource("file-1", source);
        QVector<TranslationSource> sources = m_model->sources();
        sources.append(source);
        m_model->setSources(sources);
    }

private slots:
    void init() {
        m_backend.reset(new MockBackend());
        m_queue.reset(new EditSyncQueue(m_backend.get()));
        m_viewport.reset(new ViewportTransform());
        m_viewport->setCanvasSize(QSizeF(1000, 1000));
        m_viewport->setImageSize(QSizeF(1000, 1000));
        m_model.reset(new SourceModel(m_backend.get(), m_queue.get()));
        m_model->setViewport(m_viewport.get());
        m_model->setTargetContext("file-1", "en");
    }

    void cleanup() {
        m_model.reset();
        m_queue.reset();
        m_viewport.reset();
        m_backend.reset();
    }

    // ===== TranslationSource =====

    void testPrimaryRecordPrefersSelectedThenMine() {
        TranslationSource source = makeSource("s", QPointF(0.5, 0.5), {
            makeRecord("a", "first"),
            makeRecord("b", "mine", true),
            makeRecord("c", "chosen", false, true)
        });
        QCOMPARE(source.primaryTranslationId, QString("c"));
        QCOMPARE(source.myTranslationId, QString("b"));
        QCOMPARE(source.status, TranslationSource::Status::Translated);

        source.records[2].selected = false;
        source.refreshDerivedState();
        QCOMPARE(source.primaryTranslationId, QString("b"));
    }

    void testResolveProofTargetFallsBackToFirst() {
        TranslationSource source = makeSource("s", QPointF(0.5, 0.5), {
            makeRecord("a", "first"),
            makeRecord("b", "second")
        });
        const TranslationRecord* target = m_model->resolveProofTarget(source);
        QVERIFY(target);
        QCOMPARE(target->id, QString("a"));

        TranslationSource empty = makeSource("e", QPointF(0.5, 0.5));
        QVERIFY(m_model->resolveProofTarget(empty) == nullptr);
    }

    void testApplyRecordKeepsSingleSelection() {
        TranslationSource source = makeSource("s", QPointF(0.5, 0.5), {
            makeRecord("a", "x", false, true),
            makeRecord("b", "y")
        });
        TranslationRecord chosen = makeRecord("b", "y", false, true);
        source.applyRecord(chosen);

        QVERIFY(!source.record("a")->selected);
        QVERIFY(source.record("b")->selected);
        QCOMPARE(source.selectedTranslationId, QString("b"));
    }

    // ===== Placement =====

    void testPlaceOutsideImageIsRejected() {
        QSignalSpy errors(m_model.get(), &SourceModel::errorRaised);
        QString error;
        QVERIFY(!m_model->place(TranslationSource::Category::Inside, QPointF(1200, 500), false, &error));
        QVERIFY(!error.isEmpty());
        QCOMPARE(errors.count(), 1);
        QCOMPARE(m_model->count(), 0);
        QCOMPARE(m_backend->callCount(MockBackend::Op::CreateSource), 0);
    }

    void testPlaceWithoutTargetContextIsRejected() {
        m_model->clearTargetContext();
        QVERIFY(!m_model->place(TranslationSource::Category::Inside, QPointF(300, 400)));
        QCOMPARE(m_backend->callCount(MockBackend::Op::CreateSource), 0);
    }

    void testPlaceCreatesAtExactPosition() {
        QVERIFY(m_model->place(TranslationSource::Category::Inside, QPointF(300, 400)));

        // Optimistic placeholder first
        QCOMPARE(m_model->count(), 1);
        QVERIFY(m_model->sources().first().pendingCreate);
        QCOMPARE(m_model->activeSourceId(), m_model->sources().first().id);

        QTRY_VERIFY(!m_model->sources().first().pendingCreate);
        const TranslationSource& created = m_model->sources().first();
        QCOMPARE(created.id, QString("source-1"));
        QCOMPARE(created.position, QPointF(0.3, 0.4));
        QCOMPARE(m_model->activeSourceId(), QString("source-1"));

        const auto calls = m_backend->callsOf(MockBackend::Op::CreateSource);
        QCOMPARE(calls.size(), 1);
        QCOMPARE(calls.first().args.value("x").toDouble(), 0.3);
        QCOMPARE(calls.first().args.value("y").toDouble(), 0.4);
        QCOMPARE(calls.first().args.value("positionType").toInt(), 1);
    }

    void testSilentPlacementKeepsActiveSource() {
        seed(makeSource("s1", QPointF(0.1, 0.1)));
        m_model->setActiveSource("s1");

        QVERIFY(m_model->place(TranslationSource::Category::Outside, QPointF(500, 500), true));
        QCOMPARE(m_model->activeSourceId(), QString("s1"));
        QTRY_COMPARE(m_backend->callCount(MockBackend::Op::CreateSource), 1);
        QTRY_VERIFY(!m_model->sources().last().pendingCreate);
        QCOMPARE(m_model->sources().last().category, TranslationSource::Category::Outside);
        QCOMPARE(m_model->activeSourceId(), QString("s1"));
    }

    void testCreateFailureRemovesPlaceholder() {
        m_backend->failNext(MockBackend::Op::CreateSource, BackendError::transient("offline"));
        QSignalSpy errors(m_model.get(), &SourceModel::errorRaised);

        QVERIFY(m_model->place(TranslationSource::Category::Inside, QPointF(300, 400)));
        QCOMPARE(m_model->count(), 1);
        QTRY_COMPARE(m_model->count(), 0);
        QCOMPARE(errors.count(), 1);
        QVERIFY(m_model->activeSourceId().isEmpty());
    }

    void testRemovingPlaceholderDeletesCreatedSource() {
        QVERIFY(m_model->place(TranslationSource::Category::Inside, QPointF(300, 400)));
        const QString placeholder = m_model->sources().first().id;
        m_model->remove(placeholder);
        QCOMPARE(m_model->count(), 0);

        QTRY_COMPARE(m_backend->callCount(MockBackend::Op::DeleteSource), 1);
        QTRY_VERIFY(m_backend->sourceIds("file-1").isEmpty());
        QCOMPARE(m_model->count(), 0);
    }

    void testPlaceholderTextSettlesAsOneWrite() {
        QSignalSpy settled(m_model.get(), &SourceModel::writesSettled);
        QVERIFY(m_model->place(TranslationSource::Category::Inside, QPointF(300, 400)));
        const QString placeholder = m_model->activeSourceId();
        QVERIFY(m_model->editTranslation(placeholder, "typed early"));
        QVERIFY(m_model->hasOutstandingWrites());

        // The create answer starts the first write before it counts as settled
        QTRY_COMPARE(settled.count(), 1);
        QVERIFY(!m_model->hasOutstandingWrites());
        QCOMPARE(m_backend->callCount(MockBackend::Op::SubmitTranslation), 1);
        const TranslationSource* created = m_model->source("source-1");
        QVERIFY(created);
        QCOMPARE(created->record(created->myTranslationId)->content, QString("typed early"));
    }

    void testIdSwapSurvivesListChangesFromSlots() {
        seed(makeSource("s0", QPointF(0.1, 0.1)));
        QVERIFY(m_model->place(TranslationSource::Category::Inside, QPointF(300, 400)));
        const QString placeholder = m_model->activeSourceId();

        // Moved while the create call is still unanswered
        QVERIFY(m_model->beginDrag(placeholder));
        m_model->drag(placeholder, QPointF(700, 800));
        m_model->endDrag(placeholder);

        connect(m_model.get(), &SourceModel::sourceIdChanged, this, [this](const QString&, const QString&) {
            m_model->remove("s0");
        });

        QTRY_COMPARE(m_backend->callCount(MockBackend::Op::UpdateSourcePosition), 1);
        const auto call = m_backend->callsOf(MockBackend::Op::UpdateSourcePosition).first();
        QCOMPARE(call.target, QString("source-1"));
        QCOMPARE(call.args.value("x").toDouble(), 0.7);
        QCOMPARE(call.args.value("y").toDouble(), 0.8);

        QCOMPARE(m_model->count(), 1);
        QCOMPARE(m_model->sources().first().id, QString("source-1"));
        QCOMPARE(m_model->sources().first().position, QPointF(0.7, 0.8));
    }

    // ===== Drag =====

    void testDragClampsAndCommitsOnce() {
        seed(makeSource("s1", QPointF(0.3, 0.4)));

        QVERIFY(m_model->beginDrag("s1"));
        m_model->drag("s1", QPointF(100, 600));
        m_model->drag("s1", QPointF(-100, 900));
        QCOMPARE(m_model->source("s1")->position, QPointF(0.0, 0.9));
        QCOMPARE(m_backend->callCount(MockBackend::Op::UpdateSourcePosition), 0);

        m_model->endDrag("s1");
        QCOMPARE(m_backend->callCount(MockBackend::Op::UpdateSourcePosition), 1);
        const auto call = m_backend->callsOf(MockBackend::Op::UpdateSourcePosition).first();
        QCOMPARE(call.target, QString("s1"));
        QCOMPARE(call.args.value("x").toDouble(), 0.0);
        QCOMPARE(call.args.value("y").toDouble(), 0.9);
        QTRY_COMPARE(m_backend->serverSource("s1")->position, QPointF(0.0, 0.9));
    }

    void testDragWithoutMovementMakesNoCall() {
        seed(makeSource("s1", QPointF(0.3, 0.4)));
        QVERIFY(m_model->beginDrag("s1"));
        m_model->endDrag("s1");
        QTest::qWait(20);
        QCOMPARE(m_backend->callCount(MockBackend::Op::UpdateSourcePosition), 0);
    }

    void testCancelDragRestoresPosition() {
        seed(makeSource("s1", QPointF(0.3, 0.4)));
        QVERIFY(m_model->beginDrag("s1"));
        m_model->drag("s1", QPointF(800, 800));
        m_model->cancelDrag("s1");
        QCOMPARE(m_model->source("s1")->position, QPointF(0.3, 0.4));
        QVERIFY(!m_model->isDragging());
        QTest::qWait(20);
        QCOMPARE(m_backend->callCount(MockBackend::Op::UpdateSourcePosition), 0);
    }

    // ===== Category / removal =====

    void testToggleCategoryAppliesAfterConfirmation() {
        seed(makeSource("s1", QPointF(0.5, 0.5)));
        m_model->toggleCategory("s1");
        QCOMPARE(m_model->source("s1")->category, TranslationSource::Category::Inside);
        QTRY_COMPARE(m_model->source("s1")->category, TranslationSource::Category::Outside);
        QCOMPARE(m_backend->callsOf(MockBackend::Op::UpdateSourceCategory).first().args.value("positionType").toInt(), 2);
    }

    void testToggleCategoryFailureLeavesCategory() {
        seed(makeSource("s1", QPointF(0.5, 0.5)));
        m_backend->failNext(MockBackend::Op::UpdateSourceCategory, BackendError::rejected("forbidden", 403));
        QSignalSpy errors(m_model.get(), &SourceModel::errorRaised);

        m_model->toggleCategory("s1");
        QTRY_COMPARE(errors.count(), 1);
        QCOMPARE(m_model->source("s1")->category, TranslationSource::Category::Inside);
    }

    void testRemoveIsNotResurrectedOnFailure() {
        seed(makeSource("s1", QPointF(0.5, 0.5)));
        m_model->setActiveSource("s1");
        m_backend->failNext(MockBackend::Op::DeleteSource, BackendError::transient("timeout"));
        QSignalSpy errors(m_model.get(), &SourceModel::errorRaised);

        m_model->remove("s1");
        QCOMPARE(m_model->count(), 0);
        QVERIFY(m_model->activeSourceId().isEmpty());

        QTRY_COMPARE(errors.count(), 1);
        QCOMPARE(m_model->count(), 0);
    }

    // ===== Capability gating =====

    void testEditDisabledRefusesMutations() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "hello", true) }));
        m_model->setEditEnabled(false);

        QVERIFY(!m_model->place(TranslationSource::Category::Inside, QPointF(300, 300)));
        QVERIFY(!m_model->beginDrag("s1"));
        m_model->toggleCategory("s1");
        m_model->remove("s1");
        QVERIFY(!m_model->editTranslation("s1", "changed"));

        QCOMPARE(m_model->count(), 1);
        QVERIFY(!m_queue->hasPending());
        QTest::qWait(20);
        QCOMPARE(m_backend->calls().size(), 0);
    }

    // ===== Text =====

    void testFirstEditSubmitsThenQueues() {
        seed(makeSource("s1", QPointF(0.5, 0.5)));
        m_model->setActiveSource("s1");

        QVERIFY(m_model->editTranslation("s1", "Hel"));
        QCOMPARE(m_backend->callCount(MockBackend::Op::SubmitTranslation), 1);

        // Typing continues while the first write is in flight
        QVERIFY(m_model->editTranslation("s1", "Hello"));
        QCOMPARE(m_backend->callCount(MockBackend::Op::SubmitTranslation), 1);

        QTRY_VERIFY(!m_model->source("s1")->myTranslationId.isEmpty());
        const QString mine = m_model->source("s1")->myTranslationId;
        QCOMPARE(m_model->source("s1")->serverTranslationText, QString("Hel"));
        QVERIFY(m_queue->hasPendingContent(mine));
        QCOMPARE(*m_queue->pendingUpdate(mine).content, QString("Hello"));
        QCOMPARE(m_model->editorTranslationText(), QString("Hello"));
    }

    void testEditBackToBaselineDropsPending() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "saved", true) }));

        m_model->editTranslation("s1", "saved!");
        QVERIFY(m_queue->hasPendingContent("r1"));
        m_model->editTranslation("s1", "saved");
        QVERIFY(!m_queue->hasPendingContent("r1"));
    }

    void testRevertDuringFlushReachesBackend() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "A", true) }));
        connect(m_queue.get(), &EditSyncQueue::recordAcknowledged, m_model.get(),
                [this](const TranslationRecord& record) { m_model->applyRecordToSource("s1", record); });
        m_model->setActiveSource("s1");

        m_backend->setNextLatency(MockBackend::Op::UpdateTranslation, 50);
        m_model->editTranslation("s1", "B");
        m_queue->flush();
        m_model->editTranslation("s1", "A");

        // The answer for "B" must not overwrite what the user has now
        QTRY_COMPARE(m_model->source("s1")->serverTranslationText, QString("B"));
        QCOMPARE(m_model->editorTranslationText(), QString("A"));

        m_queue->flush();
        QTRY_COMPARE(m_model->source("s1")->serverTranslationText, QString("A"));
        QCOMPARE(m_backend->callCount(MockBackend::Op::UpdateTranslation), 2);
        QCOMPARE(m_backend->serverSource("s1")->record("r1")->content, QString("A"));
        QCOMPARE(m_model->editorTranslationText(), QString("A"));
    }

    void testThreeQuickEditsSendOneUpdate() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "", true) }));

        m_model->editTranslation("s1", "a");
        QTest::qWait(100);
        m_model->editTranslation("s1", "ab");
        QTest::qWait(100);
        m_model->editTranslation("s1", "abc");

        QTRY_COMPARE(m_backend->callCount(MockBackend::Op::UpdateTranslation), 1);
        const auto call = m_backend->callsOf(MockBackend::Op::UpdateTranslation).first();
        QCOMPARE(call.target, QString("r1"));
        QVERIFY(call.update.content.has_value());
        QCOMPARE(*call.update.content, QString("abc"));

        QTest::qWait(700);
        QCOMPARE(m_backend->callCount(MockBackend::Op::UpdateTranslation), 1);
    }

    void testProofreadTargetsPrimaryRecord() {
        seed(makeSource("s1", QPointF(0.5, 0.5), {
            makeRecord("r1", "one"),
            makeRecord("r2", "two", false, true)
        }));

        QVERIFY(m_model->editProofread("s1", "Two."));
        QVERIFY(m_queue->hasPendingProofread("r2"));
        QVERIFY(!m_queue->hasPendingProofread("r1"));

        QVERIFY(m_model->editProofread("s1", "One.", "r1"));
        QVERIFY(m_queue->hasPendingProofread("r1"));
    }

    void testProofreadWithoutRecordsIsRejected() {
        seed(makeSource("s1", QPointF(0.5, 0.5)));
        QSignalSpy errors(m_model.get(), &SourceModel::errorRaised);
        QVERIFY(!m_model->editProofread("s1", "text"));
        QCOMPARE(errors.count(), 1);
    }

    void testSelectRecordIsOptimisticAndQueued() {
        seed(makeSource("s1", QPointF(0.5, 0.5), {
            makeRecord("r1", "one", false, true),
            makeRecord("r2", "two")
        }));

        QVERIFY(m_model->selectRecord("s1", "r2"));
        QVERIFY(!m_model->source("s1")->record("r1")->selected);
        QVERIFY(m_model->source("s1")->record("r2")->selected);
        QCOMPARE(m_model->source("s1")->primaryTranslationId, QString("r2"));
        QVERIFY(m_queue->pendingUpdate("r2").selected.has_value());
    }

    void testApplyRecordRefreshesEditorBuffers() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "old", true) }));
        m_model->setActiveSource("s1");
        QCOMPARE(m_model->editorTranslationText(), QString("old"));

        QSignalSpy buffers(m_model.get(), &SourceModel::editorBuffersChanged);
        TranslationRecord fresh = makeRecord("r1", "from server", true);
        fresh.proofreadContent = "proofed";
        m_model->applyRecordToSource("s1", fresh);

        QCOMPARE(m_model->editorTranslationText(), QString("from server"));
        QCOMPARE(m_model->editorProofText(), QString("proofed"));
        QCOMPARE(m_model->source("s1")->serverTranslationText, QString("from server"));
        QCOMPARE(m_model->source("s1")->status, TranslationSource::Status::Proofed);
        QCOMPARE(buffers.count(), 1);
    }

    void testApplyRecordKeepsUnsentTyping() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "old", true) }));
        m_model->setActiveSource("s1");
        m_model->editTranslation("s1", "typing");

        m_model->applyRecordToSource("s1", makeRecord("r1", "server", true));
        QCOMPARE(m_model->editorTranslationText(), QString("typing"));
        QCOMPARE(m_model->source("s1")->serverTranslationText, QString("server"));
    }

    // ===== Active source / hit testing =====

    void testActivateNextAndPreviousWrap() {
        m_model->setSources({
            makeSource("a", QPointF(0.1, 0.1)),
            makeSource("b", QPointF(0.2, 0.2)),
            makeSource("c", QPointF(0.3, 0.3))
        });

        m_model->activateNext();
        QCOMPARE(m_model->activeSourceId(), QString("a"));
        m_model->activateNext();
        m_model->activateNext();
        QCOMPARE(m_model->activeSourceId(), QString("c"));
        m_model->activateNext();
        QCOMPARE(m_model->activeSourceId(), QString("a"));
        m_model->activatePrevious();
        QCOMPARE(m_model->activeSourceId(), QString("c"));
    }

    void testSourceAtPicksNearestTopmost() {
        m_model->setSources({
            makeSource("under", QPointF(0.5, 0.5)),
            makeSource("over", QPointF(0.5, 0.5)),
            makeSource("far", QPointF(0.9, 0.9))
        });

        QCOMPARE(m_model->sourceAt(QPointF(505, 505), 12), QString("over"));
        QCOMPARE(m_model->sourceAt(QPointF(895, 900), 12), QString("far"));
        QVERIFY(m_model->sourceAt(QPointF(700, 700), 12).isEmpty());
    }

    void testSetSourcesClampsPositions() {
        m_model->setSources({ makeSource("x", QPointF(1.4, -0.2)) });
        QCOMPARE(m_model->source("x")->position, QPointF(1.0, 0.0));
    }

    void testDroppedRecordIsForgotten() {
        seed(makeSource("s1", QPointF(0.5, 0.5), { makeRecord("r1", "x", true) }));
        m_model->dropRecord("r1");
        QVERIFY(m_model->source("s1")->records.isEmpty());
        QVERIFY(m_model->source("s1")->myTranslationId.isEmpty());
    }
};

#endif // SOURCEMODELTESTS_H
