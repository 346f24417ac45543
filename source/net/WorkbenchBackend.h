#pragma once

// ============================================================================
// WorkbenchBackend - Abstract interface to the remote project backend
// ============================================================================
// Part of the TransDesk workbench engine
//
// This abstraction layer enables:
// - Swapping transports (RestBackend talks HTTP/JSON)
// - Testing the engine with MockBackend, which answers on the event loop
//
// All calls are asynchronous. They return immediately and invoke their
// callback later on the thread that issued them. Callbacks may arrive in any
// order relative to the order of the calls.
// ============================================================================

#include "BackendError.h"
#include "../core/TranslationSource.h"

#include <QString>
#include <QByteArray>
#include <QVector>
#include <functional>
#include <optional>

/**
 * @brief Partial update of a translation record.
 *
 * Each field is independently optional; only set fields are sent.
 */
struct TranslationUpdate {
    std::optional<QString> content;
    std::optional<QString> proofreadContent;
    std::optional<bool> selected;

    bool isEmpty() const {
        return !content.has_value() && !proofreadContent.has_value() && !selected.has_value();
    }
};

/**
 * @brief Raw image payload returned by fetchImage().
 */
struct ImagePayload {
    QByteArray bytes;
    QString contentType;
};

/**
 * @brief Abstract interface for the remote project backend.
 */
class WorkbenchBackend {
public:
    using SourcesCallback = std::function<void(const QVector<TranslationSource>&, const BackendError&)>;
    using SourceCallback = std::function<void(const TranslationSource&, const BackendError&)>;
    using RecordCallback = std::function<void(const TranslationRecord&, const BackendError&)>;
    using DoneCallback = std::function<void(const BackendError&)>;
    using ImageCallback = std::function<void(const ImagePayload&, const BackendError&)>;

    virtual ~WorkbenchBackend() = default;

    /**
     * @brief List the sources of a page, with records for the target language.
     */
    virtual void listPageSources(const QString& fileId, const QString& targetLanguageId,
                                 SourcesCallback done) = 0;

    /**
     * @brief Create a source. The result carries the new id and any records
     *        the backend seeded for it.
     * @param positionType 1 = inside a bubble, 2 = outside.
     */
    virtual void createSource(const QString& fileId, const QString& targetLanguageId,
                              int positionType, qreal x, qreal y, SourceCallback done) = 0;

    virtual void updateSourcePosition(const QString& sourceId, qreal x, qreal y, DoneCallback done) = 0;

    virtual void updateSourceCategory(const QString& sourceId, int positionType, DoneCallback done) = 0;

    virtual void deleteSource(const QString& sourceId, DoneCallback done) = 0;

    /**
     * @brief First write of a translation when no local record exists yet.
     */
    virtual void submitTranslation(const QString& sourceId, const QString& targetLanguageId,
                                   const QString& content, RecordCallback done) = 0;

    /**
     * @brief Partial update of an existing record.
     */
    virtual void updateTranslation(const QString& recordId, const TranslationUpdate& update,
                                   RecordCallback done) = 0;

    /**
     * @brief Fetch page image bytes through the backend's image proxy.
     */
    virtual void fetchImage(const QString& url, ImageCallback done) = 0;
};
