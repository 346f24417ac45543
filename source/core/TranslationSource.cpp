// ============================================================================
// TranslationSource - Implementation
// ============================================================================
// Part of the TransDesk workbench engine
// ============================================================================

#include "TranslationSource.h"

#include <QJsonArray>

// ===== TranslationRecord =====

TranslationRecord TranslationRecord::fromJson(const QJsonObject& obj, const QString& myUserId)
{
    TranslationRecord rec;
    rec.id = obj["id"].toString();
    rec.content = obj["content"].toString();
    rec.proofreadContent = obj["proof_content"].toString();
    rec.selected = obj["selected"].toBool(false);

    const QJsonObject user = obj["user"].toObject();
    rec.translatorName = user["name"].toString();
    rec.proofreaderName = obj["proofreader"].toObject()["name"].toString();

    if (obj.contains("mine")) {
        rec.isMine = obj["mine"].toBool(false);
    } else if (!myUserId.isEmpty()) {
        rec.isMine = (user["id"].toString() == myUserId);
    }

    const QString editTime = obj["edit_time"].toString();
    if (!editTime.isEmpty()) {
        rec.updatedAt = QDateTime::fromString(editTime, Qt::ISODate);
    }
    return rec;
}

QJsonObject TranslationRecord::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["content"] = content;
    obj["proof_content"] = proofreadContent;
    obj["selected"] = selected;
    obj["mine"] = isMine;
    if (!translatorName.isEmpty()) {
        QJsonObject user;
        user["name"] = translatorName;
        obj["user"] = user;
    }
    if (!proofreaderName.isEmpty()) {
        QJsonObject proofreader;
        proofreader["name"] = proofreaderName;
        obj["proofreader"] = proofreader;
    }
    if (updatedAt.isValid()) {
        obj["edit_time"] = updatedAt.toString(Qt::ISODate);
    }
    return obj;
}

// ===== Record lookup =====

TranslationRecord* TranslationSource::record(const QString& recordId)
{
    if (recordId.isEmpty()) {
        return nullptr;
    }
    for (TranslationRecord& rec : records) {
        if (rec.id == recordId) {
            return &rec;
        }
    }
    return nullptr;
}

const TranslationRecord* TranslationSource::record(const QString& recordId) const
{
    if (recordId.isEmpty()) {
        return nullptr;
    }
    for (const TranslationRecord& rec : records) {
        if (rec.id == recordId) {
            return &rec;
        }
    }
    return nullptr;
}

const TranslationRecord* TranslationSource::proofTarget() const
{
    if (const TranslationRecord* primary = primaryRecord()) {
        return primary;
    }
    return records.isEmpty() ? nullptr : &records.first();
}

// ===== Merging =====

void TranslationSource::applyRecord(const TranslationRecord& rec)
{
    if (!rec.isValid()) {
        return;
    }

    TranslationRecord incoming = rec;

    // Update responses do not always carry ownership; a record never stops being ours
    TranslationRecord* existing = record(rec.id);
    if (existing && existing->isMine) {
        incoming.isMine = true;
    }

    // Keep "at most one mine" and "at most one selected"
    for (TranslationRecord& other : records) {
        if (other.id == incoming.id) {
            continue;
        }
        if (incoming.isMine) {
            other.isMine = false;
        }
        if (incoming.selected) {
            other.selected = false;
        }
    }

    if (existing) {
        *existing = incoming;
    } else {
        records.append(incoming);
    }

    refreshDerivedState();
}

void TranslationSource::refreshDerivedState()
{
    myTranslationId.clear();
    selectedTranslationId.clear();

    for (const TranslationRecord& rec : records) {
        if (rec.isMine && myTranslationId.isEmpty()) {
            myTranslationId = rec.id;
        }
        if (rec.selected && selectedTranslationId.isEmpty()) {
            selectedTranslationId = rec.id;
        }
    }

    if (!selectedTranslationId.isEmpty()) {
        primaryTranslationId = selectedTranslationId;
    } else if (!myTranslationId.isEmpty()) {
        primaryTranslationId = myTranslationId;
    } else if (!records.isEmpty()) {
        primaryTranslationId = records.first().id;
    } else {
        primaryTranslationId.clear();
    }

    const TranslationRecord* mine = myRecord();
    serverTranslationText = mine ? mine->content : QString();

    const TranslationRecord* target = proofTarget();
    serverProofText = target ? target->proofreadContent : QString();

    status = deriveStatus();
}

TranslationSource::Status TranslationSource::deriveStatus() const
{
    const TranslationRecord* primary = primaryRecord();
    if (!primary) {
        return Status::Empty;
    }
    if (!primary->proofreadContent.trimmed().isEmpty()) {
        return Status::Proofed;
    }
    if (!primary->content.trimmed().isEmpty()) {
        return Status::Translated;
    }
    return Status::Empty;
}

// ===== Serialization =====

TranslationSource TranslationSource::fromJson(const QJsonObject& obj, const QString& myUserId)
{
    TranslationSource source;
    source.id = obj["id"].toString();
    source.category = categoryForPositionType(obj["position_type"].toInt(1));
    source.position = clampPosition(QPointF(obj["x"].toDouble(), obj["y"].toDouble()));

    const QJsonArray translations = obj["translations"].toArray();
    for (const QJsonValue& value : translations) {
        TranslationRecord rec = TranslationRecord::fromJson(value.toObject(), myUserId);
        if (rec.isValid()) {
            source.records.append(rec);
        }
    }

    // The backend reports the user's own record separately
    const QJsonObject mine = obj["my_translation"].toObject();
    if (!mine.isEmpty()) {
        TranslationRecord rec = TranslationRecord::fromJson(mine, myUserId);
        rec.isMine = true;
        if (rec.isValid()) {
            source.applyRecord(rec);
        }
    }

    source.refreshDerivedState();
    return source;
}

QJsonObject TranslationSource::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["x"] = position.x();
    obj["y"] = position.y();
    obj["position_type"] = positionTypeFor(category);

    QJsonArray translations;
    for (const TranslationRecord& rec : records) {
        translations.append(rec.toJson());
    }
    obj["translations"] = translations;
    return obj;
}

QPointF TranslationSource::clampPosition(const QPointF& pt)
{
    return QPointF(qBound(0.0, pt.x(), 1.0), qBound(0.0, pt.y(), 1.0));
}
