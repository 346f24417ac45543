// ============================================================================
// TranslationEditorPanel - Implementation
// ============================================================================
// Part of the TransDesk workbench engine
// ============================================================================

#include "TranslationEditorPanel.h"
#include "../core/SourceModel.h"

#include <QLabel>
#include <QPlainTextEdit>
#include <QVBoxLayout>
#include <QTextCursor>

TranslationEditorPanel::TranslationEditorPanel(SourceModel* model, QWidget* parent)
    : QWidget(parent)
    , m_model(model)
{
    setupUI();

    if (m_model) {
        connect(m_model, &SourceModel::activeSourceChanged, this, [this](const QString&) { refresh(); });
        connect(m_model, &SourceModel::editorBuffersChanged, this, [this](const QString&) { refresh(); });
        connect(m_model, &SourceModel::sourceChanged, this, [this](const QString& sourceId) {
            if (m_model && sourceId == m_model->activeSourceId()) {
                refresh();
            }
        });
        connect(m_model, &SourceModel::editEnabledChanged, this, [this](bool) { refresh(); });
    }
    refresh();
}

TranslationEditorPanel::~TranslationEditorPanel() = default;

void TranslationEditorPanel::setupUI()
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    m_titleLabel = new QLabel(this);
    m_titleLabel->setWordWrap(true);

    m_translationEdit = new QPlainTextEdit(this);
    m_translationEdit->setPlaceholderText(tr("Translation"));
    connect(m_translationEdit, &QPlainTextEdit::textChanged, this, &TranslationEditorPanel::onTranslationTyped);

    m_proofreadEdit = new QPlainTextEdit(this);
    m_proofreadEdit->setPlaceholderText(tr("Proofreading"));
    connect(m_proofreadEdit, &QPlainTextEdit::textChanged, this, &TranslationEditorPanel::onProofreadTyped);

    layout->addWidget(m_titleLabel);
    layout->addWidget(new QLabel(tr("Translation"), this));
    layout->addWidget(m_translationEdit, 1);
    layout->addWidget(new QLabel(tr("Proofreading"), this));
    layout->addWidget(m_proofreadEdit, 1);
}

// ===== Typing =====

void TranslationEditorPanel::onTranslationTyped()
{
    if (m_updating || !m_model) {
        return;
    }
    const QString sourceId = m_model->activeSourceId();
    if (!sourceId.isEmpty()) {
        m_model->editTranslation(sourceId, m_translationEdit->toPlainText());
    }
}

void TranslationEditorPanel::onProofreadTyped()
{
    if (m_updating || !m_model) {
        return;
    }
    const QString sourceId = m_model->activeSourceId();
    if (!sourceId.isEmpty()) {
        m_model->editProofread(sourceId, m_proofreadEdit->toPlainText());
    }
}

// ===== Model -> fields =====

void TranslationEditorPanel::refresh()
{
    if (!m_model) {
        return;
    }

    const TranslationSource* active = m_model->activeSource();
    const bool editable = active && m_model->isEditEnabled();

    if (!active) {
        m_titleLabel->setText(tr("No marker selected"));
    } else if (active->pendingCreate) {
        m_titleLabel->setText(tr("Marker %1 (saving...)").arg(m_model->indexOf(active->id) + 1));
    } else {
        m_titleLabel->setText(tr("Marker %1").arg(m_model->indexOf(active->id) + 1));
    }

    setTextQuietly(m_translationEdit, m_model->editorTranslationText());
    setTextQuietly(m_proofreadEdit, m_model->editorProofText());

    m_translationEdit->setReadOnly(!editable);
    m_translationEdit->setEnabled(active != nullptr);

    // Proofreading needs a record to attach to
    const bool hasProofTarget = active && m_model->resolveProofTarget(*active);
    m_proofreadEdit->setReadOnly(!editable || !hasProofTarget);
    m_proofreadEdit->setEnabled(hasProofTarget);
}

void TranslationEditorPanel::setTextQuietly(QPlainTextEdit* edit, const QString& text)
{
    // Untouched fields keep their cursor
    if (edit->toPlainText() == text) {
        return;
    }
    m_updating = true;
    edit->setPlainText(text);
    edit->moveCursor(QTextCursor::End);
    m_updating = false;
}
