#pragma once

// ============================================================================
// TranslationEditorPanel - Text fields of the active marker
// ============================================================================
// Part of the TransDesk workbench engine
//
// Shows the translation and proofread text of SourceModel's active source
// and feeds every keystroke back through editTranslation()/editProofread(),
// so typing reaches the backend through EditSyncQueue. Model-side changes
// (acknowledgements, a new active marker) arrive via editorBuffersChanged().
// ============================================================================

#include <QWidget>
#include <QPointer>

class QLabel;
class QPlainTextEdit;
class SourceModel;

class TranslationEditorPanel : public QWidget {
    Q_OBJECT

public:
    explicit TranslationEditorPanel(SourceModel* model, QWidget* parent = nullptr);
    ~TranslationEditorPanel() override;

    QPlainTextEdit* translationEdit() const { return m_translationEdit; }
    QPlainTextEdit* proofreadEdit() const { return m_proofreadEdit; }

private slots:
    void onTranslationTyped();
    void onProofreadTyped();

private:
    void setupUI();

    /**
     * @brief Pull the editor buffers and field states from the model.
     */
    void refresh();
    void setTextQuietly(QPlainTextEdit* edit, const QString& text);

    QPointer<SourceModel> m_model;

    QLabel* m_titleLabel = nullptr;
    QPlainTextEdit* m_translationEdit = nullptr;
    QPlainTextEdit* m_proofreadEdit = nullptr;

    bool m_updating = false;  ///< Set while the panel writes model text into the fields
};
