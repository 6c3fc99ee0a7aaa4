#ifndef MODELSELECTORDIALOG_H
#define MODELSELECTORDIALOG_H

#include <QDialog>
#include <QPoint>
#include <QString>
#include <QStringList>

class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QKeyEvent;
class QMouseEvent;
class QShowEvent;
class ModelCatalog;

/**
 * @brief Dialog for choosing the vision model used for OCR.
 *
 * accept() means selectedModel() holds a non-empty choice; reject()
 * means the user cancelled. Persisting the choice is up to the caller.
 */
class ModelSelectorDialog : public QDialog
{
    Q_OBJECT

public:
    ModelSelectorDialog(const QStringList& models,
                        const QString& previousModel,
                        QWidget* parent = nullptr);
    ~ModelSelectorDialog() override;

    QString selectedModel() const;
    QStringList models() const;

    // Replace the candidates, keeping the current choice when still listed
    void setModels(const QStringList& models);

    // Ollama base URL used by the refresh button
    void setServerUrl(const QString& baseUrl);

    void showAt(const QPoint& pos = QPoint());

    QComboBox* modelCombo() const { return m_modelCombo; }
    QLineEdit* customEdit() const { return m_customEdit; }
    QPushButton* refreshButton() const { return m_refreshButton; }
    QPushButton* continueButton() const { return m_continueButton; }
    QPushButton* cancelButton() const { return m_cancelButton; }

    static int preferredIndex(const QStringList& models, const QString& previousModel);

    // Trimmed custom text wins over the combo selection
    static QString resolveChoice(const QString& comboText, const QString& customText);

public slots:
    void refresh();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void showEvent(QShowEvent* event) override;

private slots:
    void onContinueClicked();
    void onModelsReady(const QStringList& models);

private:
    void setupUi();
    void applyTheme();

    QLabel* m_titleLabel = nullptr;
    QLabel* m_modelLabel = nullptr;
    QLabel* m_customLabel = nullptr;
    QComboBox* m_modelCombo = nullptr;
    QLineEdit* m_customEdit = nullptr;
    QPushButton* m_refreshButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
    QPushButton* m_continueButton = nullptr;

    ModelCatalog* m_catalog = nullptr;
    QString m_serverUrl;
    QPoint m_dragOffset;
    bool m_dragging = false;
};

#endif // MODELSELECTORDIALOG_H
