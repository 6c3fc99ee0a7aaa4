#include "ui/ModelSelectorDialog.h"

#include "ocr/ModelCatalog.h"

#include <QApplication>
#include <QComboBox>
#include <QCursor>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QMouseEvent>
#include <QPushButton>
#include <QScreen>
#include <QShowEvent>
#include <QTimer>
#include <QVBoxLayout>
#include <QDebug>

namespace {
constexpr int kDialogWidth = 520;
constexpr int kDialogHeight = 320;
constexpr int kTitleDragHeight = 56;
const char* const kRefreshIdleText = "↻";
const char* const kRefreshBusyText = "...";
}

ModelSelectorDialog::ModelSelectorDialog(const QStringList& models,
                                         const QString& previousModel,
                                         QWidget* parent)
    : QDialog(parent, Qt::Window | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint)
{
    setModal(true);
    setWindowModality(Qt::ApplicationModal);
    setAttribute(Qt::WA_TranslucentBackground, true);
    setWindowTitle(tr("Select Ollama Model"));

    setupUi();
    applyTheme();

    m_modelCombo->addItems(models);
    const int index = preferredIndex(models, previousModel);
    if (index >= 0) {
        m_modelCombo->setCurrentIndex(index);
    }

    setFixedSize(kDialogWidth, kDialogHeight);
}

ModelSelectorDialog::~ModelSelectorDialog() = default;

void ModelSelectorDialog::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(30, 24, 30, 24);
    mainLayout->setSpacing(12);

    m_titleLabel = new QLabel(tr("Select Ollama Model"), this);
    m_titleLabel->setObjectName("titleLabel");
    mainLayout->addWidget(m_titleLabel);

    auto* modelHeader = new QHBoxLayout();
    modelHeader->setSpacing(8);
    m_modelLabel = new QLabel(tr("Vision Model:"), this);
    m_modelLabel->setObjectName("captionLabel");
    modelHeader->addWidget(m_modelLabel);
    modelHeader->addStretch();

    m_refreshButton = new QPushButton(QString::fromUtf8(kRefreshIdleText), this);
    m_refreshButton->setObjectName("refreshButton");
    m_refreshButton->setFixedSize(36, 36);
    m_refreshButton->setToolTip(tr("Fetch installed models from Ollama"));
    m_refreshButton->setAutoDefault(false);
    connect(m_refreshButton, &QPushButton::clicked, this, &ModelSelectorDialog::refresh);
    modelHeader->addWidget(m_refreshButton);
    mainLayout->addLayout(modelHeader);

    m_modelCombo = new QComboBox(this);
    m_modelCombo->setObjectName("modelCombo");
    m_modelCombo->setFixedHeight(48);
    mainLayout->addWidget(m_modelCombo);

    mainLayout->addSpacing(8);

    m_customLabel = new QLabel(tr("Or enter custom model:"), this);
    m_customLabel->setObjectName("captionLabel");
    mainLayout->addWidget(m_customLabel);

    m_customEdit = new QLineEdit(this);
    m_customEdit->setObjectName("customEdit");
    m_customEdit->setFixedHeight(48);
    m_customEdit->setClearButtonEnabled(true);
    mainLayout->addWidget(m_customEdit);

    mainLayout->addStretch();

    auto* buttonLayout = new QHBoxLayout();
    buttonLayout->setSpacing(12);
    buttonLayout->addStretch();

    m_cancelButton = new QPushButton(tr("Cancel"), this);
    m_cancelButton->setObjectName("cancelButton");
    m_cancelButton->setFixedSize(110, 42);
    m_cancelButton->setAutoDefault(false);
    connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    buttonLayout->addWidget(m_cancelButton);

    m_continueButton = new QPushButton(tr("Continue"), this);
    m_continueButton->setObjectName("continueButton");
    m_continueButton->setFixedSize(110, 42);
    m_continueButton->setDefault(true);
    connect(m_continueButton, &QPushButton::clicked, this, &ModelSelectorDialog::onContinueClicked);
    buttonLayout->addWidget(m_continueButton);

    connect(m_customEdit, &QLineEdit::returnPressed, this, &ModelSelectorDialog::onContinueClicked);

    mainLayout->addLayout(buttonLayout);
}

void ModelSelectorDialog::applyTheme()
{
    setStyleSheet(QStringLiteral(R"(
        ModelSelectorDialog {
            background-color: rgba(30, 30, 30, 240);
            border: 1px solid rgba(255, 255, 255, 40);
            border-radius: 14px;
        }

        #titleLabel {
            color: white;
            font-size: 16pt;
            font-weight: bold;
        }

        #captionLabel {
            color: rgba(200, 200, 200, 255);
            font-size: 10pt;
            font-weight: 500;
        }

        #modelCombo, #customEdit {
            background-color: rgba(50, 50, 50, 255);
            color: white;
            border: 1px solid rgba(70, 70, 70, 255);
            border-radius: 10px;
            padding: 0 16px;
            font-size: 11pt;
        }

        #modelCombo:hover, #customEdit:hover {
            border-color: rgba(90, 90, 90, 255);
            background-color: rgba(55, 55, 55, 255);
        }

        #customEdit:focus {
            border-color: rgba(74, 158, 255, 255);
        }

        QPushButton {
            background-color: rgba(70, 70, 70, 255);
            color: white;
            border: 1px solid rgba(90, 90, 90, 255);
            border-radius: 8px;
            font-size: 11pt;
            font-weight: 500;
        }

        QPushButton:hover {
            background-color: rgba(85, 85, 85, 255);
        }

        QPushButton:disabled {
            color: rgba(160, 160, 160, 255);
        }

        #continueButton {
            background-color: rgba(74, 158, 255, 255);
            border-color: rgba(74, 158, 255, 255);
        }

        #continueButton:hover {
            background-color: rgba(96, 172, 255, 255);
        }
    )"));
}

int ModelSelectorDialog::preferredIndex(const QStringList& models, const QString& previousModel)
{
    if (models.isEmpty()) {
        return -1;
    }
    const int index = models.indexOf(previousModel);
    return index >= 0 ? index : 0;
}

QString ModelSelectorDialog::resolveChoice(const QString& comboText, const QString& customText)
{
    const QString custom = customText.trimmed();
    return custom.isEmpty() ? comboText : custom;
}

QString ModelSelectorDialog::selectedModel() const
{
    return resolveChoice(m_modelCombo->currentText(), m_customEdit->text());
}

QStringList ModelSelectorDialog::models() const
{
    QStringList result;
    for (int i = 0; i < m_modelCombo->count(); ++i) {
        result.append(m_modelCombo->itemText(i));
    }
    return result;
}

void ModelSelectorDialog::setModels(const QStringList& models)
{
    const QString current = m_modelCombo->currentText();

    m_modelCombo->clear();
    m_modelCombo->addItems(models);

    const int index = preferredIndex(models, current);
    if (index >= 0) {
        m_modelCombo->setCurrentIndex(index);
    }
}

void ModelSelectorDialog::setServerUrl(const QString& baseUrl)
{
    m_serverUrl = baseUrl;
}

void ModelSelectorDialog::refresh()
{
    if (m_serverUrl.isEmpty()) {
        qWarning() << "ModelSelectorDialog: No server URL, refresh skipped";
        return;
    }

    if (!m_catalog) {
        m_catalog = new ModelCatalog(this);
        connect(m_catalog, &ModelCatalog::modelsReady, this, &ModelSelectorDialog::onModelsReady);
    }
    if (m_catalog->isFetching()) {
        return;
    }

    m_refreshButton->setEnabled(false);
    m_refreshButton->setText(QString::fromLatin1(kRefreshBusyText));
    m_catalog->fetch(m_serverUrl);
}

void ModelSelectorDialog::onModelsReady(const QStringList& models)
{
    setModels(models);
    m_refreshButton->setText(QString::fromUtf8(kRefreshIdleText));
    m_refreshButton->setEnabled(true);
}

void ModelSelectorDialog::onContinueClicked()
{
    if (selectedModel().isEmpty()) {
        qDebug() << "ModelSelectorDialog: No model chosen";
        return;
    }
    accept();
}

void ModelSelectorDialog::showAt(const QPoint& pos)
{
    if (pos.isNull()) {
        QScreen* screen = QGuiApplication::screenAt(QCursor::pos());
        if (!screen) {
            screen = QApplication::primaryScreen();
        }
        if (screen) {
            const QRect screenGeometry = screen->geometry();
            move(screenGeometry.center() - rect().center());
        }
    } else {
        move(pos);
    }
}

void ModelSelectorDialog::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && event->position().y() <= kTitleDragHeight) {
        m_dragging = true;
        m_dragOffset = event->globalPosition().toPoint() - frameGeometry().topLeft();
        event->accept();
        return;
    }
    QDialog::mousePressEvent(event);
}

void ModelSelectorDialog::mouseMoveEvent(QMouseEvent* event)
{
    if (m_dragging && (event->buttons() & Qt::LeftButton)) {
        move(event->globalPosition().toPoint() - m_dragOffset);
        event->accept();
        return;
    }
    QDialog::mouseMoveEvent(event);
}

void ModelSelectorDialog::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_dragging = false;
    }
    QDialog::mouseReleaseEvent(event);
}

void ModelSelectorDialog::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape) {
        reject();
        event->accept();
        return;
    }
    if (event->key() == Qt::Key_Return || event->key() == Qt::Key_Enter) {
        onContinueClicked();
        event->accept();
        return;
    }
    QDialog::keyPressEvent(event);
}

void ModelSelectorDialog::showEvent(QShowEvent* event)
{
    QDialog::showEvent(event);
    auto bringToFront = [this]() {
        raise();
        activateWindow();
    };
    bringToFront();
    QTimer::singleShot(0, this, bringToFront);
    m_customEdit->setFocus();
}
