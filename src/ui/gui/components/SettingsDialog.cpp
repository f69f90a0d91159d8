#include "SettingsDialog.hpp"
#include "GuiSettings.hpp"
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QVBoxLayout>

SettingsDialog::SettingsDialog(QWidget* parent) : QDialog(parent)
{
    setModal(true);
    setWindowTitle("Settings");
    setupUi();
}

void SettingsDialog::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(20, 20, 20, 20);
    mainLayout->setSpacing(12);

    auto* generatorBox = new QGroupBox("Code generator", this);
    auto* generatorLayout = new QFormLayout(generatorBox);

    m_apiKey = new QLineEdit(generatorBox);
    m_apiKey->setEchoMode(QLineEdit::Password);
    m_apiKey->setPlaceholderText("Leave empty to practise with sample code");
    generatorLayout->addRow("API key:", m_apiKey);

    m_showKey = new QCheckBox("Show key", generatorBox);
    connect(m_showKey, &QCheckBox::toggled, this, &SettingsDialog::onShowKeyToggled);
    generatorLayout->addRow(m_showKey);

    m_model = new QLineEdit(generatorBox);
    generatorLayout->addRow("Model:", m_model);

    mainLayout->addWidget(generatorBox);

    auto* buttonsLayout = new QHBoxLayout();
    buttonsLayout->addStretch();

    m_cancelButton = new QPushButton("Cancel", this);
    connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    buttonsLayout->addWidget(m_cancelButton);

    m_saveButton = new QPushButton("Save", this);
    connect(m_saveButton, &QPushButton::clicked, this, &SettingsDialog::onSaveClicked);
    buttonsLayout->addWidget(m_saveButton);

    mainLayout->addLayout(buttonsLayout);
}

void SettingsDialog::setApiKey(const QString& key)
{
    m_apiKey->setText(key);
}

void SettingsDialog::setModel(const QString& model)
{
    m_model->setText(model);
}

QString SettingsDialog::apiKey() const
{
    return m_apiKey->text().trimmed();
}

QString SettingsDialog::model() const
{
    const QString model = m_model->text().trimmed();
    return model.isEmpty() ? codetyper::ui::g_defaultModel : model;
}

void SettingsDialog::onShowKeyToggled(bool checked)
{
    m_apiKey->setEchoMode(checked ? QLineEdit::Normal : QLineEdit::Password);
}

void SettingsDialog::onSaveClicked()
{
    if (m_model->text().trimmed().contains(' '))
    {
        QMessageBox::warning(this, "Validation", "Model names cannot contain spaces.");
        return;
    }
    accept();
}
