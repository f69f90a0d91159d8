#ifndef CODETYPER_SETTINGS_DIALOG_HPP
#define CODETYPER_SETTINGS_DIALOG_HPP

#include <QCheckBox>
#include <QDialog>
#include <QLineEdit>
#include <QPushButton>
#include <QString>

class SettingsDialog final : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(QWidget* parent = nullptr);

    void setApiKey(const QString& key);
    void setModel(const QString& model);

    [[nodiscard]] QString apiKey() const;
    [[nodiscard]] QString model() const;

private slots:
    void onShowKeyToggled(bool checked);
    void onSaveClicked();

private:
    void setupUi();

    QLineEdit* m_apiKey{ nullptr };
    QCheckBox* m_showKey{ nullptr };
    QLineEdit* m_model{ nullptr };
    QPushButton* m_saveButton{ nullptr };
    QPushButton* m_cancelButton{ nullptr };
};

#endif // CODETYPER_SETTINGS_DIALOG_HPP
