#ifndef SRC_UI_GUI_MAINWINDOW_HPP
#define SRC_UI_GUI_MAINWINDOW_HPP
#include "codetyper/core/PracticeSession.hpp"
#include "codetyper/generation/ICodeProvider.hpp"
#include "codetyper/generation/providers/InferenceProviderFactory.hpp"
#include "components/CodeDisplay.hpp"
#include "components/SettingsDialog.hpp"
#include "components/TypingInput.hpp"
#include <QComboBox>
#include <QLabel>
#include <QMainWindow>
#include <QProgressBar>
#include <QPushButton>
#include <QTimer>
#include <functional>
#include <memory>

using ProviderFactory = std::function<std::unique_ptr<codetyper::generation::ICodeProvider>(
    codetyper::generation::providers::InferenceConfig)>;

class MainWindow : public QMainWindow, private codetyper::core::ISessionObserver
{
    Q_OBJECT
public:
    MainWindow(ProviderFactory providerFactory, QString fallbackApiKey);
    ~MainWindow() override;

    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;
    MainWindow(MainWindow&&) = delete;
    MainWindow& operator=(MainWindow&&) = delete;

    void startGame();

    [[nodiscard]] const codetyper::core::PracticeSession& session() const noexcept;

signals:
    void gameEnded(codetyper::core::SessionState state);

private:
    void setupUi();
    void setupMenu();
    void openSettings();
    void onTick();
    void onTypingProgress(int position, bool correct);
    void onSessionEnded(const codetyper::core::SessionSummary& summary) override;
    void showResults(const codetyper::core::SessionSummary& summary);
    void setSettingsEnabled(bool enabled);
    void updateTimerDisplay();
    [[nodiscard]] codetyper::generation::providers::InferenceConfig inferenceConfig() const;

    ProviderFactory m_providerFactory;
    QString m_fallbackApiKey;
    codetyper::core::PracticeSession m_session;

    QComboBox* m_languageCombo{ nullptr };
    QComboBox* m_durationCombo{ nullptr };
    QPushButton* m_startButton{ nullptr };
    CodeDisplay* m_codeDisplay{ nullptr };
    TypingInput* m_typingInput{ nullptr };
    QProgressBar* m_progressBar{ nullptr };
    QLabel* m_timerLabel{ nullptr };
    QTimer* m_gameTimer{ nullptr };
    SettingsDialog* m_settingsDialog{ nullptr };
};

#endif // SRC_UI_GUI_MAINWINDOW_HPP
