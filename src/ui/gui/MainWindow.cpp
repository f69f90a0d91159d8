#include "MainWindow.hpp"
#include "GuiSettings.hpp"
#include "codetyper/core/TypingMetrics.hpp"
#include "codetyper/generation/CodeSourceService.hpp"
#include "codetyper/generation/Language.hpp"
#include <QAction>
#include <QApplication>
#include <QDebug>
#include <QFrame>
#include <QHBoxLayout>
#include <QMenuBar>
#include <QMessageBox>
#include <QSplitter>
#include <QVBoxLayout>
#include <chrono>
#include <cstdint>
#include <utility>

namespace
{
constexpr int g_defaultWidth = 1000;
constexpr int g_defaultHeight = 700;
constexpr int g_tickIntervalMs = 1000;
constexpr int g_codePaneHeight = 400;
constexpr int g_inputPaneHeight = 300;
constexpr int g_timerFontSize = 14;

QString formatClock(std::int64_t seconds)
{
    if (seconds < 0)
    {
        seconds = 0;
    }
    return QString("%1:%2")
        .arg(static_cast<qlonglong>(seconds / 60), 2, 10, QChar('0'))
        .arg(static_cast<qlonglong>(seconds % 60), 2, 10, QChar('0'));
}

QString durationLabel(std::chrono::seconds duration)
{
    const auto seconds = duration.count();
    if (seconds < 60)
    {
        return QString("%1 seconds").arg(seconds);
    }
    const auto minutes = seconds / 60;
    return minutes == 1 ? QString("1 minute") : QString("%1 minutes").arg(minutes);
}
} // namespace

MainWindow::MainWindow(ProviderFactory providerFactory, QString fallbackApiKey)
    : m_providerFactory(std::move(providerFactory)), m_fallbackApiKey(std::move(fallbackApiKey))
{
    setWindowTitle("Code Typing Practice");
    resize(g_defaultWidth, g_defaultHeight);

    setupUi();
    setupMenu();

    m_session.addSessionObserver(*this);
    m_typingInput->attachSession(&m_session);
}

MainWindow::~MainWindow()
{
    // Child widgets outlive the members; drop the subscription while the session still exists.
    m_typingInput->attachSession(nullptr);
}

void MainWindow::setupUi()
{
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* central = new QWidget(this);
    setCentralWidget(central);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* mainLayout = new QVBoxLayout(central);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* settingsFrame = new QFrame(central);
    settingsFrame->setFrameShape(QFrame::StyledPanel);
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* settingsLayout = new QHBoxLayout(settingsFrame);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    settingsLayout->addWidget(new QLabel("Programming Language:", settingsFrame));
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_languageCombo = new QComboBox(settingsFrame);
    m_languageCombo->setObjectName("LanguageCombo");
    for (const auto language : codetyper::generation::g_allLanguages)
    {
        const auto name = codetyper::generation::displayName(language);
        const auto id = codetyper::generation::languageId(language);
        m_languageCombo->addItem(QString::fromUtf8(name.data(), static_cast<qsizetype>(name.size())),
                                 QString::fromUtf8(id.data(), static_cast<qsizetype>(id.size())));
    }
    const int savedLanguage = m_languageCombo->findData(codetyper::ui::readLanguageId());
    m_languageCombo->setCurrentIndex(savedLanguage >= 0 ? savedLanguage : 0);
    settingsLayout->addWidget(m_languageCombo);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    settingsLayout->addWidget(new QLabel("Timer Duration:", settingsFrame));
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_durationCombo = new QComboBox(settingsFrame);
    m_durationCombo->setObjectName("DurationCombo");
    for (const auto preset : codetyper::core::g_durationPresets)
    {
        m_durationCombo->addItem(durationLabel(preset), static_cast<int>(preset.count()));
    }
    const int savedDuration = m_durationCombo->findData(codetyper::ui::readDurationSeconds());
    m_durationCombo->setCurrentIndex(savedDuration >= 0 ? savedDuration : 0);
    settingsLayout->addWidget(m_durationCombo);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_startButton = new QPushButton("Start Game", settingsFrame);
    m_startButton->setObjectName("StartButton");
    connect(m_startButton, &QPushButton::clicked, this, &MainWindow::startGame);
    settingsLayout->addWidget(m_startButton);

    mainLayout->addWidget(settingsFrame);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* splitter = new QSplitter(Qt::Vertical, central);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_codeDisplay = new CodeDisplay(splitter);
    splitter->addWidget(m_codeDisplay);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_typingInput = new TypingInput(splitter);
    m_typingInput->setEnabled(false);
    splitter->addWidget(m_typingInput);
    splitter->setSizes({ g_codePaneHeight, g_inputPaneHeight });

    connect(m_typingInput, &TypingInput::typingProgress, this, &MainWindow::onTypingProgress);

    mainLayout->addWidget(splitter);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_progressBar = new QProgressBar(central);
    m_progressBar->setRange(0, 100);
    m_progressBar->setValue(0);
    mainLayout->addWidget(m_progressBar);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_timerLabel = new QLabel("Time: 00:00", central);
    m_timerLabel->setObjectName("TimerLabel");
    m_timerLabel->setAlignment(Qt::AlignCenter);
    QFont timerFont = m_timerLabel->font();
    timerFont.setPointSize(g_timerFontSize);
    timerFont.setBold(true);
    m_timerLabel->setFont(timerFont);
    mainLayout->addWidget(m_timerLabel);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_gameTimer = new QTimer(this);
    m_gameTimer->setObjectName("GameTimer");
    m_gameTimer->setInterval(g_tickIntervalMs);
    connect(m_gameTimer, &QTimer::timeout, this, &MainWindow::onTick);
}

void MainWindow::setupMenu()
{
    auto* fileMenu = menuBar()->addMenu("&File");

    auto* settingsAction = fileMenu->addAction("&Settings...");
    connect(settingsAction, &QAction::triggered, this, &MainWindow::openSettings);

    fileMenu->addSeparator();

    auto* quitAction = fileMenu->addAction("&Quit");
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);
}

void MainWindow::openSettings()
{
    if (m_settingsDialog == nullptr)
    {
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        m_settingsDialog = new SettingsDialog(this);
    }

    m_settingsDialog->setApiKey(codetyper::ui::readApiKey());
    m_settingsDialog->setModel(codetyper::ui::readModel());

    if (m_settingsDialog->exec() != QDialog::Accepted)
    {
        return;
    }

    codetyper::ui::writeApiKey(m_settingsDialog->apiKey());
    codetyper::ui::writeModel(m_settingsDialog->model());
}

codetyper::generation::providers::InferenceConfig MainWindow::inferenceConfig() const
{
    codetyper::generation::providers::InferenceConfig config{};
    config.apiKey = codetyper::ui::readApiKey(m_fallbackApiKey).toStdString();
    config.model = codetyper::ui::readModel().toStdString();
    return config;
}

void MainWindow::startGame()
{
    const QString languageId = m_languageCombo->currentData().toString();
    const auto language =
        codetyper::generation::parseLanguage(languageId.toStdString()).value_or(codetyper::generation::g_defaultLanguage);
    const int durationSeconds = m_durationCombo->currentData().toInt();

    codetyper::ui::writeLanguageId(languageId);
    codetyper::ui::writeDurationSeconds(durationSeconds);

    const auto config = inferenceConfig();
    auto provider = m_providerFactory(config);
    codetyper::generation::CodeSourceService source(*provider, config.band);

    QApplication::setOverrideCursor(Qt::WaitCursor);
    auto snippet = source.acquireSnippet(language);
    QApplication::restoreOverrideCursor();

    if (snippet.warning.has_value())
    {
        const QString warning = QString::fromStdString(*snippet.warning);
        qWarning() << "Code generation fell back to sample code:" << warning;
        QMessageBox::warning(this, "Code Generation Warning", warning);
    }

    const QString code = QString::fromStdString(snippet.text);
    m_codeDisplay->setCode(code);
    m_typingInput->clear();
    m_progressBar->setValue(0);

    setSettingsEnabled(false);
    m_typingInput->setEnabled(true);
    m_typingInput->setFocus();

    m_session.start(code.toStdU32String(), std::chrono::seconds{ durationSeconds });

    // An empty target ends inside start(); keep the end label.
    if (m_session.isRunning())
    {
        updateTimerDisplay();
        m_gameTimer->start();
    }
}

const codetyper::core::PracticeSession& MainWindow::session() const noexcept
{
    return m_session;
}

void MainWindow::onTick()
{
    if (m_session.tick())
    {
        // onSessionEnded already replaced the clock with the end label.
        return;
    }
    updateTimerDisplay();
}

void MainWindow::onTypingProgress(int position, bool correct)
{
    const auto index = static_cast<std::size_t>(position);
    m_codeDisplay->highlightPosition(index, correct);
    m_codeDisplay->scrollToPosition(index);

    // Emitted before the caret moves, so count the character being accepted.
    const auto typed = correct ? index + 1 : index;
    const auto progress = codetyper::core::progressPercentage(typed, m_session.matcher().buffer().length());
    m_progressBar->setValue(static_cast<int>(progress));
}

void MainWindow::onSessionEnded(const codetyper::core::SessionSummary& summary)
{
    m_gameTimer->stop();
    m_typingInput->setEnabled(false);
    setSettingsEnabled(true);

    const bool completed = summary.state == codetyper::core::SessionState::Completed;
    m_timerLabel->setText(completed ? "Completed!" : "Time's Up!");

    emit gameEnded(summary.state);

    // Defer the modal dialog until the key or tick handler that ended the session has returned.
    QTimer::singleShot(0, this, [this, summary]() { showResults(summary); });
}

void MainWindow::showResults(const codetyper::core::SessionSummary& summary)
{
    QString message = summary.state == codetyper::core::SessionState::Completed
                          ? "Congratulations! You completed the typing exercise.\n\n"
                          : "Time's up!\n\n";

    message += QString("Accuracy: %1%\n").arg(summary.accuracy, 0, 'f', 1);
    message += QString("Speed: %1 WPM\n").arg(summary.wordsPerMinute, 0, 'f', 1);
    message += QString("Progress: %1%\n").arg(summary.progress, 0, 'f', 1);

    QMessageBox::information(this, "Game Results", message);
}

void MainWindow::setSettingsEnabled(bool enabled)
{
    m_languageCombo->setEnabled(enabled);
    m_durationCombo->setEnabled(enabled);
    m_startButton->setEnabled(enabled);
}

void MainWindow::updateTimerDisplay()
{
    m_timerLabel->setText("Time: " + formatClock(m_session.timer().remainingSeconds()));
}
