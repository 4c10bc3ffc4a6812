#include "MainWindow.h"
#include "AppConstants.h"
#include "AppTheme.h"
#include "AudiobookExporter.h"
#include "ConversionLog.h"
#include "SourceListWidget.h"
#include "TimeUtil.h"

#include <QApplication>
#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QFontDatabase>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QScrollBar>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>

MainWindow::MainWindow(const ConversionSettings& settings, bool darkTheme, QWidget* parent)
    : QMainWindow(parent)
    , m_exporter(std::make_unique<AudiobookExporter>())
    , m_darkTheme(darkTheme)
{
    m_exporter->setSettings(settings);

    setWindowTitle(QString("%1 v%2").arg(AppConstants::AppName, AppConstants::AppVersion));
    resize(AppConstants::DefaultWindowWidth, AppConstants::DefaultWindowHeight);

    setupUi();
    setupMenuBar();
    connectSignals();
    setExporting(false);

    statusBar()->showMessage("Ready");
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);

    auto* topRow = new QHBoxLayout();
    auto* heading = new QLabel(QString("<b>%1</b>").arg(AppConstants::AppName), central);
    m_themeButton = new QPushButton("Toggle Theme", central);
    auto* selectButton = new QPushButton("Select Files...", central);
    m_exportButton = new QPushButton("Export to .m4b...", central);
    m_cancelButton = new QPushButton("Cancel", central);
    topRow->addWidget(heading);
    topRow->addStretch();
    topRow->addWidget(m_themeButton);
    topRow->addWidget(selectButton);
    topRow->addWidget(m_exportButton);
    topRow->addWidget(m_cancelButton);
    layout->addLayout(topRow);

    auto* form = new QFormLayout();
    m_titleEdit = new QLineEdit(central);
    m_authorEdit = new QLineEdit(central);
    form->addRow("Title:", m_titleEdit);
    form->addRow("Author:", m_authorEdit);
    layout->addLayout(form);

    auto* splitter = new QSplitter(Qt::Horizontal, central);
    m_sourceList = new SourceListWidget(splitter);

    auto* logPane = new QWidget(splitter);
    auto* logLayout = new QVBoxLayout(logPane);
    logLayout->setContentsMargins(4, 4, 4, 4);
    logLayout->addWidget(new QLabel("FFmpeg Output:", logPane));
    m_logView = new QPlainTextEdit(logPane);
    m_logView->setReadOnly(true);
    m_logView->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    logLayout->addWidget(m_logView);
    m_progressBar = new QProgressBar(logPane);
    m_progressBar->setRange(0, 1000);
    m_progressBar->setTextVisible(false);
    logLayout->addWidget(m_progressBar);

    splitter->addWidget(m_sourceList);
    splitter->addWidget(logPane);
    splitter->setStretchFactor(1, 2);
    layout->addWidget(splitter, 1);

    setCentralWidget(central);

    connect(selectButton, &QPushButton::clicked, m_sourceList, &SourceListWidget::onSelectFilesClicked);
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    auto* selectAction = fileMenu->addAction("&Select Files...");
    connect(selectAction, &QAction::triggered, m_sourceList, &SourceListWidget::onSelectFilesClicked);

    auto* exportAction = fileMenu->addAction("&Export...");
    connect(exportAction, &QAction::triggered, this, &MainWindow::onExportRequested);

    fileMenu->addSeparator();

    auto* exitAction = fileMenu->addAction("E&xit");
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    auto* viewMenu = menuBar()->addMenu("&View");
    auto* themeAction = viewMenu->addAction("Toggle &Theme");
    connect(themeAction, &QAction::triggered, this, &MainWindow::onToggleTheme);

    auto* helpMenu = menuBar()->addMenu("&Help");
    auto* aboutAction = helpMenu->addAction("&About");
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, "About M4BMaker",
            QString("<h3>M4BMaker v%1</h3>"
                    "<p>Joins MP3 files into a tagged M4B audiobook using FFmpeg.</p>")
            .arg(AppConstants::AppVersion));
    });
}

void MainWindow::connectSignals() {
    connect(m_themeButton, &QPushButton::clicked, this, &MainWindow::onToggleTheme);
    connect(m_exportButton, &QPushButton::clicked, this, &MainWindow::onExportRequested);
    connect(m_cancelButton, &QPushButton::clicked, this, &MainWindow::onCancelRequested);
    connect(m_sourceList, &SourceListWidget::filesChanged, this, &MainWindow::onFilesChanged);

    connect(m_exporter.get(), &AudiobookExporter::started, this, &MainWindow::onExportStarted);
    connect(m_exporter.get(), &AudiobookExporter::outputLine, this, &MainWindow::onOutputLine);
    connect(m_exporter.get(), &AudiobookExporter::progress, this, &MainWindow::onProgress);
    connect(m_exporter.get(), &AudiobookExporter::finished, this, &MainWindow::onExportFinished);
    connect(m_exporter.get(), &AudiobookExporter::cancelled, this, &MainWindow::onExportCancelled);
}

void MainWindow::onToggleTheme() {
    m_darkTheme = !m_darkTheme;
    if (auto* app = qobject_cast<QApplication*>(QApplication::instance())) {
        AppTheme::apply(*app, m_darkTheme);
    }
}

void MainWindow::onFilesChanged(int count) {
    const double duration = m_sourceList->knownDuration();
    if (duration > 0.0) {
        statusBar()->showMessage(QString("%1 file(s), %2 total")
            .arg(count).arg(TimeUtil::secondsToHMS(duration)));
    } else {
        statusBar()->showMessage(QString("%1 file(s) selected").arg(count));
    }
}

void MainWindow::onExportRequested() {
    if (m_exporter->isExporting()) {
        statusBar()->showMessage("A conversion is already running");
        return;
    }

    QString output = QFileDialog::getSaveFileName(this, "Export Audiobook",
        AppConstants::DefaultOutputName, "Audiobook (*.m4b)");
    if (output.isEmpty()) return;
    if (!output.endsWith(".m4b", Qt::CaseInsensitive)) output += ".m4b";

    ExportRequest request;
    request.files = m_sourceList->files();
    request.title = m_titleEdit->text();
    request.author = m_authorEdit->text();
    request.destination = output;
    request.totalDuration = m_sourceList->knownDuration();

    m_logView->clear();
    m_progressBar->setValue(0);

    switch (m_exporter->startExport(request)) {
        case StartResult::Started:
            setExporting(true);
            break;
        case StartResult::Invalid:
        case StartResult::Busy:
            appendLog(QString("Warning: %1").arg(m_exporter->errorString()));
            statusBar()->showMessage(m_exporter->errorString());
            break;
    }
}

void MainWindow::onCancelRequested() {
    m_exporter->cancel();
    statusBar()->showMessage("Cancelling...");
}

void MainWindow::onExportStarted(const QString& commandLine) {
    appendLog("Generating m4b...");
    appendLog("Input order:");
    for (const auto& source : m_exporter->currentJob().sources) {
        appendLog(QString("  %1. %2").arg(source.position + 1).arg(source.path));
    }
    appendLog(commandLine);
    // Indeterminate until the inputs' durations are known
    if (m_exporter->totalDuration() <= 0.0) m_progressBar->setRange(0, 0);
    statusBar()->showMessage(QString("Exporting %1").arg(m_exporter->currentJob().destination));
}

void MainWindow::onOutputLine(const QString& line) {
    QString text = line;
    if (text.endsWith('\r')) text.chop(1);
    appendLog(text);
}

void MainWindow::onProgress(double fraction) {
    m_progressBar->setRange(0, 1000);
    m_progressBar->setValue(static_cast<int>(fraction * 1000.0));
}

void MainWindow::onExportFinished(bool success, const QString& message, const QStringList& tailLines) {
    setExporting(false);
    m_progressBar->setRange(0, 1000);
    if (success) {
        m_progressBar->setValue(1000);
        appendLog("FFmpeg finished successfully.");
        statusBar()->showMessage(QString("Created %1").arg(m_exporter->currentJob().destination));
        return;
    }

    m_progressBar->setValue(0);
    appendLog(QString("Error: %1").arg(message));
    if (!tailLines.isEmpty()) {
        qCWarning(lcApp).noquote() << "Engine output tail:\n" + tailLines.join('\n');
    }
    statusBar()->showMessage(message);
}

void MainWindow::onExportCancelled() {
    setExporting(false);
    m_progressBar->setRange(0, 1000);
    m_progressBar->setValue(0);
    appendLog("Conversion cancelled.");
    statusBar()->showMessage("Cancelled");
}

void MainWindow::setExporting(bool exporting) {
    m_exportButton->setEnabled(!exporting);
    m_cancelButton->setEnabled(exporting);
    m_sourceList->setEnabled(!exporting);
    m_titleEdit->setEnabled(!exporting);
    m_authorEdit->setEnabled(!exporting);
}

void MainWindow::appendLog(const QString& text) {
    m_logView->appendPlainText(text);
    m_logView->verticalScrollBar()->setValue(m_logView->verticalScrollBar()->maximum());
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (m_exporter->isExporting()) {
        auto answer = QMessageBox::question(this, "Conversion running",
            "A conversion is still running. Cancel it and quit?");
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        m_exporter->cancel();
        m_exporter->waitForWorker(AppConstants::TerminateGraceMs * 2);
        m_exporter->drainEvents();
    }
    event->accept();
}
