#pragma once

#include <QMainWindow>
#include <QStringList>
#include <memory>
#include "ConversionTypes.h"

class QLineEdit;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class SourceListWidget;
class AudiobookExporter;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const ConversionSettings& settings, bool darkTheme = true,
                        QWidget* parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onToggleTheme();
    void onExportRequested();
    void onCancelRequested();
    void onFilesChanged(int count);
    void onExportStarted(const QString& commandLine);
    void onOutputLine(const QString& line);
    void onProgress(double fraction);
    void onExportFinished(bool success, const QString& message, const QStringList& tailLines);
    void onExportCancelled();

private:
    void setupUi();
    void setupMenuBar();
    void connectSignals();
    void setExporting(bool exporting);
    void appendLog(const QString& text);

    SourceListWidget* m_sourceList = nullptr;
    QLineEdit* m_titleEdit = nullptr;
    QLineEdit* m_authorEdit = nullptr;
    QPushButton* m_themeButton = nullptr;
    QPushButton* m_exportButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
    QPlainTextEdit* m_logView = nullptr;
    QProgressBar* m_progressBar = nullptr;

    std::unique_ptr<AudiobookExporter> m_exporter;
    bool m_darkTheme = true;
};
