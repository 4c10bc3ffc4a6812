#pragma once

#include <QWidget>
#include <QListWidget>
#include <QPushButton>
#include <QStringList>

// Ordered list of source files. The user reorders by drag and drop or the
// move buttons; files() returns paths in playback order.
class SourceListWidget : public QWidget {
    Q_OBJECT
public:
    explicit SourceListWidget(QWidget* parent = nullptr);
    ~SourceListWidget();

    QStringList files() const;
    void addFiles(const QStringList& paths);
    void clear();
    // Sum of probed durations, 0 if any file has none.
    double knownDuration() const;

public slots:
    void onSelectFilesClicked();

signals:
    void filesChanged(int count);

private slots:
    void onRemoveClicked();
    void onMoveUpClicked();
    void onMoveDownClicked();

private:
    static constexpr int UserRolePath = Qt::UserRole;
    static constexpr int UserRoleDuration = Qt::UserRole + 1;

    void moveCurrent(int delta);
    void renumber();

    QListWidget* m_listWidget;
    QPushButton* m_selectButton;
    QPushButton* m_removeButton;
    QPushButton* m_upButton;
    QPushButton* m_downButton;
    QPushButton* m_clearButton;
};
