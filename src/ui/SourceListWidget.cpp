#include "SourceListWidget.h"
#include "MediaProbe.h"
#include "TimeUtil.h"
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QVBoxLayout>

SourceListWidget::SourceListWidget(QWidget* parent) : QWidget(parent) {
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    m_selectButton = new QPushButton("Select Files...", this);
    layout->addWidget(m_selectButton);

    m_listWidget = new QListWidget(this);
    m_listWidget->setSelectionMode(QAbstractItemView::SingleSelection);
    m_listWidget->setDragDropMode(QAbstractItemView::InternalMove);
    m_listWidget->setDefaultDropAction(Qt::MoveAction);
    m_listWidget->setAlternatingRowColors(true);
    layout->addWidget(m_listWidget);

    auto* buttons = new QHBoxLayout();
    m_upButton = new QPushButton("Up", this);
    m_downButton = new QPushButton("Down", this);
    m_removeButton = new QPushButton("Remove", this);
    m_clearButton = new QPushButton("Clear", this);
    buttons->addWidget(m_upButton);
    buttons->addWidget(m_downButton);
    buttons->addWidget(m_removeButton);
    buttons->addWidget(m_clearButton);
    layout->addLayout(buttons);

    connect(m_selectButton, &QPushButton::clicked, this, &SourceListWidget::onSelectFilesClicked);
    connect(m_removeButton, &QPushButton::clicked, this, &SourceListWidget::onRemoveClicked);
    connect(m_upButton, &QPushButton::clicked, this, &SourceListWidget::onMoveUpClicked);
    connect(m_downButton, &QPushButton::clicked, this, &SourceListWidget::onMoveDownClicked);
    connect(m_clearButton, &QPushButton::clicked, this, &SourceListWidget::clear);

    // Drag and drop reorders rows behind our back
    connect(m_listWidget->model(), &QAbstractItemModel::rowsMoved, this, [this]() {
        renumber();
        emit filesChanged(m_listWidget->count());
    });
}

SourceListWidget::~SourceListWidget() = default;

QStringList SourceListWidget::files() const {
    QStringList paths;
    for (int i = 0; i < m_listWidget->count(); ++i) {
        paths << m_listWidget->item(i)->data(UserRolePath).toString();
    }
    return paths;
}

void SourceListWidget::addFiles(const QStringList& paths) {
    MediaProbe probe;
    for (const auto& path : paths) {
        auto* item = new QListWidgetItem(QFileInfo(path).fileName());
        item->setData(UserRolePath, path);
        item->setToolTip(path);
        if (probe.probe(path)) {
            item->setData(UserRoleDuration, probe.info().duration);
        }
        m_listWidget->addItem(item);
    }
    renumber();
    emit filesChanged(m_listWidget->count());
}

void SourceListWidget::clear() {
    m_listWidget->clear();
    emit filesChanged(0);
}

double SourceListWidget::knownDuration() const {
    double total = 0.0;
    for (int i = 0; i < m_listWidget->count(); ++i) {
        const double duration = m_listWidget->item(i)->data(UserRoleDuration).toDouble();
        if (duration <= 0.0) return 0.0;
        total += duration;
    }
    return total;
}

void SourceListWidget::onSelectFilesClicked() {
    QStringList paths = QFileDialog::getOpenFileNames(this, "Select Audio Files", {},
        "Audio (*.mp3);;All Files (*)");
    if (paths.isEmpty()) return;
    addFiles(paths);
}

void SourceListWidget::onRemoveClicked() {
    int row = m_listWidget->currentRow();
    if (row < 0) return;
    delete m_listWidget->takeItem(row);
    renumber();
    emit filesChanged(m_listWidget->count());
}

void SourceListWidget::onMoveUpClicked() {
    moveCurrent(-1);
}

void SourceListWidget::onMoveDownClicked() {
    moveCurrent(1);
}

void SourceListWidget::moveCurrent(int delta) {
    int row = m_listWidget->currentRow();
    int target = row + delta;
    if (row < 0 || target < 0 || target >= m_listWidget->count()) return;

    QListWidgetItem* item = m_listWidget->takeItem(row);
    m_listWidget->insertItem(target, item);
    m_listWidget->setCurrentRow(target);
    renumber();
    emit filesChanged(m_listWidget->count());
}

void SourceListWidget::renumber() {
    for (int i = 0; i < m_listWidget->count(); ++i) {
        QListWidgetItem* item = m_listWidget->item(i);
        const QString path = item->data(UserRolePath).toString();
        QString label = QString("%1. %2").arg(i + 1).arg(QFileInfo(path).fileName());
        const double duration = item->data(UserRoleDuration).toDouble();
        if (duration > 0.0) {
            label += QString("  (%1)").arg(TimeUtil::secondsToMMSS(duration));
        }
        item->setText(label);
    }
}
