#include "UIQt.hpp"
#include <QtWidgets/QTableWidgetItem>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QStatusBar>

UIQt::UIQt(WakeService& service, Scanner& scanner, QWidget* parent)
    : QMainWindow(parent), service_(service), scanner_(scanner) {
    buildUi();
    refresh();
    refreshTimer_ = new QTimer(this);
    connect(refreshTimer_, &QTimer::timeout, this, &UIQt::refresh);
    refreshTimer_->start(1000);
}

UIQt::~UIQt() {}

void UIQt::buildUi() {
    setWindowTitle("LANWake");
    QWidget* central = new QWidget(this);
    setCentralWidget(central);
    auto* layout = new QVBoxLayout(central);

    hostsTable_ = new QTableWidget(0, 4, this);
    hostsTable_->setHorizontalHeaderLabels({"ID", "Name", "MAC", "State"});
    hostsTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    hostsTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    hostsTable_->setSelectionMode(QAbstractItemView::SingleSelection);
    hostsTable_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    layout->addWidget(hostsTable_);

    auto* h = new QHBoxLayout();
    wakeBtn_ = new QPushButton("Wake", this);
    rescanBtn_ = new QPushButton("Rescan", this);
    reloadBtn_ = new QPushButton("Reload list", this);
    h->addWidget(wakeBtn_);
    h->addWidget(rescanBtn_);
    h->addWidget(reloadBtn_);
    layout->addLayout(h);

    statusLabel_ = new QLabel(this);
    layout->addWidget(statusLabel_);

    connect(wakeBtn_, &QPushButton::clicked, [this]() { wakeSelected(); });
    connect(hostsTable_, &QTableWidget::cellDoubleClicked, [this](int, int) { wakeSelected(); });
    connect(rescanBtn_, &QPushButton::clicked, [this]() {
        scanner_.trigger();
        statusLabel_->setText("Rescan requested.");
    });
    connect(reloadBtn_, &QPushButton::clicked, [this]() { reload(); });
}

std::string UIQt::selectedId() const {
    int row = hostsTable_->currentRow();
    if (row < 0) return std::string();
    QTableWidgetItem* item = hostsTable_->item(row, 0);
    if (!item) return std::string();
    return item->text().toStdString();
}

void UIQt::wakeSelected() {
    std::string id = selectedId();
    if (id.empty()) {
        QMessageBox::information(this, "Wake", "Select a host first");
        return;
    }
    WakeRequestResult result = service_.request_wake(id);
    QString text = QString::fromStdString(id + ": " + name_for(result));
    if (!succeeded(result)) {
        QMessageBox::warning(this, "Wake", text);
        return;
    }
    statusLabel_->setText(text);
}

void UIQt::reload() {
    if (service_.reload()) {
        statusLabel_->setText("Host list reloaded.");
        refresh();
    } else {
        QMessageBox::warning(this, "Reload", "Host list reload failed, current hosts kept");
    }
}

void UIQt::refresh() {
    std::string selected = selectedId();
    auto hosts = service_.all_statuses();
    hostsTable_->setRowCount(0);
    int r = 0;
    for (const auto& h : hosts) {
        hostsTable_->insertRow(r);
        hostsTable_->setItem(r, 0, new QTableWidgetItem(QString::fromStdString(h.id)));
        hostsTable_->setItem(r, 1, new QTableWidgetItem(QString::fromStdString(h.display_name)));
        hostsTable_->setItem(r, 2, new QTableWidgetItem(QString::fromStdString(h.hardware_address.to_string())));
        hostsTable_->setItem(r, 3, new QTableWidgetItem(QString::fromStdString(state_label(h))));
        if (h.id == selected) hostsTable_->setCurrentCell(r, 0);
        ++r;
    }
    statusBar()->showMessage(QString("%1 scans completed").arg(static_cast<qulonglong>(scanner_.cycles_completed())));
}
