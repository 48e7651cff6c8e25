#ifndef UIQT_HPP
#define UIQT_HPP

#include <QMainWindow>
#include <QTableWidget>
#include <QPushButton>
#include <QLabel>
#include <QTimer>
#include <string>
#include "Scanner.hpp"
#include "WakeService.hpp"

class UIQt : public QMainWindow {
public:
    UIQt(WakeService& service, Scanner& scanner, QWidget* parent = nullptr);
    ~UIQt();

    // Re-reads the host list, as the Reload button does.
    void reload();

private:
    WakeService& service_;
    Scanner& scanner_;

    QTableWidget* hostsTable_;
    QPushButton* wakeBtn_;
    QPushButton* rescanBtn_;
    QPushButton* reloadBtn_;
    QLabel* statusLabel_;
    QTimer* refreshTimer_;

    void buildUi();
    void refresh();
    void wakeSelected();
    std::string selectedId() const;
};

#endif // UIQT_HPP
