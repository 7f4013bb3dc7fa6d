#ifndef MEMORYVIEWER_H
#define MEMORYVIEWER_H

#include <QDockWidget>
#include <QWidget>
#include <QDialog>
#include <QScrollBar>
#include <stdint.h>

#include <memory>

#include "scroll.hpp"
#include "session.hpp"

QT_BEGIN_NAMESPACE
class QLineEdit;
QT_END_NAMESPACE

/* ======================================================================== */
/* GoToDialog                                                                */
/* ======================================================================== */

/* Accepts a hex address or a symbol name of the given state. */
class GoToDialog : public QDialog {
    Q_OBJECT
public:
    explicit GoToDialog(std::shared_ptr<const session::State> state,
                        QWidget *parent = nullptr);
    bool address(uint64_t &out) const;

private:
    std::shared_ptr<const session::State> m_state;
    QLineEdit *m_input;
};

/* ======================================================================== */
/* HexArea                                                                   */
/* ======================================================================== */

class HexArea : public QWidget {
    Q_OBJECT
public:
    explicit HexArea(QWidget *parent = nullptr);

    void setSource(std::shared_ptr<const session::State> state);
    void goTo(uint64_t addr);

protected:
    void paintEvent(QPaintEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;

private:
    int visibleRows() const;

    std::shared_ptr<const session::State> m_state;
    std::unique_ptr<scroll::ScrollBuffer<scroll::HexSource>> m_view;
    QScrollBar *m_scrollBar;
    size_t      m_topRow = 0;
    uint64_t    m_highlight = UINT64_MAX;
};

/* ======================================================================== */
/* MemoryViewer                                                              */
/* ======================================================================== */

class MemoryViewer : public QDockWidget {
    Q_OBJECT
public:
    explicit MemoryViewer(session::Session &session, QWidget *parent = nullptr);

    void refresh();
    void goTo(uint64_t addr);

private slots:
    void onGoTo();

private:
    session::Session &m_session;
    std::shared_ptr<const session::State> m_state;
    HexArea *m_hexArea;
};

#endif // MEMORYVIEWER_H
