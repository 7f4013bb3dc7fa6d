#ifndef DISASMVIEW_H
#define DISASMVIEW_H

#include <QWidget>
#include <QScrollBar>

#include <memory>
#include <vector>

#include "scroll.hpp"
#include "session.hpp"

/* ======================================================================== */
/* DisasmView                                                                */
/* ======================================================================== */

class DisasmView : public QWidget {
    Q_OBJECT
public:
    explicit DisasmView(session::Session &session, QWidget *parent = nullptr);

    /* Pick up the session's current state (after a load). */
    void refresh();

    /* Scroll so the row addr anchors to is at the top and select it. */
    void goToAddress(uint64_t addr);

    /* Return to the row before the last followed reference. */
    void goBack();

signals:
    void statusMessage(const QString &msg);
    void addressSelected(quint64 addr);

protected:
    void resizeEvent(QResizeEvent *e) override;
    void wheelEvent(QWheelEvent *e) override;
    void paintEvent(QPaintEvent *e) override;
    void mousePressEvent(QMouseEvent *e) override;
    void mouseMoveEvent(QMouseEvent *e) override;
    void keyPressEvent(QKeyEvent *e) override;

private:
    struct Link {
        QRect    rect;
        uint64_t target;
    };

    struct Arrow {
        int srcRow, dstRow;     // visible row, -1/-2 = above/below the view
        int column;
    };

    void onScrollChanged(int value);
    void setTopRow(size_t row);
    void followReference(uint64_t target);
    int visibleRows() const;
    std::vector<Arrow> buildArrows(const std::vector<scroll::Row> &rows) const;

    session::Session &m_session;
    std::shared_ptr<const session::State> m_state;
    std::unique_ptr<scroll::ScrollBuffer<scroll::ListingSource>> m_view;
    QScrollBar *m_scrollBar;

    size_t              m_topRow = 0;
    uint64_t            m_selectedAddr = UINT64_MAX;
    std::vector<size_t> m_history;
    std::vector<Link>   m_links;
};

#endif // DISASMVIEW_H
