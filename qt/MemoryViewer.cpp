#include "MemoryViewer.h"

#include <QVBoxLayout>
#include <QLineEdit>
#include <QMenuBar>
#include <QPainter>
#include <QWheelEvent>
#include <QFontDatabase>
#include <QPushButton>
#include <QMessageBox>

#include <algorithm>
#include <climits>

#include "cmd.hpp"

/* ======================================================================== */
/* GoToDialog                                                                */
/* ======================================================================== */

GoToDialog::GoToDialog(std::shared_ptr<const session::State> state, QWidget *parent)
    : QDialog(parent), m_state(std::move(state))
{
    setWindowTitle("Go To Address");
    auto *layout = new QVBoxLayout(this);

    m_input = new QLineEdit;
    m_input->setPlaceholderText("0x1000 or symbol");
    layout->addWidget(m_input);

    auto *btn = new QPushButton("Jump To");
    layout->addWidget(btn);

    connect(btn, &QPushButton::clicked, this, &QDialog::accept);
    connect(m_input, &QLineEdit::returnPressed, this, &QDialog::accept);
}

bool GoToDialog::address(uint64_t &out) const {
    if (!m_state) return false;
    QByteArray text = m_input->text().trimmed().toUtf8();
    return cmd::parse_addr(*m_state, text.constData(), out);
}

/* ======================================================================== */
/* HexArea                                                                   */
/* ======================================================================== */

HexArea::HexArea(QWidget *parent)
    : QWidget(parent)
{
    auto font = QFontDatabase::systemFont(QFontDatabase::FixedFont);
    font.setPointSize(10);
    setFont(font);
    setMinimumSize(560, 200);

    m_scrollBar = new QScrollBar(Qt::Vertical, this);
    connect(m_scrollBar, &QScrollBar::valueChanged, this, [this](int v) {
        m_topRow = (size_t)v;
        update();
    });
}

void HexArea::setSource(std::shared_ptr<const session::State> state)
{
    m_view.reset();
    m_state = std::move(state);
    m_topRow = 0;
    m_highlight = UINT64_MAX;
    if (m_state) {
        m_view = std::make_unique<scroll::ScrollBuffer<scroll::HexSource>>(*m_state->hex);
        size_t rows = m_state->hex->size();
        m_scrollBar->blockSignals(true);
        m_scrollBar->setRange(0, (int)std::min<size_t>(rows ? rows - 1 : 0, INT_MAX));
        m_scrollBar->setPageStep(std::max(visibleRows(), 1));
        m_scrollBar->setValue(0);
        m_scrollBar->blockSignals(false);
    } else {
        m_scrollBar->setRange(0, 0);
    }
    update();
}

void HexArea::goTo(uint64_t addr)
{
    if (!m_view) return;
    m_view->set_anchor(addr);
    m_highlight = addr;
    m_topRow = (size_t)std::max<int64_t>(m_view->cursor(), 0);
    m_scrollBar->blockSignals(true);
    m_scrollBar->setValue((int)std::min<size_t>(m_topRow, INT_MAX));
    m_scrollBar->blockSignals(false);
    update();
}

int HexArea::visibleRows() const
{
    return height() / std::max(fontMetrics().lineSpacing(), 1);
}

void HexArea::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    int sbw = m_scrollBar->sizeHint().width();
    m_scrollBar->setGeometry(width() - sbw, 0, sbw, height());
    m_scrollBar->setPageStep(std::max(visibleRows(), 1));
}

void HexArea::wheelEvent(QWheelEvent *event)
{
    int steps = event->angleDelta().y() / 40;
    m_scrollBar->setValue(m_scrollBar->value() - steps);
}

void HexArea::paintEvent(QPaintEvent *)
{
    QPainter p(this);
    QRect drawRect(0, 0, width() - m_scrollBar->width(), height());
    p.fillRect(drawRect, Qt::white);
    if (!m_view) return;

    QFontMetrics fm = fontMetrics();
    int lineH = fm.lineSpacing();
    int charW = fm.horizontalAdvance('0');
    int n = drawRect.height() / std::max(lineH, 1) + 1;

    m_view->set_row(m_topRow);
    auto rows = m_view->peek((size_t)n);
    for (int i = 0; i < (int)rows.size(); i++) {
        const auto &row = rows[i];
        if (m_highlight >= row.address && m_highlight < row.address + scroll::HEX_ROW_BYTES)
            p.fillRect(0, i * lineH, drawRect.width(), lineH, QColor(180, 210, 255));

        int x = charW / 2;
        int baseline = i * lineH + fm.ascent();
        for (auto &t : row.tokens) {
            QString text = QString::fromStdString(t.text);
            switch (t.kind) {
            case tokens::Kind::ADDRESS: p.setPen(QColor(0, 70, 180)); break;
            case tokens::Kind::COMMENT: p.setPen(QColor(110, 110, 110)); break;
            default:                    p.setPen(Qt::black); break;
            }
            p.drawText(x, baseline, text);
            x += fm.horizontalAdvance(text);
        }
    }
}

/* ======================================================================== */
/* MemoryViewer                                                              */
/* ======================================================================== */

MemoryViewer::MemoryViewer(session::Session &session, QWidget *parent)
    : QDockWidget("Memory", parent), m_session(session)
{
    auto *container = new QWidget;
    auto *layout = new QVBoxLayout(container);
    layout->setContentsMargins(0, 0, 0, 0);

    auto *menuBar = new QMenuBar;
    auto *goAction = menuBar->addAction("Go To...");
    goAction->setShortcut(QKeySequence("Ctrl+G"));
    connect(goAction, &QAction::triggered, this, &MemoryViewer::onGoTo);
    layout->setMenuBar(menuBar);

    m_hexArea = new HexArea;
    layout->addWidget(m_hexArea);
    setWidget(container);
}

void MemoryViewer::refresh()
{
    auto st = m_session.current();
    if (st == m_state) return;
    m_state = st;
    m_hexArea->setSource(m_state);
}

void MemoryViewer::goTo(uint64_t addr)
{
    refresh();
    m_hexArea->goTo(addr);
}

void MemoryViewer::onGoTo()
{
    if (!m_state) return;
    GoToDialog dlg(m_state, this);
    if (dlg.exec() != QDialog::Accepted) return;
    uint64_t addr;
    if (!dlg.address(addr)) {
        QMessageBox::warning(this, "Go To", "Unknown address or symbol");
        return;
    }
    m_hexArea->goTo(addr);
}
