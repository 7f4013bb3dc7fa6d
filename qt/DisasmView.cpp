#include "DisasmView.h"

#include <QPainter>
#include <QFont>
#include <QFontMetrics>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QWheelEvent>
#include <QToolTip>

#include <algorithm>
#include <climits>

static constexpr int ARROW_PANE_W = 48;
static constexpr int ARROW_SPACING = 8;

static QColor token_color(tokens::Kind kind)
{
    switch (kind) {
    case tokens::Kind::ADDRESS:    return QColor(0, 70, 180);
    case tokens::Kind::BYTES:      return QColor(130, 130, 130);
    case tokens::Kind::MNEMONIC:   return QColor(0, 0, 0);
    case tokens::Kind::REGISTER:   return QColor(120, 40, 140);
    case tokens::Kind::IMMEDIATE:  return QColor(160, 80, 0);
    case tokens::Kind::SYMBOL:     return QColor(0, 110, 60);
    case tokens::Kind::INVALID:    return QColor(200, 0, 0);
    case tokens::Kind::LABEL:      return QColor(0, 0, 0);
    case tokens::Kind::COMMENT:    return QColor(110, 110, 110);
    case tokens::Kind::UNRESOLVED: return QColor(150, 150, 150);
    case tokens::Kind::DELIMITER:  break;
    }
    return QColor(60, 60, 60);
}

DisasmView::DisasmView(session::Session &session, QWidget *parent)
    : QWidget(parent), m_session(session)
{
    QFont mono("Monospace", 10);
    mono.setStyleHint(QFont::Monospace);
    setFont(mono);
    setMinimumSize(480, 300);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);

    m_scrollBar = new QScrollBar(Qt::Vertical, this);
    connect(m_scrollBar, &QScrollBar::valueChanged,
            this, &DisasmView::onScrollChanged);
}

void DisasmView::refresh()
{
    auto st = m_session.current();
    if (st == m_state) return;

    m_view.reset();
    m_state = st;
    m_history.clear();
    m_selectedAddr = UINT64_MAX;
    m_topRow = 0;

    if (m_state) {
        m_view = std::make_unique<scroll::ScrollBuffer<scroll::ListingSource>>(*m_state->listing);
        size_t rows = m_state->listing->size();
        m_scrollBar->blockSignals(true);
        m_scrollBar->setRange(0, (int)std::min<size_t>(rows ? rows - 1 : 0, INT_MAX));
        m_scrollBar->setSingleStep(1);
        m_scrollBar->setPageStep(std::max(visibleRows(), 1));
        m_scrollBar->blockSignals(false);
        goToAddress(m_state->image->entry);
    } else {
        m_scrollBar->setRange(0, 0);
    }
    update();
}

void DisasmView::goToAddress(uint64_t addr)
{
    if (!m_view) return;
    m_view->set_anchor(addr);
    m_selectedAddr = addr;
    setTopRow((size_t)std::max<int64_t>(m_view->cursor(), 0));
    emit addressSelected(addr);
}

void DisasmView::goBack()
{
    if (m_history.empty()) return;
    size_t row = m_history.back();
    m_history.pop_back();
    setTopRow(row);
}

void DisasmView::followReference(uint64_t target)
{
    if (!m_state) return;
    auto row = m_state->listing->row_of_entry(target);
    if (!row) {
        emit statusMessage(QString("No instruction starts at %1")
                           .arg(target, 0, 16));
        return;
    }
    m_history.push_back(m_topRow);
    m_selectedAddr = target;
    /* Keep the label row above the target in view. */
    setTopRow(*row > 0 && *row - 1 < m_state->listing->size() &&
              m_state->listing->row(*row - 1).kind == scroll::RowKind::LABEL
              ? *row - 1 : *row);
    emit addressSelected(target);
}

void DisasmView::setTopRow(size_t row)
{
    if (!m_view) return;
    size_t rows = m_state->listing->size();
    if (rows && row >= rows) row = rows - 1;
    m_topRow = row;
    m_scrollBar->blockSignals(true);
    m_scrollBar->setValue((int)std::min<size_t>(row, INT_MAX));
    m_scrollBar->blockSignals(false);
    update();
}

void DisasmView::onScrollChanged(int value)
{
    m_topRow = (size_t)value;
    update();
}

int DisasmView::visibleRows() const
{
    QFontMetrics fm(font());
    return height() / std::max(fm.lineSpacing(), 1);
}

/* ======================================================================== */
/* Jump arrows                                                               */
/* ======================================================================== */

std::vector<DisasmView::Arrow>
DisasmView::buildArrows(const std::vector<scroll::Row> &rows) const
{
    std::vector<Arrow> arrows;
    const auto &an = m_state->analysis;
    const auto &listing = *m_state->listing;

    for (int i = 0; i < (int)rows.size(); i++) {
        if (rows[i].kind != scroll::RowKind::INSTRUCTION) continue;
        auto idx = an.find(rows[i].address);
        if (!idx) continue;
        const auto &insn = an.stream[*idx];
        if (!insn.has_target) continue;
        if (insn.flow != arch::Flow::BRANCH && insn.flow != arch::Flow::COND_BRANCH)
            continue;
        auto dst = listing.row_of_entry(insn.target);
        if (!dst) continue;

        int dstRow;
        if (*dst < m_topRow)
            dstRow = -1;
        else if (*dst >= m_topRow + rows.size())
            dstRow = -2;
        else
            dstRow = (int)(*dst - m_topRow);
        arrows.push_back({ i, dstRow, 0 });
    }

    auto span = [&](const Arrow &a) {
        int d = a.dstRow == -1 ? -1 : a.dstRow == -2 ? (int)rows.size() : a.dstRow;
        return std::make_pair(std::min(a.srcRow, d), std::max(a.srcRow, d));
    };

    /* Short arrows take the inner columns. */
    std::sort(arrows.begin(), arrows.end(), [&](const Arrow &a, const Arrow &b) {
        auto sa = span(a), sb = span(b);
        return sa.second - sa.first < sb.second - sb.first;
    });
    for (size_t i = 0; i < arrows.size(); i++) {
        auto si = span(arrows[i]);
        int col = 0;
        for (bool clash = true; clash; ) {
            clash = false;
            for (size_t j = 0; j < i; j++) {
                auto sj = span(arrows[j]);
                if (arrows[j].column == col && si.first <= sj.second && sj.first <= si.second) {
                    clash = true;
                    col++;
                    break;
                }
            }
        }
        arrows[i].column = col;
    }
    return arrows;
}

/* ======================================================================== */
/* Events                                                                    */
/* ======================================================================== */

void DisasmView::resizeEvent(QResizeEvent *e)
{
    QWidget::resizeEvent(e);
    int sbw = m_scrollBar->sizeHint().width();
    m_scrollBar->setGeometry(width() - sbw, 0, sbw, height());
    m_scrollBar->setPageStep(std::max(visibleRows(), 1));
}

void DisasmView::wheelEvent(QWheelEvent *e)
{
    int steps = e->angleDelta().y() / 40;
    m_scrollBar->setValue(m_scrollBar->value() - steps);
}

void DisasmView::keyPressEvent(QKeyEvent *e)
{
    switch (e->key()) {
    case Qt::Key_Up:       m_scrollBar->setValue(m_scrollBar->value() - 1); break;
    case Qt::Key_Down:     m_scrollBar->setValue(m_scrollBar->value() + 1); break;
    case Qt::Key_PageUp:   m_scrollBar->setValue(m_scrollBar->value() - m_scrollBar->pageStep()); break;
    case Qt::Key_PageDown: m_scrollBar->setValue(m_scrollBar->value() + m_scrollBar->pageStep()); break;
    case Qt::Key_Backspace:
    case Qt::Key_Escape:   goBack(); break;
    default:               QWidget::keyPressEvent(e); break;
    }
}

void DisasmView::mousePressEvent(QMouseEvent *e)
{
    if (e->button() == Qt::BackButton) {
        goBack();
        return;
    }
    if (e->button() != Qt::LeftButton) return;

    for (auto &l : m_links) {
        if (l.rect.contains(e->pos())) {
            followReference(l.target);
            return;
        }
    }

    QFontMetrics fm(font());
    int row = e->pos().y() / std::max(fm.lineSpacing(), 1);
    if (!m_view) return;
    m_view->set_row(m_topRow + row);
    auto rows = m_view->peek(1);
    if (!rows.empty()) {
        m_selectedAddr = rows[0].address;
        emit addressSelected(m_selectedAddr);
        update();
    }
}

void DisasmView::mouseMoveEvent(QMouseEvent *e)
{
    for (auto &l : m_links) {
        if (l.rect.contains(e->pos())) {
            setCursor(Qt::PointingHandCursor);
            return;
        }
    }
    unsetCursor();

    if (!m_view) return;
    QFontMetrics fm(font());
    int row = e->pos().y() / std::max(fm.lineSpacing(), 1);
    m_view->set_row(m_topRow + row);
    auto rows = m_view->peek(1);
    if (!rows.empty() && rows[0].location) {
        const auto &loc = *rows[0].location;
        QString tip = QString::fromStdString(loc.function.empty() ? loc.symbol : loc.function);
        if (loc.line)
            tip += QString("\n%1:%2").arg(QString::fromStdString(loc.file)).arg(loc.line);
        QToolTip::showText(e->globalPosition().toPoint(), tip, this);
    } else {
        QToolTip::hideText();
    }
}

void DisasmView::paintEvent(QPaintEvent *)
{
    QPainter p(this);
    int sbw = m_scrollBar->width();
    QRect drawRect(0, 0, width() - sbw, height());
    p.setClipRect(drawRect);
    p.fillRect(drawRect, QColor(240, 240, 240));
    m_links.clear();

    if (!m_view) {
        p.setPen(QColor(150, 150, 150));
        p.drawText(drawRect, Qt::AlignCenter, "No binary loaded");
        return;
    }

    QFontMetrics fm(font());
    int charW = fm.horizontalAdvance('0');
    int lineH = fm.lineSpacing();
    int nrows = drawRect.height() / std::max(lineH, 1) + 1;

    m_view->set_row(m_topRow);
    auto rows = m_view->peek((size_t)nrows);

    int textX = ARROW_PANE_W + charW;
    auto rowMid = [&](int i) { return i * lineH + lineH / 2; };

    /* Selection highlight */
    for (int i = 0; i < (int)rows.size(); i++) {
        if (rows[i].address == m_selectedAddr && rows[i].kind != scroll::RowKind::LABEL)
            p.fillRect(ARROW_PANE_W, i * lineH, drawRect.width() - ARROW_PANE_W,
                       lineH, QColor(180, 210, 255));
    }

    /* Jump arrows */
    QColor arrowColor(100, 100, 100);
    int tipX = ARROW_PANE_W - 2;
    for (auto &a : buildArrows(rows)) {
        int colX = ARROW_PANE_W - ARROW_SPACING - a.column * ARROW_SPACING;
        if (colX < 2) colX = 2;
        int srcY = rowMid(a.srcRow);
        int dstY = a.dstRow == -1 ? 0 : a.dstRow == -2 ? drawRect.height() : rowMid(a.dstRow);
        p.fillRect(colX, srcY - 1, tipX - colX, 2, arrowColor);
        p.fillRect(colX - 1, std::min(srcY, dstY), 2, std::abs(dstY - srcY), arrowColor);
        if (a.dstRow >= 0) {
            p.fillRect(colX, dstY - 1, tipX - colX - 4, 2, arrowColor);
            p.setRenderHint(QPainter::Antialiasing, true);
            p.setBrush(arrowColor);
            p.setPen(Qt::NoPen);
            QPointF tri[3] = {
                { (qreal)tipX,     (qreal)dstY },
                { (qreal)tipX - 5, (qreal)dstY - 4 },
                { (qreal)tipX - 5, (qreal)dstY + 4 },
            };
            p.drawPolygon(tri, 3);
            p.setRenderHint(QPainter::Antialiasing, false);
        }
    }

    /* Rows */
    QFont italicFont = font();
    italicFont.setItalic(true);
    for (int i = 0; i < (int)rows.size(); i++) {
        const auto &row = rows[i];
        int baseline = i * lineH + fm.ascent();
        int x = textX;
        p.setFont(row.kind == scroll::RowKind::LABEL || row.kind == scroll::RowKind::SECTION
                  ? italicFont : font());
        QFontMetrics rfm(p.font());

        for (auto &t : row.tokens) {
            QString text = QString::fromStdString(t.text);
            int w = rfm.horizontalAdvance(text);
            p.setPen(token_color(t.kind));
            p.drawText(x, baseline, text);
            /* The leading address column is not a reference. */
            if (t.has_target && t.kind != tokens::Kind::LABEL && &t != &row.tokens.front()) {
                QRect r(x, i * lineH, w, lineH);
                if (t.kind != tokens::Kind::UNRESOLVED)
                    p.drawLine(x, baseline + 1, x + w, baseline + 1);
                m_links.push_back({ r, t.target });
            }
            x += w;
        }
    }
    p.setFont(font());
}
