/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ScreenBuffer.h"

#include <QDebug>

#include <vterm.h>

namespace Workdeck
{

ScreenBuffer::~ScreenBuffer() = default;

// Second half of a double-width glyph
static const uint32_t WideGlyphTail = static_cast<uint32_t>(-1);

static void appendCell(QString &text, const VTermScreenCell &cell)
{
    if (cell.chars[0] == WideGlyphTail) {
        return;
    }
    if (cell.chars[0] == 0) {
        text.append(QLatin1Char(' '));
        return;
    }
    for (int i = 0; i < VTERM_MAX_CHARS_PER_CELL && cell.chars[i] != 0; ++i) {
        const char32_t codepoint = cell.chars[i];
        text.append(QString::fromUcs4(&codepoint, 1));
    }
}

static QString trimmedRight(const QString &text)
{
    int end = text.size();
    while (end > 0 && text.at(end - 1) == QLatin1Char(' ')) {
        --end;
    }
    return text.left(end);
}

struct TerminalScreenBuffer::Callbacks {
    static int pushLine(int cols, const VTermScreenCell *cells, void *user)
    {
        auto *buffer = static_cast<TerminalScreenBuffer *>(user);
        if (buffer->m_scrollbackLimit == 0) {
            return 0;
        }

        Row row;
        for (int col = 0; col < cols; ++col) {
            appendCell(row.text, cells[col]);
        }
        // lineinfo is scrolled before the row is pushed, so row 0 is the one below it
        row.wrapsIntoNext = vterm_state_get_lineinfo(buffer->m_state, 0)->continuation;

        buffer->m_scrollback.append(row);
        while (buffer->m_scrollback.size() > buffer->m_scrollbackLimit) {
            buffer->m_scrollback.removeFirst();
        }
        return 1;
    }

    static void output(const char *bytes, size_t len, void *user)
    {
        auto *buffer = static_cast<TerminalScreenBuffer *>(user);
        if (buffer->m_replyWriter) {
            buffer->m_replyWriter(QByteArray(bytes, static_cast<int>(len)));
        }
    }
};

TerminalScreenBuffer::TerminalScreenBuffer(int columns, int rows, int scrollback)
    : m_columns(qMax(1, columns))
    , m_rows(qMax(1, rows))
    , m_scrollbackLimit(qMax(0, scrollback))
{
    static const VTermScreenCallbacks callbacks = [] {
        VTermScreenCallbacks table = {};
        table.sb_pushline = &Callbacks::pushLine;
        return table;
    }();

    m_vterm = vterm_new(m_rows, m_columns);
    vterm_set_utf8(m_vterm, 1);
    vterm_output_set_callback(m_vterm, &Callbacks::output, this);

    m_state = vterm_obtain_state(m_vterm);
    m_screen = vterm_obtain_screen(m_vterm);
    vterm_screen_enable_altscreen(m_screen, 1);
    vterm_screen_set_callbacks(m_screen, &callbacks, this);
    vterm_screen_reset(m_screen, 1);
}

TerminalScreenBuffer::~TerminalScreenBuffer()
{
    vterm_free(m_vterm);
}

void TerminalScreenBuffer::write(const QByteArray &data)
{
    if (data.isEmpty()) {
        return;
    }
    vterm_input_write(m_vterm, data.constData(), static_cast<size_t>(data.size()));
    vterm_screen_flush_damage(m_screen);
}

QSize TerminalScreenBuffer::fit(const QSize &pixels)
{
    if (pixels.width() <= 0 || pixels.height() <= 0) {
        return QSize(m_columns, m_rows);
    }

    const int columns = qMax(1, pixels.width() / m_cellSize.width());
    const int rows = qMax(1, pixels.height() / m_cellSize.height());
    if (columns != m_columns || rows != m_rows) {
        qDebug() << "TerminalScreenBuffer: Resizing grid to" << columns << "x" << rows;
        m_columns = columns;
        m_rows = rows;
        vterm_set_size(m_vterm, m_rows, m_columns);
    }
    return QSize(m_columns, m_rows);
}

void TerminalScreenBuffer::setCellSize(const QSize &cellSize)
{
    if (cellSize.width() > 0 && cellSize.height() > 0) {
        m_cellSize = cellSize;
    }
}

QString TerminalScreenBuffer::rowText(int row) const
{
    QString text;
    VTermScreenCell cell;
    for (int col = 0; col < m_columns; ++col) {
        if (!vterm_screen_get_cell(m_screen, VTermPos{row, col}, &cell)) {
            break;
        }
        appendCell(text, cell);
    }
    return text;
}

bool TerminalScreenBuffer::rowContinues(int row) const
{
    return vterm_state_get_lineinfo(m_state, row)->continuation;
}

QString TerminalScreenBuffer::screenLine(int row) const
{
    if (row < 0 || row >= m_rows) {
        return QString();
    }
    return trimmedRight(rowText(row));
}

QStringList TerminalScreenBuffer::exportLines(int maxLines) const
{
    if (maxLines <= 0) {
        return QStringList();
    }

    QStringList logical;
    const auto append = [&logical](const QString &text, bool continued) {
        if (continued && !logical.isEmpty()) {
            logical.last().append(text);
        } else {
            logical.append(text);
        }
    };

    bool continued = false;
    for (const Row &row : m_scrollback) {
        append(row.text, continued);
        continued = row.wrapsIntoNext;
    }
    for (int row = 0; row < m_rows; ++row) {
        append(rowText(row), rowContinues(row));
    }

    for (QString &line : logical) {
        line = trimmedRight(line);
    }

    // Rows below the cursor are usually empty
    while (!logical.isEmpty() && logical.last().isEmpty()) {
        logical.removeLast();
    }

    if (logical.size() > maxLines) {
        logical = logical.mid(logical.size() - maxLines);
    }
    return logical;
}

} // namespace Workdeck
