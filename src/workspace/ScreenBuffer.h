/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SCREENBUFFER_H
#define SCREENBUFFER_H

#include "workdeckprivate_export.h"

#include <QByteArray>
#include <QList>
#include <QSize>
#include <QString>
#include <QStringList>

#include <functional>

struct VTerm;
struct VTermScreen;
struct VTermState;

namespace Workdeck
{

/**
 * Destination of terminal output for one session.
 *
 * Implementations own the rows and the grid geometry. A rendering emulator
 * widget implements this; TerminalScreenBuffer is the headless default.
 */
class WORKDECKPRIVATE_EXPORT ScreenBuffer
{
public:
    using ReplyWriter = std::function<void(const QByteArray &data)>;

    virtual ~ScreenBuffer();

    /**
     * Append raw PTY output
     */
    virtual void write(const QByteArray &data) = 0;

    /**
     * Recompute the grid for a viewport of @p pixels.
     *
     * @return the new grid, width = columns and height = rows
     */
    virtual QSize fit(const QSize &pixels) = 0;

    virtual int columns() const = 0;
    virtual int rows() const = 0;

    /**
     * Give or take keyboard focus. No-op for headless buffers.
     */
    virtual void setFocused(bool focused)
    {
        Q_UNUSED(focused)
    }

    /**
     * Most recent logical lines, oldest first. Rows the buffer soft-wrapped
     * are joined back into a single line. Must not modify the buffer.
     */
    virtual QStringList exportLines(int maxLines) const = 0;

    /**
     * Where bytes the emulator sends back to the program go. Buffers that
     * never answer ignore it.
     */
    virtual void setReplyWriter(const ReplyWriter &writer)
    {
        Q_UNUSED(writer)
    }
};

/**
 * Headless terminal emulator backed by libvterm.
 *
 * Output is interpreted like a real terminal would (cursor movement,
 * erasing, the alternate screen). Rows scrolled off the top of the primary
 * screen are kept as scrollback, up to the configured limit. Answers the
 * emulator owes the program (cursor position and device attribute reports)
 * go to the reply writer.
 */
class WORKDECKPRIVATE_EXPORT TerminalScreenBuffer : public ScreenBuffer
{
public:
    explicit TerminalScreenBuffer(int columns = 80, int rows = 24, int scrollback = 5000);
    ~TerminalScreenBuffer() override;

    void write(const QByteArray &data) override;
    QSize fit(const QSize &pixels) override;

    int columns() const override
    {
        return m_columns;
    }

    int rows() const override
    {
        return m_rows;
    }

    void setFocused(bool focused) override
    {
        m_focused = focused;
    }

    bool isFocused() const
    {
        return m_focused;
    }

    QStringList exportLines(int maxLines) const override;

    void setReplyWriter(const ReplyWriter &writer) override
    {
        m_replyWriter = writer;
    }

    /**
     * Pixel size of one character cell, used by fit()
     */
    void setCellSize(const QSize &cellSize);

    QSize cellSize() const
    {
        return m_cellSize;
    }

    /**
     * Scrollback rows plus the rows of the visible screen
     */
    int storedRowCount() const
    {
        return m_scrollback.size() + m_rows;
    }

    /**
     * Text of visible row @p row, trailing blanks removed
     */
    QString screenLine(int row) const;

private:
    struct Callbacks;

    struct Row {
        QString text;
        bool wrapsIntoNext = false; // The following row is its soft-wrapped continuation
    };

    QString rowText(int row) const;
    bool rowContinues(int row) const;

    VTerm *m_vterm = nullptr;
    VTermScreen *m_screen = nullptr;
    VTermState *m_state = nullptr;

    QList<Row> m_scrollback;
    int m_columns;
    int m_rows;
    int m_scrollbackLimit;
    QSize m_cellSize = QSize(8, 16);
    bool m_focused = false;
    ReplyWriter m_replyWriter;

    Q_DISABLE_COPY(TerminalScreenBuffer)
};

} // namespace Workdeck

#endif // SCREENBUFFER_H
