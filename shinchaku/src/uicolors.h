#ifndef UICOLORS_H
#define UICOLORS_H

#include <QColor>
#include <QString>

// Colors used by painted placeholders
namespace UIColors {
    // Card thumbnail placeholder
    inline const QColor THUMB_GRADIENT_TOP = QColor(45, 52, 64);
    inline const QColor THUMB_GRADIENT_BOTTOM = QColor(22, 26, 33);
    inline const QColor THUMB_BORDER = QColor(70, 80, 96);
    inline const QColor THUMB_TEXT = QColor(150, 160, 180);
    
    // Detail pane cover placeholder
    inline const QColor COVER_GRADIENT_TOP = QColor(60, 74, 95);
    inline const QColor COVER_GRADIENT_BOTTOM = QColor(20, 24, 35);
    inline const QColor COVER_BORDER = QColor(90, 105, 130);
    inline const QColor COVER_TEXT = QColor(170, 185, 210);
    
    // Drop shadows under cards and the header
    inline const QColor CARD_SHADOW = QColor(0, 0, 0, 120);
    inline const QColor HEADER_SHADOW = QColor(0, 0, 0, 130);
}

// Small UI glyphs
namespace UIIcons {
    inline const QString META_SEPARATOR = QString::fromUtf8(" \xE2\x80\xA2 ");  // " • "
    inline const QString RANGE_ARROW = QString::fromUtf8(" \xE2\x86\x92 ");     // " → "
    inline const QString EMPTY_PILL = QString::fromUtf8("\xE2\x80\x94");         // "—"
    inline const QString ELLIPSIS = QString::fromUtf8("\xE2\x80\xA6");           // "…"
}

#endif // UICOLORS_H
