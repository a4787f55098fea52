#include "uistyle.h"
#include "uicolors.h"
#include <QPainter>
#include <QLinearGradient>
#include <QFont>
#include <QWidget>
#include <QGraphicsDropShadowEffect>

namespace UIStyle {

namespace {

QPixmap paintPlaceholder(const QSize& size, int radius, const QString& text,
                         const QColor& top, const QColor& bottom,
                         const QColor& border, const QColor& textColor,
                         const QFont& font)
{
    QPixmap pixmap(size);
    pixmap.fill(Qt::transparent);
    
    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);
    
    QRect rect = pixmap.rect().adjusted(1, 1, -1, -1);
    QLinearGradient gradient(rect.topLeft(), rect.bottomRight());
    gradient.setColorAt(0.0, top);
    gradient.setColorAt(1.0, bottom);
    
    painter.setBrush(QBrush(gradient));
    painter.setPen(QPen(border, 1));
    painter.drawRoundedRect(rect, radius, radius);
    
    painter.setPen(textColor);
    painter.setFont(font);
    painter.drawText(rect, Qt::AlignCenter, text);
    painter.end();
    
    return pixmap;
}

} // namespace

QPixmap thumbnailPlaceholder(const QSize& size)
{
    return paintPlaceholder(size, 10, "No\nImage",
                            UIColors::THUMB_GRADIENT_TOP, UIColors::THUMB_GRADIENT_BOTTOM,
                            UIColors::THUMB_BORDER, UIColors::THUMB_TEXT,
                            QFont("Inter", 9));
}

QPixmap coverPlaceholder(const QSize& size)
{
    return paintPlaceholder(size, 16, "Cover",
                            UIColors::COVER_GRADIENT_TOP, UIColors::COVER_GRADIENT_BOTTOM,
                            UIColors::COVER_BORDER, UIColors::COVER_TEXT,
                            QFont("Inter", 10, QFont::Bold));
}

void addDropShadow(QWidget *widget, int blurRadius, int offsetY, const QColor& color)
{
    if (!widget) {
        return;
    }
    
    QGraphicsDropShadowEffect *effect = new QGraphicsDropShadowEffect(widget);
    effect->setBlurRadius(blurRadius);
    effect->setOffset(0, offsetY);
    effect->setColor(color);
    widget->setGraphicsEffect(effect);
}

QString applicationStyleSheet()
{
    return QStringLiteral(R"(
QWidget { font-family: Inter, Segoe UI, Arial; font-size: 12.5px; color: #EAF0FF; }
Window { background: qlineargradient(x1:0,y1:0,x2:1,y2:1, stop:0 #0B0F1A, stop:0.5 #0A1221, stop:1 #070A12); }

QTabWidget::pane { border: none; }
QTabBar::tab { padding: 6px 14px; background: transparent; color: rgba(234,240,255,0.65); border: none; }
QTabBar::tab:selected { color: #EAF0FF; border-bottom: 2px solid rgba(110,145,255,0.75); }

#Header { border-radius: 18px; background: qlineargradient(x1:0,y1:0,x2:1,y2:0,
    stop:0 rgba(40, 60, 120, 0.35), stop:0.6 rgba(25, 30, 55, 0.55), stop:1 rgba(15, 18, 30, 0.65));
    border: 1px solid rgba(120, 150, 255, 0.15);
}
#HeaderTitle { font-size: 18px; font-weight: 700; letter-spacing: 0.2px; }
#HeaderSub { color: rgba(234, 240, 255, 0.72); }

#DateBar { border-radius: 14px; background: rgba(255,255,255,0.05); border: 1px solid rgba(255,255,255,0.08); }
#DateEdit { padding: 8px 10px; border-radius: 12px; background: rgba(255,255,255,0.06); border: 1px solid rgba(255,255,255,0.09); }
#DateEdit:focus { border-color: rgba(110,145,255,0.45); }

#SegWrap { border-radius: 14px; background: rgba(0,0,0,0.18); border: 1px solid rgba(255,255,255,0.08); }
#SegButton { padding: 8px 12px; border-radius: 10px; background: transparent; border: 1px solid transparent; color: rgba(234, 240, 255, 0.85); }
#SegButton:hover { background: rgba(255,255,255,0.06); border-color: rgba(255,255,255,0.08); }
#SegButton:checked { background: rgba(110,145,255,0.22); border-color: rgba(110,145,255,0.35); }

#PrimaryButton { padding: 10px 16px; border-radius: 14px; background: qlineargradient(x1:0,y1:0,x2:1,y2:1, stop:0 #6E91FF, stop:1 #8C5BFF);
    border: 1px solid rgba(255,255,255,0.10); font-weight: 700;
}
#PrimaryButton:pressed { background: rgba(110,145,255,0.75); }
#PrimaryButton:disabled { background: rgba(110,145,255,0.30); color: rgba(234,240,255,0.55); }

#GhostButton { padding: 8px 12px; border-radius: 12px; background: rgba(255,255,255,0.06); border: 1px solid rgba(255,255,255,0.09); }
#GhostButton:disabled { color: rgba(234,240,255,0.35); }

#Pane { border-radius: 18px; background: rgba(10, 12, 20, 0.55); border: 1px solid rgba(255,255,255,0.08); }

#SearchBox { padding: 10px 12px; border-radius: 14px; background: rgba(255,255,255,0.06); border: 1px solid rgba(255,255,255,0.09); selection-background-color: rgba(110,145,255,0.5); }
#SearchBox:focus { border-color: rgba(110,145,255,0.45); }
#CountLabel { color: rgba(234,240,255,0.68); }

#MediaList { border: none; background: transparent; outline: none; }
#MediaList::item { border: none; padding: 0px; margin: 0px; }
#MediaList::item:selected { background: transparent; }

#MediaCard { border-radius: 18px; background: rgba(255,255,255,0.06); border: 1px solid rgba(255,255,255,0.08); }
#MediaCard:hover { background: rgba(255,255,255,0.08); border-color: rgba(110,145,255,0.22); }
#Thumb { border-radius: 12px; background: rgba(0,0,0,0.25); border: 1px solid rgba(255,255,255,0.07); }
#CardTitle { font-size: 13.5px; font-weight: 700; }
#CardSub { color: rgba(234,240,255,0.72); }
#CardMeta { color: rgba(234,240,255,0.62); }

QLabel#pill_neutral { border-radius: 11px; background: rgba(255,255,255,0.07); border: 1px solid rgba(255,255,255,0.10); font-weight: 600; }
QLabel#pill_anime { border-radius: 11px; background: rgba(110,145,255,0.18); border: 1px solid rgba(110,145,255,0.30); font-weight: 700; }
QLabel#pill_manga { border-radius: 11px; background: rgba(140,91,255,0.18); border: 1px solid rgba(140,91,255,0.30); font-weight: 700; }

#DetailHero { border-radius: 18px; background: qlineargradient(x1:0,y1:0,x2:1,y2:0, stop:0 rgba(255,255,255,0.06), stop:1 rgba(255,255,255,0.03));
    border: 1px solid rgba(255,255,255,0.08);
}
#DetailImg { border-radius: 16px; background: rgba(0,0,0,0.25); border: 1px solid rgba(255,255,255,0.08); }
#DetailTitle { font-size: 16px; font-weight: 800; }
#DetailNative { color: rgba(234,240,255,0.70); }
#DetailMeta { color: rgba(234,240,255,0.65); }
#DetailDesc { border-radius: 18px; background: rgba(255,255,255,0.04); border: 1px solid rgba(255,255,255,0.08); padding: 10px; }

#Progress { border-radius: 10px; background: rgba(255,255,255,0.05); border: 1px solid rgba(255,255,255,0.08); max-height: 10px; }
#Progress::chunk { background: rgba(110,145,255,0.55); border-radius: 10px; }

#StatusLabel { color: rgba(234,240,255,0.65); }
#LogOutput { border-radius: 12px; background: rgba(0,0,0,0.25); border: 1px solid rgba(255,255,255,0.08); font-family: monospace; font-size: 11px; }
)");
}

} // namespace UIStyle
