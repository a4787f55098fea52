#ifndef UISTYLE_H
#define UISTYLE_H

#include <QString>
#include <QPixmap>
#include <QSize>
#include <QColor>

class QWidget;

/**
 * Application look: style sheet, painted placeholders and shadows
 */
namespace UIStyle {

/**
 * Dark style sheet for the main window, keyed on object names
 * (#Header, #MediaCard, #DetailHero, pill_anime, ...)
 */
QString applicationStyleSheet();

/**
 * Rounded "No Image" tile shown on cards until the cover arrives
 */
QPixmap thumbnailPlaceholder(const QSize& size);

/**
 * Rounded "Cover" tile shown in the detail pane until the cover arrives
 */
QPixmap coverPlaceholder(const QSize& size);

/**
 * Attach a soft drop shadow to a widget
 */
void addDropShadow(QWidget *widget, int blurRadius, int offsetY, const QColor& color);

} // namespace UIStyle

#endif // UISTYLE_H
