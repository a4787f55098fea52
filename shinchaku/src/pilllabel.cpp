#include "pilllabel.h"
#include <QStyle>

PillLabel::PillLabel(const QString& text, const QString& kind, QWidget *parent)
    : QLabel(text, parent)
{
    setAlignment(Qt::AlignCenter);
    setMinimumHeight(22);
    setContentsMargins(10, 2, 10, 2);
    setKind(kind);
}

void PillLabel::setKind(const QString& kind)
{
    if (kind == m_kind) {
        return;
    }
    m_kind = kind;
    setObjectName(QString("pill_%1").arg(kind));
    
    // Object name selectors are only re-evaluated on repolish
    style()->unpolish(this);
    style()->polish(this);
}

QString PillLabel::kindForMediaType(const QString& mediaType)
{
    return mediaType == QLatin1String("ANIME") ? QString("anime") : QString("manga");
}
