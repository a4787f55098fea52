#ifndef PILLLABEL_H
#define PILLLABEL_H

#include <QLabel>
#include <QString>

/**
 * Rounded badge label ("pill")
 * 
 * The kind selects the style sheet rule through the object name
 * (pill_neutral, pill_anime, pill_manga).
 */
class PillLabel : public QLabel
{
    Q_OBJECT
    
public:
    explicit PillLabel(const QString& text, const QString& kind = "neutral", QWidget *parent = nullptr);
    
    QString kind() const { return m_kind; }
    void setKind(const QString& kind);
    
    /**
     * Pill kind for a media type: "anime" for ANIME, "manga" otherwise
     */
    static QString kindForMediaType(const QString& mediaType);
    
private:
    QString m_kind;
};

#endif // PILLLABEL_H
