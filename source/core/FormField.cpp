// ============================================================================
// FormField - Implementation
// ============================================================================

#include "FormField.h"

#include <QCoreApplication>

QSizeF FormField::defaultSize(FieldType type)
{
    switch (type) {
        case FieldType::Text:
            return QSizeF(140.0, 24.0);
        case FieldType::Checkbox:
            return QSizeF(18.0, 18.0);
    }
    return QSizeF(140.0, 24.0);
}

QString FormField::typePrefix(FieldType type)
{
    switch (type) {
        case FieldType::Text:
            return QStringLiteral("text");
        case FieldType::Checkbox:
            return QStringLiteral("checkbox");
    }
    return QStringLiteral("field");
}

QString FormField::displayName(FieldType type)
{
    switch (type) {
        case FieldType::Text:
            return QCoreApplication::translate("FormField", "Text Field");
        case FieldType::Checkbox:
            return QCoreApplication::translate("FormField", "Checkbox");
    }
    return QString();
}
