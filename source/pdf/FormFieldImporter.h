#pragma once

// ============================================================================
// FormFieldImporter - Reads existing AcroForm widgets into FormFields
// ============================================================================
// Walks every page's /Annots and converts /Widget annotations of type /Tx
// and /Btn into FormField instances. Field attributes (/FT, /Ff, /V) are
// looked up through the /Parent chain, since split field/widget pairs keep
// them on the field dictionary.
// ============================================================================

#include "../core/FormErrors.h"
#include "../core/FormField.h"

#include <QString>
#include <QVector>

/**
 * @brief Result of importing fields from a PDF.
 */
struct FieldImportResult {
    bool success = false;
    FormErrorKind errorKind = FormErrorKind::None;
    QString errorMessage;
    QVector<FormField> fields;      ///< Imported fields, page then annotation order
    int skippedWidgets = 0;         ///< Widgets without /FT or /Rect, or of other types
};

/**
 * @brief Imports form fields from an existing PDF.
 */
class FormFieldImporter {
public:
    /**
     * @brief Read all text and checkbox widgets of a PDF.
     * @param pdfPath Path to the PDF file.
     * @return Result with the fields. On failure success is false,
     *         errorKind is Import and fields is empty.
     */
    static FieldImportResult importFields(const QString& pdfPath);
};
