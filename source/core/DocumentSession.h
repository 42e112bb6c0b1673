#pragma once

// ============================================================================
// DocumentSession - In-memory form state of one open document
// ============================================================================
// Maps page index -> PageFieldList in insertion order (the order in which
// pages first received fields). The session exclusively owns every field;
// views receive non-owning PageFieldList pointers that stay valid until the
// session is reset or cleared.
//
// The session also allocates default field names of the form
// "{prefix}_{N}". N is monotonic per prefix for the lifetime of the session
// and starts above the highest suffix found among the loaded names.
// ============================================================================

#include "FormField.h"
#include "PageFieldList.h"
#include "PageMetrics.h"

#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>
#include <memory>
#include <vector>

class DocumentSession {
public:
    DocumentSession() = default;

    DocumentSession(const DocumentSession&) = delete;
    DocumentSession& operator=(const DocumentSession&) = delete;

    // ===== Lifecycle =====

    /**
     * @brief Start a fresh session for a document with the given pages.
     *
     * Drops every field and resets the name counters.
     */
    void reset(const QVector<PageMetrics>& pages);

    /**
     * @brief Drop every field and page. Outstanding PageFieldList pointers
     *        become dangling.
     */
    void clear();

    /**
     * @brief Distribute imported fields onto their pages and seed the name
     *        counters from their names.
     * @return Number of fields accepted (fields without a valid page are dropped).
     */
    int loadImported(const QVector<FormField>& fields);

    // ===== Pages =====

    int pageCount() const { return m_pageMetrics.size(); }
    PageMetrics pageMetrics(int pageIndex) const;

    /**
     * @brief Mutable field list for a page, created on first access.
     * @return nullptr if pageIndex is out of range.
     */
    PageFieldList* pageFields(int pageIndex);

    /**
     * @brief Existing field list for a page, or nullptr if the page never
     *        received a field.
     */
    const PageFieldList* pageFields(int pageIndex) const;

    /**
     * @brief Page indices in the order they first received fields.
     */
    QVector<int> pageOrder() const;

    // ===== Fields =====

    /**
     * @brief Every field of the document, grouped by page in insertion order.
     */
    QVector<FormField> allFields() const;

    int fieldCount() const;
    int fieldCount(int pageIndex) const;

    // ===== Naming =====

    /**
     * @brief Next unused default name for the given type.
     */
    QString nextFieldName(FieldType type);

    /**
     * @brief Give every unnamed field a default name.
     * @return Number of fields that were named.
     */
    int assignMissingNames();

    /**
     * @brief Rename empty and duplicate names so all names are unique.
     * @return Number of fields that were renamed.
     *
     * The first occurrence of a name keeps it.
     */
    int ensureUniqueNames();

private:
    void seedNameCounter(const QString& name);
    QSet<QString> usedNames() const;

    QVector<PageMetrics> m_pageMetrics;
    std::vector<std::unique_ptr<PageFieldList>> m_pages;   ///< Insertion order
    QHash<QString, int> m_lastSuffix;                      ///< prefix -> highest N handed out
};
