// ============================================================================
// DocumentSession - Implementation
// ============================================================================

#include "DocumentSession.h"

#include <QDebug>
#include <QRegularExpression>

void DocumentSession::reset(const QVector<PageMetrics>& pages)
{
    m_pages.clear();
    m_lastSuffix.clear();
    m_pageMetrics = pages;
}

void DocumentSession::clear()
{
    m_pages.clear();
    m_lastSuffix.clear();
    m_pageMetrics.clear();
}

PageMetrics DocumentSession::pageMetrics(int pageIndex) const
{
    if (pageIndex < 0 || pageIndex >= m_pageMetrics.size()) {
        return PageMetrics();
    }
    return m_pageMetrics.at(pageIndex);
}

PageFieldList* DocumentSession::pageFields(int pageIndex)
{
    if (pageIndex < 0 || pageIndex >= m_pageMetrics.size()) {
        return nullptr;
    }
    for (const auto& list : m_pages) {
        if (list->pageIndex() == pageIndex) {
            return list.get();
        }
    }
    m_pages.push_back(std::make_unique<PageFieldList>(pageIndex, m_pageMetrics.at(pageIndex)));
    return m_pages.back().get();
}

const PageFieldList* DocumentSession::pageFields(int pageIndex) const
{
    for (const auto& list : m_pages) {
        if (list->pageIndex() == pageIndex) {
            return list.get();
        }
    }
    return nullptr;
}

QVector<int> DocumentSession::pageOrder() const
{
    QVector<int> order;
    order.reserve(static_cast<int>(m_pages.size()));
    for (const auto& list : m_pages) {
        order.append(list->pageIndex());
    }
    return order;
}

QVector<FormField> DocumentSession::allFields() const
{
    QVector<FormField> merged;
    merged.reserve(fieldCount());
    for (const auto& list : m_pages) {
        merged.append(list->fields());
    }
    return merged;
}

int DocumentSession::fieldCount() const
{
    int total = 0;
    for (const auto& list : m_pages) {
        total += list->count();
    }
    return total;
}

int DocumentSession::fieldCount(int pageIndex) const
{
    const PageFieldList* list = pageFields(pageIndex);
    return list ? list->count() : 0;
}

int DocumentSession::loadImported(const QVector<FormField>& fields)
{
    int accepted = 0;
    for (const FormField& field : fields) {
        PageFieldList* list = field.page ? pageFields(*field.page) : nullptr;
        if (!list) {
            qWarning() << "[DocumentSession] Dropping imported field" << field.name
                       << "with no valid page";
            continue;
        }
        list->append(field);
        seedNameCounter(field.name);
        ++accepted;
    }
    return accepted;
}

// ============================================================================
// Naming
// ============================================================================

void DocumentSession::seedNameCounter(const QString& name)
{
    static const QRegularExpression pattern(QStringLiteral("^([A-Za-z]+)_(\\d+)$"));

    QRegularExpressionMatch match = pattern.match(name);
    if (!match.hasMatch()) {
        return;
    }

    QString prefix = match.captured(1);
    if (prefix != FormField::typePrefix(FieldType::Text) &&
        prefix != FormField::typePrefix(FieldType::Checkbox)) {
        return;
    }

    bool ok = false;
    int suffix = match.captured(2).toInt(&ok);
    if (ok && suffix > m_lastSuffix.value(prefix, 0)) {
        m_lastSuffix[prefix] = suffix;
    }
}

QSet<QString> DocumentSession::usedNames() const
{
    QSet<QString> names;
    for (const auto& list : m_pages) {
        for (const FormField& field : list->fields()) {
            if (!field.name.isEmpty()) {
                names.insert(field.name);
            }
        }
    }
    return names;
}

QString DocumentSession::nextFieldName(FieldType type)
{
    const QString prefix = FormField::typePrefix(type);
    const QSet<QString> taken = usedNames();

    int& last = m_lastSuffix[prefix];
    QString candidate;
    do {
        ++last;
        candidate = QStringLiteral("%1_%2").arg(prefix).arg(last);
    } while (taken.contains(candidate));

    return candidate;
}

int DocumentSession::assignMissingNames()
{
    int named = 0;
    for (const auto& list : m_pages) {
        for (int i = 0; i < list->count(); ++i) {
            if (list->at(i).name.isEmpty()) {
                list->setName(i, nextFieldName(list->at(i).type));
                ++named;
            }
        }
    }
    return named;
}

int DocumentSession::ensureUniqueNames()
{
    QSet<QString> seen;
    int renamed = 0;
    for (const auto& list : m_pages) {
        for (int i = 0; i < list->count(); ++i) {
            const QString name = list->at(i).name;
            if (name.isEmpty() || seen.contains(name)) {
                QString fresh = nextFieldName(list->at(i).type);
                qDebug() << "[DocumentSession] Renaming field" << name << "to" << fresh;
                list->setName(i, fresh);
                seen.insert(fresh);
                ++renamed;
            } else {
                seen.insert(name);
            }
        }
    }
    return renamed;
}
