// ============================================================================
// FormDocument - One open PDF being edited
// ============================================================================

#include "FormDocument.h"

#include "../pdf/FormFieldImporter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

static const QString WORKING_COPY_NAME = QStringLiteral("working.pdf");

FormDocument::FormDocument(QObject* parent)
    : QObject(parent)
{
}

FormDocument::~FormDocument()
{
    close();
}

// ============================================================================
// Lifecycle
// ============================================================================

DocumentOpenResult FormDocument::open(const QString& pdfPath)
{
    close();

    DocumentOpenResult result;
    result.errorKind = FormErrorKind::Load;

    if (!QFileInfo::exists(pdfPath)) {
        result.errorMessage = tr("File not found: %1").arg(pdfPath);
        qWarning() << "[FormDocument]" << result.errorMessage;
        return result;
    }

    m_scratchDir = std::make_unique<QTemporaryDir>(
        QDir::temp().filePath(QStringLiteral("pdfformbuilder-XXXXXX")));
    m_scratchDir->setAutoRemove(false);
    if (!m_scratchDir->isValid()) {
        result.errorMessage = tr("Cannot create a working directory for %1: %2")
                                  .arg(pdfPath, m_scratchDir->errorString());
        qWarning() << "[FormDocument]" << result.errorMessage;
        m_scratchDir.reset();
        return result;
    }

    m_workingCopyPath = m_scratchDir->filePath(WORKING_COPY_NAME);
    if (!QFile::copy(pdfPath, m_workingCopyPath)) {
        result.errorMessage = tr("Cannot copy %1 to the working directory").arg(pdfPath);
        qWarning() << "[FormDocument]" << result.errorMessage;
        deleteScratch();
        return result;
    }
    // Copies of read-only files stay read-only; the working copy is rewritten on export
    QFile::setPermissions(m_workingCopyPath,
                          QFile::permissions(m_workingCopyPath) | QFile::WriteOwner);

    m_provider = PdfProvider::create(m_workingCopyPath);
    if (!m_provider) {
        result.errorMessage = tr("Failed to open PDF: %1").arg(pdfPath);
        qWarning() << "[FormDocument]" << result.errorMessage;
        deleteScratch();
        return result;
    }

    QVector<PageMetrics> metrics;
    metrics.reserve(m_provider->pageCount());
    for (int i = 0; i < m_provider->pageCount(); ++i) {
        metrics.append(PageMetrics::fromSize(m_provider->pageSize(i)));
    }
    m_session.reset(metrics);
    m_sourcePath = pdfPath;

    result.success = true;
    result.errorKind = FormErrorKind::None;
    result.pageCount = metrics.size();

    FieldImportResult imported = FormFieldImporter::importFields(m_workingCopyPath);
    if (imported.success) {
        result.importedFields = m_session.loadImported(imported.fields);
        m_session.assignMissingNames();
    } else {
        result.errorKind = FormErrorKind::Import;
        result.errorMessage = imported.errorMessage;
    }

    qDebug() << "[FormDocument] Opened" << pdfPath << "-" << result.pageCount << "pages,"
             << result.importedFields << "fields, backend" << PdfProvider::backendName();

    emit documentOpened(pdfPath);
    return result;
}

void FormDocument::close()
{
    if (!m_scratchDir && !m_provider) {
        return;
    }

    m_provider.reset();
    m_session.clear();
    deleteScratch();

    qDebug() << "[FormDocument] Closed" << m_sourcePath;
    m_sourcePath.clear();

    emit documentClosed();
}

void FormDocument::deleteScratch()
{
    m_provider.reset();
    m_workingCopyPath.clear();

    if (!m_scratchDir) {
        return;
    }
    const QString path = m_scratchDir->path();
    if (!m_scratchDir->remove()) {
        qWarning() << "[FormDocument] Failed to delete working directory" << path;
    }
    m_scratchDir.reset();
}

void FormDocument::releaseProvider()
{
    if (m_provider) {
        m_provider.reset();
        qDebug() << "[FormDocument] Released provider for" << m_workingCopyPath;
    }
}

bool FormDocument::reopenProvider()
{
    if (m_workingCopyPath.isEmpty()) {
        return false;
    }
    m_provider = PdfProvider::create(m_workingCopyPath);
    if (!m_provider) {
        qWarning() << "[FormDocument] Failed to reopen working copy" << m_workingCopyPath;
        return false;
    }
    return true;
}

// ============================================================================
// Rendering
// ============================================================================

QImage FormDocument::renderPage(int pageIndex, qreal zoom) const
{
    if (!m_provider) {
        return QImage();
    }
    QImage image = m_provider->renderPageToImage(pageIndex, 72.0 * zoom);
    if (image.isNull()) {
        qWarning() << "[FormDocument] Render failed for page" << pageIndex
                   << "at zoom" << zoom;
    }
    return image;
}

// ============================================================================
// Export
// ============================================================================

FieldWriteResult FormDocument::exportTo(const QString& outputPath)
{
    if (m_workingCopyPath.isEmpty()) {
        FieldWriteResult result;
        result.errorKind = FormErrorKind::Write;
        result.errorMessage = tr("No document is open");
        return result;
    }

    m_session.assignMissingNames();
    int renamed = m_session.ensureUniqueNames();
    if (renamed > 0) {
        qDebug() << "[FormDocument] Renamed" << renamed << "duplicate field names";
    }

    FieldWriteOptions options;
    options.sourcePath = m_workingCopyPath;
    options.outputPath = outputPath;
    options.fields = m_session.allFields();

    releaseProvider();

    FormPdfWriter writer;
    FieldWriteResult result = writer.writeFields(options);

    // Working copy keeps the original pages; fields live in the session
    if (!reopenProvider()) {
        qWarning() << "[FormDocument] Provider unavailable after export";
    }

    return result;
}
