// ============================================================================
// PdfFormBuilder - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QTest>
#include <QTranslator>

#include "MainWindow.h"

#include "core/CoordinateMapperTests.h"
#include "core/DocumentSessionTests.h"
#include "core/FieldInteractionTests.h"
#include "pdf/FormPdfTests.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    QSettings settings("PdfFormBuilder", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/pdfformbuilder/translations",
        "/usr/local/share/pdfformbuilder/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "pdfformbuilder/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (path.isEmpty()) {
            continue;
        }
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    bool success = false;

    if (testType == "mapper") {
        success = CoordinateMapperTests::runAllTests();
    } else if (testType == "session") {
        success = DocumentSessionTests::runAllTests();
    } else if (testType == "interaction") {
        FieldInteractionTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "pdf") {
        FormPdfTests tests;
        return QTest::qExec(&tests);
    } else {
        qWarning() << "Unknown test suite:" << testType;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("PdfFormBuilder");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--test-mapper") {
            testToRun = "mapper";
        } else if (arg == "--test-session") {
            testToRun = "session";
        } else if (arg == "--test-interaction") {
            testToRun = "interaction";
        } else if (arg == "--test-pdf") {
            testToRun = "pdf";
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    MainWindow w;
    w.show();

    if (!inputFile.isEmpty()) {
        if (!w.openPdfFile(inputFile)) {
            qWarning() << "[Main] Could not open" << inputFile;
        }
    }

    return app.exec();
}
