#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QGuiApplication>

#include <KAboutData>
#include <KLocalizedString>
#include <KSharedConfig>

#include "assetcache.h"
#include "assetfetcher.h"
#include "documentassembler.h"
#include "documentloader.h"
#include "fontregistry.h"
#include "generatorsettings.h"
#include "logolibrary.h"
#include "stringtable.h"

int main(int argc, char *argv[])
{
    // Headless runs still need a platform plugin for fonts and painting
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")
        && qEnvironmentVariableIsEmpty("DISPLAY")
        && qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("cardbinder");

    KAboutData aboutData(
        QStringLiteral("cardbinder"),
        i18n("CardBinder"),
        QStringLiteral("0.1.0"),
        i18n("Printable binder pages for card collections"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("cardbinder.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(QStringLiteral("document"),
                                 i18n("Binder document (JSON) to render"));
    const QCommandLineOption languageOption(
        {QStringLiteral("l"), QStringLiteral("language")},
        i18n("Language to render (repeatable). Defaults to every language the document lists."),
        i18n("code"));
    const QCommandLineOption scopeOption(
        {QStringLiteral("s"), QStringLiteral("scope")},
        i18n("Output name; defaults to the document file name."),
        i18n("name"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        i18n("Output directory."), i18n("dir"));
    const QCommandLineOption cacheOption(
        QStringLiteral("cache"), i18n("Image cache directory."), i18n("dir"));
    const QCommandLineOption noNetworkOption(
        QStringLiteral("no-network"),
        i18n("Use cached images only; never download missing artwork."));
    parser.addOption(languageOption);
    parser.addOption(scopeOption);
    parser.addOption(outputOption);
    parser.addOption(cacheOption);
    parser.addOption(noNetworkOption);
    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        qCritical().noquote() << i18n("Expected exactly one document file.");
        parser.showHelp(1);
    }

    GeneratorSettings settings = GeneratorSettings::load(
        KSharedConfig::openConfig(QStringLiteral("cardbinderrc")));
    if (parser.isSet(outputOption))
        settings.outputDirectory = parser.value(outputOption);
    if (parser.isSet(cacheOption))
        settings.cache.directory = parser.value(cacheOption);
    if (parser.isSet(noNetworkOption))
        settings.cache.networkFallback = false;

    DocumentLoader loader;
    Binder::Document document;
    if (!loader.loadFile(args.first(), &document)) {
        qCritical().noquote() << loader.errorString();
        return 1;
    }
    if (parser.isSet(scopeOption))
        document.scope = parser.value(scopeOption);

    QStringList languages = parser.values(languageOption);
    if (languages.isEmpty())
        languages = document.availableLanguages;
    if (languages.isEmpty())
        languages << document.language;

    StringTable strings;
    if (!settings.translationsFile.isEmpty()) {
        QString error;
        if (!strings.loadFile(settings.translationsFile, &error))
            qWarning().noquote() << error;
    }

    FontRegistry fonts(settings.latinFamily, settings.collectionPaths);
    fonts.registerFonts();

    NetworkAssetFetcher fetcher(settings.fetchTimeoutMs);
    AssetCache cache(settings.cache, &fetcher);
    LogoLibrary logos(settings.logoDirectory);

    DocumentAssembler assembler(&fonts, &cache, &logos, &strings);
    assembler.setProjectName(settings.projectName);
    assembler.setFooterCaption(settings.footerCaption);

    int failures = 0;
    for (const QString &language : std::as_const(languages)) {
        if (!document.supportsLanguage(language)) {
            qInfo().noquote() << i18n("Skipping %1: not available for this document", language);
            continue;
        }
        const QString path = DocumentAssembler::outputPath(settings.outputDirectory,
                                                           document.scope, language);
        if (!assembler.generate(document, language, path)) {
            qCritical().noquote() << assembler.errorString();
            ++failures;
        }
    }

    qInfo() << "cardbinder: memory hits" << cache.memoryHits()
            << "disk hits" << cache.diskHits() << "fetches" << cache.fetches();

    return failures == 0 ? 0 : 1;
}
