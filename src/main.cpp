#include <QCoreApplication>
#include <QCommandLineParser>
#include "AppConstants.h"
#include "HttpServer.h"
#include "JobRegistry.h"
#include "Logging.h"
#include "RenderService.h"
#include "ServerConfig.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Renders short vertical videos from editor timelines.");
    parser.addHelpOption();
    parser.addVersionOption();
    ServerConfigLoader::addOptions(parser);
    parser.process(app);

    ServerConfig config;
    ServerConfigLoader loader;
    if (!loader.load(parser, config) || !loader.ensureDirectories(config)) {
        qCCritical(REELFORGE_SERVER_LOG) << loader.errorString();
        return 1;
    }

    JobRegistry registry;
    RenderService service(config, registry);
    HttpServer server(config.maxBodyBytes);
    service.registerRoutes(server);

    if (!server.listen(config.host, static_cast<quint16>(config.port))) {
        qCCritical(REELFORGE_SERVER_LOG) << server.errorString();
        return 1;
    }
    qCInfo(REELFORGE_SERVER_LOG) << "Data directory" << config.dataDir
                                 << "encoder" << config.encoderPath;

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &service, &RenderService::shutdownTasks);

    return app.exec();
}
