#include "core/coordinator_config.hpp"
#include "core/logging.hpp"
#include "services/annotation/annotation_store.hpp"
#include "services/persistence/persistence_service.hpp"
#include "services/render/vtk_rendering_engine.hpp"
#include "ui/layout_transition_controller.hpp"
#include "ui/viewport_cleanup_manager.hpp"
#include "ui/workstation_context.hpp"

#include <QApplication>
#include <QSettings>
#include <QStandardPaths>
#include <QStyleFactory>
#include <QSurfaceFormat>

#include <vtkOpenGLRenderWindow.h>

/**
 * @brief Application entry point
 *
 * Initializes Qt, VTK and logging, then shows the default viewport layout.
 */
int main(int argc, char* argv[])
{
    using namespace viewport_coordinator;

    // VTK OpenGL settings (must be before QApplication)
    vtkOpenGLRenderWindow::SetGlobalMaximumNumberOfMultiSamples(0);

    // Qt OpenGL settings
    QSurfaceFormat format;
    format.setVersion(4, 1);
    format.setProfile(QSurfaceFormat::CoreProfile);
    format.setDepthBufferSize(24);
    format.setStencilBufferSize(8);
    format.setSwapBehavior(QSurfaceFormat::DoubleBuffer);
    QSurfaceFormat::setDefaultFormat(format);

    QApplication app(argc, argv);
    app.setApplicationName("Viewport Coordinator");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("kcenon");
    app.setOrganizationDomain("github.com/kcenon");
    app.setStyle(QStyleFactory::create("Fusion"));

    QSettings settings("ViewportCoordinator", "ViewportCoordinator");
    const auto config = core::loadCoordinatorConfig(settings);

    logging::LogConfig logConfig;
    logConfig.level = logging::toLogLevel(config.logLevel);
    logConfig.enableFileLogging = true;
    logConfig.logDirectory =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation).toStdString();
    logging::LoggerFactory::configure(logConfig);

    services::VtkRenderingEngine renderer;
    services::AnnotationStore annotations;
    services::SettingsPersistenceService persistence;

    int result = 0;
    {
        ui::WorkstationContext context(renderer, annotations, persistence, config);

        auto& window = context.controller();
        window.setWindowTitle("Viewport Coordinator");
        window.resize(1280, 800);

        context.setLayout(config.defaultLayout, false);
        context.syncEngine().createDefaultSyncGroup();
        context.loadSyncSettings();
        context.cleanupManager().scheduleAutoCleanup(config.autoCleanupInterval);

        window.show();
        result = app.exec();

        context.saveSyncSettings();
    }

    logging::LoggerFactory::shutdown();
    return result;
}
