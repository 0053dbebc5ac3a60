#include "rag_service.h"
#include "core/runtime/rag_context.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("hybridrag-service"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    const hr::Settings settings = hr::SettingsManager::resolve();
    std::unique_ptr<hr::RagContext> context = hr::RagContext::create(settings);
    if (!context) {
        LOG_ERROR(hrCore, "Failed to initialise context (db: %s)", qUtf8Printable(settings.dbPath));
        return 1;
    }

    hr::RagService service(*context);
    return service.run();
}
