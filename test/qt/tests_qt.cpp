#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <QCoreApplication>
#include <cstdlib>

int main(int argc, char* argv[]) {
    using namespace Catch::clara;

    // Queued signal delivery needs an application object on the main thread
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SshDeckTests");
    QCoreApplication::setApplicationName("sshdeck_qt_tests");

    Catch::Session session;
    bool show_logging = false;

    auto cli = session.cli()
        | Opt(show_logging)
             ["--show-log"]
             ("Show SshDeck debug log");

    session.cli(cli);

    auto ret = session.applyCommandLine(argc, argv);
    if (ret) {
        return ret;
    }
    if (show_logging) {
        setenv("SSHDECK_LOG", "debug", 1);
    }

    return session.run();
}
