#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>

int main(int argc, char* argv[]) {
    using namespace Catch::clara;

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
