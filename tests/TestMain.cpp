#include <catch2/catch_session.hpp>

#include "ks/core/Logger.hpp"

int main(int argc, char* argv[]) {
    ks::core::Logger::SetDebugEnabled(false);

    Catch::Session session;
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
