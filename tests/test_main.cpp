#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "logging/Log.h"

int main(int argc, char* argv[]) {
    deskpool::logging::set_level(deskpool::logging::Level::Error);
    return Catch::Session().run(argc, argv);
}
