#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <tmpdir/util/log.hpp>

int main(int argc, char** argv) {
    tmpdir::log::init_logger();
    return Catch::Session().run(argc, argv);
}
