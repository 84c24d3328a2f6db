// =============================================================================
// zstd-pbf - Test Entry Point
// =============================================================================
// Shared main for every test executable. Logging stays quiet below warnings.
// =============================================================================

#include <gtest/gtest.h>

#include "zpbf/common/logger.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    zpbf::log::Config config;
    config.level = zpbf::log::Level::kWarning;
    zpbf::log::init(config);

    int result = RUN_ALL_TESTS();

    zpbf::log::shutdown();
    return result;
}
