#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

using namespace IsoLinkage;
using namespace IsoLinkage::Utils;

/**
 * @brief Prints wall time (and jemalloc heap, when enabled) after each test.
 */
class ResourceListener : public testing::EmptyTestEventListener {
public:
    void OnTestStart(const testing::TestInfo& /*test_info*/) override { monitor_.reset(); }

    void OnTestEnd(const testing::TestInfo& test_info) override {
        monitor_.print_stats(std::string(test_info.test_suite_name()) + "." + test_info.name());
    }

private:
    ResourceMonitor monitor_;
};

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    // Timeouts and dropped introns log warnings; keep test output readable
    // unless ISOLINKAGE_TEST_DEBUG is set.
    auto& logger = Logger::instance();
    logger.set_color(false);
    logger.set_log_level(std::getenv("ISOLINKAGE_TEST_DEBUG") ? LogLevel::LOG_DEBUG : LogLevel::LOG_ERROR);

    testing::TestEventListeners& listeners = testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new ResourceListener);

    return RUN_ALL_TESTS();
}
