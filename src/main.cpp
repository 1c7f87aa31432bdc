#include <iostream>

#include "core/Config.hpp"
#include "core/Pipeline.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    IsoLinkage::Utils::ResourceMonitor monitor;

    IsoLinkage::Config config;

    int exit_code = 0;
    if (!IsoLinkage::Utils::ArgParser::parse(argc, argv, config, exit_code)) {
        return exit_code;  // Parse failed, or help/version printed
    }

    // Configure Logger
    auto& logger = IsoLinkage::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        logger.set_log_file(config.log_file);
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    if (logger.enabled(IsoLinkage::LogLevel::LOG_INFO)) {
        config.print();
    }

    try {
        IsoLinkage::Utils::ScopedLogger main_scope("Main Execution");

        IsoLinkage::Pipeline pipeline(config);
        pipeline.run();

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    if (logger.enabled(IsoLinkage::LogLevel::LOG_INFO)) {
        monitor.print_stats("Total Execution");
    }

    return 0;
}
