#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SampleWriter.hpp"
#include "SignalEngine.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        // 1. Parse command line, config file and environment
        ParameterContext context;
        if (!context.init(argc, argv)) {
            return 0;
        }

        const ConfigData& config = context.get_config_data();
        LogUtils::init(config.global.verbose ? LogUtils::Level::Debug : LogUtils::Level::Info,
                       config.global.log_file);
        LogUtils::debug("Configured {} signal(s), backend {}, {} digits",
                        config.signals.size(),
                        NumericConfig::backend_to_string(config.numeric.backend),
                        config.numeric.dps);

        // 2. Evaluate every configured signal and write the samples
        try {
            SignalEngine engine(config.numeric);
            auto sets = engine.run_all(config.signals);
            SampleWriter::write(config.output, sets);
        } catch (const std::exception& e) {
            LogUtils::error("Error during signal evaluation: " + std::string(e.what()));
            result = 1;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
