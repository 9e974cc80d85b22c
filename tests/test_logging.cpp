//
// Unit tests for logging setup
//

#include <gtest/gtest.h>
#include "logging.hpp"

#include <boost/log/core/core.hpp>

TEST(Logging, ParseSeverity)
{
    boost::log::trivial::severity_level level = boost::log::trivial::fatal;
    EXPECT_TRUE(parse_severity("debug", level));
    EXPECT_EQ(level, boost::log::trivial::debug);
    EXPECT_TRUE(parse_severity("warning", level));
    EXPECT_EQ(level, boost::log::trivial::warning);
    EXPECT_FALSE(parse_severity("loud", level));
    EXPECT_EQ(level, boost::log::trivial::warning);
}

TEST(Logging, ConfigureSinksCanBeRepeated)
{
    Log_Sink_Config config;
    config.threshold = boost::log::trivial::error;
    EXPECT_NO_THROW(configure_log_sinks(config));

    config.console = false;
    EXPECT_NO_THROW(configure_log_sinks(config));
    EXPECT_FALSE(boost::log::core::get()->get_logging_enabled());
    LOG_CHANNEL_WARNING(LOG_CHANNEL_SPLITTER) << "dropped";

    config.console = true;
    configure_log_sinks(config);
    EXPECT_TRUE(boost::log::core::get()->get_logging_enabled());
}
