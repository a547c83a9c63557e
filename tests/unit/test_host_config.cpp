#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <hostkit/host_config.hpp>
#include <limits>
#include <stdexcept>

using namespace hostkit;

TEST(HostConfig, DefaultsAreValid)
{
    HostConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.state_stability_delay_s, 0.1);
    EXPECT_DOUBLE_EQ(config.hidden_stability_delay_s, 0.0);
    EXPECT_FALSE(config.fix_bounds_during_drag);
    EXPECT_TRUE(config.restore_maximized_across_iconify);
}

TEST(HostConfig, NegativeDelayRejected)
{
    HostConfig config;
    config.state_stability_delay_s = -0.01;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(HostConfig, NonFiniteDelayRejected)
{
    HostConfig config;
    config.anti_flicker_delay_s = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config.anti_flicker_delay_s = std::numeric_limits<double>::infinity();
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(HostConfig, ZeroPeriodRejected)
{
    HostConfig config;
    config.event_logic_period_s = 0.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(HostConfig, ZeroDelaysAccepted)
{
    HostConfig config;
    config.state_stability_delay_s    = 0.0;
    config.client_painting_delay_s    = 0.0;
    config.drag_move_blocking_delay_s = 0.0;
    EXPECT_NO_THROW(config.validate());
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(HostConfigJson, RoundTripKeepsEveryField)
{
    HostConfig a;
    a.event_logic_period_s                     = 0.02;
    a.state_stability_delay_s                  = 0.25;
    a.anti_flicker_delay_s                     = 0.05;
    a.paint_during_resize                      = false;
    a.request_focus_on_deiconify               = false;
    a.request_focus_on_deiconified             = true;
    a.set_demax_bounds_while_hidden_or_iconified = false;
    a.use_exception_handler_for_client         = true;

    HostConfig b;
    ASSERT_TRUE(b.deserialize(a.serialize()));
    EXPECT_DOUBLE_EQ(b.event_logic_period_s, 0.02);
    EXPECT_DOUBLE_EQ(b.state_stability_delay_s, 0.25);
    EXPECT_DOUBLE_EQ(b.anti_flicker_delay_s, 0.05);
    EXPECT_FALSE(b.paint_during_resize);
    EXPECT_FALSE(b.request_focus_on_deiconify);
    EXPECT_TRUE(b.request_focus_on_deiconified);
    EXPECT_FALSE(b.set_demax_bounds_while_hidden_or_iconified);
    EXPECT_TRUE(b.use_exception_handler_for_client);
}

TEST(HostConfigJson, MissingKeysKeepCurrentValues)
{
    HostConfig config;
    config.fix_bounds_during_drag = true;
    ASSERT_TRUE(config.deserialize(R"({"version": 1, "state_stability_delay_s": 0.3})"));
    EXPECT_DOUBLE_EQ(config.state_stability_delay_s, 0.3);
    EXPECT_TRUE(config.fix_bounds_during_drag);
}

TEST(HostConfigJson, UnknownKeysIgnored)
{
    HostConfig config;
    EXPECT_TRUE(config.deserialize(R"({"colour": "blue", "paint_during_move": false})"));
    EXPECT_FALSE(config.paint_during_move);
}

TEST(HostConfigJson, EmptyAndFutureVersionRejected)
{
    HostConfig config;
    EXPECT_FALSE(config.deserialize(""));
    EXPECT_FALSE(config.deserialize(R"({"version": 2, "paint_during_move": false})"));
    EXPECT_TRUE(config.paint_during_move);
}

// ─── Files ───────────────────────────────────────────────────────────────────

TEST(HostConfigFile, SaveThenLoad)
{
    const auto path = std::filesystem::temp_directory_path() / "hostkit_test" / "host.json";
    std::filesystem::remove(path);

    HostConfig saved;
    saved.hidden_stability_delay_s = 0.2;
    ASSERT_TRUE(saved.save(path.string()));

    HostConfig loaded;
    ASSERT_TRUE(loaded.load(path.string()));
    EXPECT_DOUBLE_EQ(loaded.hidden_stability_delay_s, 0.2);

    std::filesystem::remove_all(path.parent_path());
}

TEST(HostConfigFile, LoadMissingFileFails)
{
    HostConfig config;
    EXPECT_FALSE(config.load("/nonexistent/hostkit/host.json"));
}

TEST(HostConfigFile, DefaultPathHonorsEnvironment)
{
    ::setenv("HOSTKIT_CONFIG", "/tmp/custom_host.json", 1);
    EXPECT_EQ(HostConfig::default_path(), "/tmp/custom_host.json");
    ::unsetenv("HOSTKIT_CONFIG");
    EXPECT_NE(HostConfig::default_path().find("host.json"), std::string::npos);
}
