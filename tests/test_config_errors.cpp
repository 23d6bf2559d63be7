#include "vk_check.h"
#include "vk_config.h"
#include "vk_log.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

vrc::ErrorKind kind_of(VkResult res) {
    try {
        VRC_CHECK(res);
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.result(), res);
        return e.kind();
    }
    ADD_FAILURE() << "VRC_CHECK did not throw for " << vrc::to_string(res);
    return vrc::ErrorKind::Precondition;
}

struct CapturedLog {
    std::vector<std::pair<vrc::LogLevel, std::string>> lines;
};

void capture(vrc::LogLevel level, const char* msg, void* user) { static_cast<CapturedLog*>(user)->lines.emplace_back(level, msg); }

} // namespace

TEST(RendererConfig, DefaultsAreValid) {
    const vrc::RendererConfig cfg{};
    EXPECT_NO_THROW(vrc::validate(cfg));
    EXPECT_EQ(cfg.frames_in_flight, 2u);
    EXPECT_EQ(cfg.preferred_present_mode, VK_PRESENT_MODE_MAILBOX_KHR);
}

TEST(RendererConfig, RejectsFramesInFlightOutsideArena) {
    vrc::RendererConfig cfg{};
    cfg.frames_in_flight = 0;
    EXPECT_THROW(vrc::validate(cfg), vrc::RenderError);
    cfg.frames_in_flight = vrc::kMaxFramesInFlight + 1;
    try {
        vrc::validate(cfg);
        FAIL() << "expected a precondition error";
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.kind(), vrc::ErrorKind::Precondition);
        EXPECT_FALSE(e.fatal());
    }
}

TEST(RendererConfig, RejectsEmptyWindow) {
    vrc::RendererConfig cfg{};
    cfg.window_height = 0;
    EXPECT_THROW(vrc::validate(cfg), vrc::RenderError);
}

TEST(VrcCheck, SuccessDoesNotThrow) { EXPECT_NO_THROW(VRC_CHECK(VK_SUCCESS)); }

TEST(VrcCheck, MapsResultsOntoErrorKinds) {
    EXPECT_EQ(kind_of(VK_ERROR_OUT_OF_DEVICE_MEMORY), vrc::ErrorKind::OutOfDeviceMemory);
    EXPECT_EQ(kind_of(VK_ERROR_OUT_OF_HOST_MEMORY), vrc::ErrorKind::OutOfDeviceMemory);
    EXPECT_EQ(kind_of(VK_ERROR_DEVICE_LOST), vrc::ErrorKind::DeviceLost);
    EXPECT_EQ(kind_of(VK_ERROR_INITIALIZATION_FAILED), vrc::ErrorKind::Vulkan);
}

TEST(VrcCheck, MessageNamesTheFailingExpression) {
    try {
        VRC_CHECK(VK_ERROR_DEVICE_LOST);
        FAIL();
    } catch (const vrc::RenderError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("VK_ERROR_DEVICE_LOST"), std::string::npos);
        EXPECT_TRUE(e.fatal());
    }
}

TEST(VrcRequire, ThrowsPreconditionWithMessage) {
    try {
        VRC_REQUIRE(1 + 1 == 3, "arithmetic");
        FAIL();
    } catch (const vrc::RenderError& e) {
        EXPECT_EQ(e.kind(), vrc::ErrorKind::Precondition);
        EXPECT_NE(std::string(e.what()).find("arithmetic"), std::string::npos);
    }
}

TEST(ErrorKinds, OnlyPreconditionIsRecoverable) {
    for (auto k : {vrc::ErrorKind::NoSuitableDevice, vrc::ErrorKind::OutOfDeviceMemory, vrc::ErrorKind::DeviceLost, vrc::ErrorKind::BindingMismatch, vrc::ErrorKind::UnsupportedBlitFormat, vrc::ErrorKind::Platform, vrc::ErrorKind::Vulkan}) {
        EXPECT_TRUE(vrc::is_fatal(k)) << vrc::to_string(k);
    }
    EXPECT_FALSE(vrc::is_fatal(vrc::ErrorKind::Precondition));
}

TEST(Logging, CallbackReceivesEnabledLevelsOnly) {
    CapturedLog log;
    vrc::set_log_callback(&capture, &log);
    vrc::set_log_level(vrc::LogLevel::Warn);
    vrc::log_info("hidden {}", 1);
    vrc::log_warn("shown {}", 2);
    vrc::log_error("shown {}", 3);
    vrc::set_log_callback(nullptr, nullptr);
    vrc::set_log_level(vrc::LogLevel::Info);

    ASSERT_EQ(log.lines.size(), 2u);
    EXPECT_EQ(log.lines[0].first, vrc::LogLevel::Warn);
    EXPECT_EQ(log.lines[0].second, "shown 2");
    EXPECT_EQ(log.lines[1].second, "shown 3");
}
