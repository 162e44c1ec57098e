// test_platform_detector.cpp - Capability detection and terminal configuration tests

#include <gtest/gtest.h>
#include "platform/PlatformDetector.h"
#include "terminal/MouseSequences.h"
#include "TestDoubles.h"
#include <algorithm>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace TerminalMouse::Platform {
namespace Tests {

using TerminalMouse::Tests::FakePlatformProbe;
using TerminalMouse::Tests::RecordingTerminalOutput;
namespace Seq = Terminal::Sequences;

// ============================================================================
// Test Fixture
// ============================================================================

class PlatformDetectorTest : public ::testing::Test {
protected:
    PlatformDetector& Detector() {
        if (!detector) {
            detector = std::make_unique<PlatformDetector>(probe, output);
        }
        return *detector;
    }

    static bool HasRecommendation(const std::vector<std::string>& list, const std::string& fragment) {
        return std::any_of(list.begin(), list.end(),
                           [&](const std::string& line) { return line.find(fragment) != std::string::npos; });
    }

    FakePlatformProbe probe;
    RecordingTerminalOutput output;
    std::unique_ptr<PlatformDetector> detector;
};

// ============================================================================
// Support Level Decision Table
// ============================================================================

TEST_F(PlatformDetectorTest, NoTerminalIdentificationIsNone) {
    auto support = Detector().DetectCapabilities();

    EXPECT_EQ(support.supportLevel, SupportLevel::None);
    EXPECT_FALSE(Detector().TestMouseFunctionality());
}

TEST_F(PlatformDetectorTest, KnownRichTerminalIsFull) {
    probe.env["TERM"] = "xterm-256color";
    probe.env["TERM_PROGRAM"] = "vscode";

    auto support = Detector().DetectCapabilities();

    EXPECT_EQ(support.supportLevel, SupportLevel::Full);
    EXPECT_TRUE(support.Supports(MouseProtocol::Sgr));
    EXPECT_TRUE(support.Supports(MouseProtocol::Utf8));
    EXPECT_EQ(support.platform, OsFamily::Linux);
    EXPECT_EQ(support.terminal.termProgram, "vscode");
}

TEST_F(PlatformDetectorTest, RichTerminalInContainerIsPartial) {
    probe.env["TERM_PROGRAM"] = "iTerm2.app";
    probe.files.insert("/.dockerenv");

    auto support = Detector().DetectCapabilities();

    EXPECT_TRUE(support.isContainer);
    EXPECT_EQ(support.supportLevel, SupportLevel::Partial);
}

TEST_F(PlatformDetectorTest, ContainerFromOrchestrationEnvironment) {
    probe.env["TERM"] = "vt100";
    probe.env["KUBERNETES_SERVICE_HOST"] = "10.0.0.1";

    auto support = Detector().DetectCapabilities();

    EXPECT_TRUE(support.isContainer);
    EXPECT_EQ(support.supportLevel, SupportLevel::Partial);
}

TEST_F(PlatformDetectorTest, WslWithWindowsTerminalIsPartial) {
    probe.env["TERM"] = "xterm";
    probe.env["WSL_DISTRO_NAME"] = "Ubuntu";
    probe.env["WT_SESSION"] = "5c8e9d4a";

    auto support = Detector().DetectCapabilities();

    EXPECT_TRUE(support.isWSL);
    EXPECT_EQ(support.supportLevel, SupportLevel::Partial);
}

TEST_F(PlatformDetectorTest, WslWithoutRichHostIsMinimal) {
    probe.env["TERM"] = "xterm";
    probe.env["WSLENV"] = "WT_SESSION::WT_PROFILE_ID";

    auto support = Detector().DetectCapabilities();

    EXPECT_TRUE(support.isWSL);
    EXPECT_EQ(support.supportLevel, SupportLevel::Minimal);
}

TEST_F(PlatformDetectorTest, WslFromKernelVersion) {
    probe.env["TERM"] = "linux";
    probe.fileContents["/proc/version"] = "Linux version 5.15.90.1-microsoft-standard-WSL2";

    auto support = Detector().DetectCapabilities();

    EXPECT_TRUE(support.isWSL);
}

TEST_F(PlatformDetectorTest, GenericXtermFamilyIsPartial) {
    probe.env["TERM"] = "screen";

    auto support = Detector().DetectCapabilities();

    EXPECT_EQ(support.supportLevel, SupportLevel::Partial);
    EXPECT_FALSE(support.isWSL);
    EXPECT_FALSE(support.isContainer);
}

TEST_F(PlatformDetectorTest, DumbTerminalIsNone) {
    probe.env["TERM"] = "dumb";

    EXPECT_EQ(Detector().DetectCapabilities().supportLevel, SupportLevel::None);
}

TEST_F(PlatformDetectorTest, UnknownTerminalIsMinimalWithUrxvtFallback) {
    probe.env["TERM"] = "linux";

    auto support = Detector().DetectCapabilities();

    EXPECT_EQ(support.supportLevel, SupportLevel::Minimal);
    ASSERT_EQ(support.supportedProtocols.size(), 1u);
    EXPECT_EQ(support.supportedProtocols[0], MouseProtocol::Urxvt);
}

TEST_F(PlatformDetectorTest, UnicodeTerminalIsBoundedTo223) {
    probe.env["TERM"] = "rxvt-unicode-256color";

    auto support = Detector().DetectCapabilities();

    EXPECT_TRUE(support.Supports(MouseProtocol::Urxvt));
    EXPECT_EQ(support.maxCoordinates.x, 223);
    EXPECT_EQ(support.maxCoordinates.y, 223);
}

TEST_F(PlatformDetectorTest, OperatingSystemFamily) {
    probe.os = "Darwin";
    probe.env["TERM"] = "xterm";

    EXPECT_EQ(Detector().DetectCapabilities().platform, OsFamily::Darwin);
}

TEST_F(PlatformDetectorTest, ProbeFailureDegradesToNone) {
    probe.env["TERM"] = "xterm-256color";
    probe.throwOnEnv = true;

    auto support = Detector().DetectCapabilities();

    EXPECT_EQ(support.supportLevel, SupportLevel::None);
    EXPECT_FALSE(Detector().Configure());
    EXPECT_TRUE(output.written.empty());
}

// ============================================================================
// Protocol Choice
// ============================================================================

TEST_F(PlatformDetectorTest, ChooseProtocolPrefersSgr) {
    ProtocolSupport support;
    support.supportedProtocols = {MouseProtocol::Urxvt, MouseProtocol::Utf8, MouseProtocol::Sgr};
    support.supportLevel = SupportLevel::Partial;

    auto config = ChooseProtocol(support);

    EXPECT_EQ(config.mode, MouseProtocol::Sgr);
    EXPECT_TRUE(config.enableButtons);
    EXPECT_FALSE(config.enableMotion);
    EXPECT_FALSE(config.enableFocus);
}

TEST_F(PlatformDetectorTest, ChooseProtocolUtf8HasNoMotion) {
    ProtocolSupport support;
    support.supportedProtocols = {MouseProtocol::Utf8};
    support.supportLevel = SupportLevel::Full;

    auto config = ChooseProtocol(support);

    EXPECT_EQ(config.mode, MouseProtocol::Utf8);
    EXPECT_TRUE(config.enableTracking);
    EXPECT_TRUE(config.enableButtons);
    EXPECT_FALSE(config.enableMotion);
    EXPECT_FALSE(config.enableFocus);
}

TEST_F(PlatformDetectorTest, ChooseProtocolUrxvtMinimalHasNoButtons) {
    ProtocolSupport support;
    support.supportedProtocols = {MouseProtocol::Urxvt};
    support.supportLevel = SupportLevel::Minimal;

    auto config = ChooseProtocol(support);

    EXPECT_EQ(config.mode, MouseProtocol::Urxvt);
    EXPECT_TRUE(config.enableTracking);
    EXPECT_FALSE(config.enableButtons);
}

// ============================================================================
// Configure / Disable
// ============================================================================

TEST_F(PlatformDetectorTest, ConfigureFullSgrTerminal) {
    probe.env["TERM"] = "xterm-256color";

    ASSERT_TRUE(Detector().Configure());

    EXPECT_TRUE(output.Contains(Seq::kEnableTracking));
    EXPECT_TRUE(output.Contains(Seq::kEnableButtonEvents));
    EXPECT_TRUE(output.Contains(Seq::kEnableAnyMotion));
    EXPECT_TRUE(output.Contains(Seq::kEnableSgrMode));
    EXPECT_TRUE(output.Contains(Seq::kEnableFocusEvents));
    EXPECT_FALSE(output.Contains(Seq::kEnableUrxvtMode));
    EXPECT_TRUE(Detector().IsConfigured());
}

TEST_F(PlatformDetectorTest, ConfigurePartialTerminalSkipsMotionAndFocus) {
    probe.env["TERM"] = "screen";

    ASSERT_TRUE(Detector().Configure());

    EXPECT_TRUE(output.Contains(Seq::kEnableSgrMode));
    EXPECT_FALSE(output.Contains(Seq::kEnableAnyMotion));
    EXPECT_FALSE(output.Contains(Seq::kEnableFocusEvents));
}

TEST_F(PlatformDetectorTest, ConfigureMinimalTerminalUsesUrxvt) {
    probe.env["TERM"] = "linux";

    ASSERT_TRUE(Detector().Configure());

    EXPECT_EQ(output.written, std::string(Seq::kEnableTracking) + std::string(Seq::kEnableUrxvtMode));
}

TEST_F(PlatformDetectorTest, ConfigureIsIdempotent) {
    probe.env["TERM"] = "xterm";

    ASSERT_TRUE(Detector().Configure());
    ASSERT_TRUE(Detector().Configure());

    EXPECT_EQ(output.writes, 1);
}

TEST_F(PlatformDetectorTest, ConfigureWithoutSupportWritesNothing) {
    probe.env["TERM"] = "dumb";

    EXPECT_FALSE(Detector().Configure());
    EXPECT_TRUE(output.written.empty());
}

TEST_F(PlatformDetectorTest, ConfigureWriteFailure) {
    probe.env["TERM"] = "xterm";
    output.fail = true;

    EXPECT_FALSE(Detector().Configure());
    EXPECT_FALSE(Detector().IsConfigured());
}

TEST_F(PlatformDetectorTest, DisableWritesEveryVariant) {
    probe.env["TERM"] = "xterm";
    ASSERT_TRUE(Detector().Configure());
    output.Clear();

    EXPECT_TRUE(Detector().Disable());

    for (auto sequence : {Seq::kDisableTracking, Seq::kDisableButtonEvents, Seq::kDisableAnyMotion,
                          Seq::kDisableSgrMode, Seq::kDisableUtf8Mode, Seq::kDisableUrxvtMode,
                          Seq::kDisableFocusEvents}) {
        EXPECT_TRUE(output.Contains(sequence)) << std::string(sequence.substr(1));
    }
    EXPECT_FALSE(Detector().IsConfigured());
}

TEST_F(PlatformDetectorTest, DisableTwiceIsHarmless) {
    probe.env["TERM"] = "xterm";

    EXPECT_TRUE(Detector().Disable());
    const std::string first = output.written;
    EXPECT_TRUE(Detector().Disable());

    EXPECT_EQ(output.written, first + first);
}

TEST_F(PlatformDetectorTest, DisableWritesNothingWithoutSupport) {
    probe.env["TERM"] = "dumb";

    EXPECT_TRUE(Detector().Disable());
    EXPECT_TRUE(output.written.empty());
}

TEST_F(PlatformDetectorTest, ReconfigureAfterDisable) {
    probe.env["TERM"] = "xterm";
    ASSERT_TRUE(Detector().Configure());
    ASSERT_TRUE(Detector().Disable());
    output.Clear();

    ASSERT_TRUE(Detector().Configure());
    EXPECT_TRUE(output.Contains(Seq::kEnableTracking));
}

// ============================================================================
// Memoization and Concurrency
// ============================================================================

TEST_F(PlatformDetectorTest, DetectionIsMemoized) {
    probe.env["TERM"] = "xterm";

    Detector().DetectCapabilities();
    Detector().DetectCapabilities();
    Detector().Configure();
    Detector().Recommendations();

    EXPECT_EQ(probe.nameQueries.load(), 1);
}

TEST_F(PlatformDetectorTest, ConcurrentCallersShareOneDetection) {
    probe.env["TERM"] = "xterm-256color";
    PlatformDetector& shared = Detector();

    std::vector<std::thread> threads;
    std::vector<SupportLevel> levels(8, SupportLevel::None);
    for (std::size_t i = 0; i < levels.size(); ++i) {
        threads.emplace_back([&shared, &levels, i] {
            levels[i] = shared.DetectCapabilities().supportLevel;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(probe.nameQueries.load(), 1);
    for (SupportLevel level : levels) {
        EXPECT_EQ(level, SupportLevel::Full);
    }
}

TEST_F(PlatformDetectorTest, CachedCapabilitiesAfterDetection) {
    probe.env["TERM"] = "xterm";

    EXPECT_FALSE(Detector().GetCachedCapabilities().has_value());
    Detector().DetectCapabilitiesAsync().wait();

    auto cached = Detector().GetCachedCapabilities();
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->supportLevel, SupportLevel::Partial);
}

// ============================================================================
// Recommendations
// ============================================================================

TEST_F(PlatformDetectorTest, RecommendationsForWsl) {
    probe.env["TERM"] = "xterm";
    probe.env["WSL_DISTRO_NAME"] = "Debian";

    auto recommendations = Detector().Recommendations();

    EXPECT_TRUE(HasRecommendation(recommendations, "WSL detected"));
    EXPECT_TRUE(HasRecommendation(recommendations, "Limited mouse support"));
}

TEST_F(PlatformDetectorTest, RecommendationsWithoutSupport) {
    probe.os = "Plan9";

    auto recommendations = Detector().Recommendations();

    EXPECT_TRUE(HasRecommendation(recommendations, "No mouse support detected"));
    EXPECT_TRUE(HasRecommendation(recommendations, "Unknown platform"));
}

TEST_F(PlatformDetectorTest, NoRecommendationsForFullSupport) {
    probe.env["TERM_PROGRAM"] = "vscode";

    EXPECT_TRUE(Detector().Recommendations().empty());
}

} // namespace Tests
} // namespace TerminalMouse::Platform
