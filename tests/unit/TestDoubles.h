// TestDoubles.h - Fakes shared by the unit tests

#pragma once

#include "core/Clock.h"
#include "platform/IPlatformProbe.h"
#include "platform/ITerminalOutput.h"
#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace TerminalMouse::Tests {

// Clock that only moves when told to
class ManualClock : public Core::IClock {
public:
    Core::SteadyTimePoint Now() const override { return m_now; }

    void Advance(std::chrono::milliseconds delta) { m_now += delta; }
    void AdvanceMicros(std::chrono::microseconds delta) { m_now += delta; }

private:
    Core::SteadyTimePoint m_now{std::chrono::seconds(1000)};
};

// Platform probe driven entirely by test data
class FakePlatformProbe : public Platform::IPlatformProbe {
public:
    std::string os = "Linux";
    std::map<std::string, std::string> env;
    std::set<std::string> files;
    std::map<std::string, std::string> fileContents;
    std::string terminalName;
    bool throwOnEnv = false;
    mutable std::atomic<int> envReads{0};
    mutable std::atomic<int> nameQueries{0};

    std::string OperatingSystem() const override { return os; }

    std::optional<std::string> GetEnv(const std::string& name) const override {
        ++envReads;
        if (throwOnEnv) {
            throw std::runtime_error("environment unavailable");
        }
        auto it = env.find(name);
        if (it == env.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool FileExists(const std::string& path) const override {
        return files.count(path) > 0 || fileContents.count(path) > 0;
    }

    std::optional<std::string> ReadFile(const std::string& path) const override {
        auto it = fileContents.find(path);
        if (it == fileContents.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> QueryTerminalName() const override {
        ++nameQueries;
        if (terminalName.empty()) {
            return std::nullopt;
        }
        return terminalName;
    }
};

// Terminal output that records everything written
class RecordingTerminalOutput : public Platform::ITerminalOutput {
public:
    std::string written;
    int writes = 0;
    bool fail = false;

    bool Write(std::string_view data) override {
        if (fail) {
            return false;
        }
        ++writes;
        written.append(data);
        return true;
    }

    bool Contains(std::string_view sequence) const {
        return written.find(sequence) != std::string::npos;
    }

    void Clear() {
        written.clear();
        writes = 0;
    }
};

} // namespace TerminalMouse::Tests
