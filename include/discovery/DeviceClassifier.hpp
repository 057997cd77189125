#pragma once
#include "audio/AudioTypes.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

// Best-effort device classification from the OS-reported name.
// Naming varies by locale and driver, so results can be wrong; callers must
// tolerate a misclassified device. Capability checks (input/output channels)
// live in DeviceCatalog, not here.
class DeviceClassifier {
    struct RuleEntry {
        std::regex pattern;
        int        tier;    // lower wins when searching for a system device
    };

    std::vector<RuleEntry> loopbackRules_;
    std::regex microphonePattern_;
    std::regex outputPattern_;

public:
    // Loopback tiers, in search priority order
    static constexpr int kTierLoopback   = 0;
    static constexpr int kTierMonitor    = 1;
    static constexpr int kTierStereoMix  = 2;
    static constexpr int kTierVirtual    = 3;
    static constexpr int kTierNone       = -1;

    DeviceClassifier()
        : microphonePattern_(R"(mic|headset)", std::regex::icase)
        , outputPattern_(R"(speakers?|headphones?|динамики|Динамики|наушники|Наушники)",
                         std::regex::icase)
    {
        auto add = [&](const std::string& pattern, int tier) {
            loopbackRules_.push_back({std::regex(pattern, std::regex::icase), tier});
        };

        add(R"(loopback)",   kTierLoopback);
        add(R"(monitor)",    kTierMonitor);
        add(R"(stereo mix)", kTierStereoMix);
        // Virtual loopback products
        add(R"(blackhole|soundflower|vb-?audio|cable output|voicemeeter)",
            kTierVirtual);
    }

    struct ClassificationResult {
        DeviceKind kind;
        int        tier;
    };

    ClassificationResult classify(const std::string& name) const {
        std::string trimmed = trim(name);
        if (trimmed.empty())
            return {DeviceKind::Other, kTierNone};

        for (auto& rule : loopbackRules_) {
            if (std::regex_search(trimmed, rule.pattern))
                return {DeviceKind::SystemLoopback, rule.tier};
        }
        return {DeviceKind::Microphone, kTierNone};
    }

    DeviceKind kindOf(const std::string& name) const { return classify(name).kind; }

    // "Mic", "Microphone", "Headset": skipped by the fallback system search
    bool looksLikeMicrophone(const std::string& name) const {
        return std::regex_search(name, microphonePattern_);
    }

    // Common render-endpoint names ("Speakers", "Headphones", localized)
    bool looksLikeOutputDevice(const std::string& name) const {
        return std::regex_search(name, outputPattern_);
    }

private:
    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(),
            [](unsigned char c){ return !std::isspace(c); }));
        s.erase(std::find_if(s.rbegin(), s.rend(),
            [](unsigned char c){ return !std::isspace(c); }).base(), s.end());
        return s;
    }
};
