// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iomanip>
#include <iostream>
#include <mutex>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace l1fee::log {

static Settings settings_{};
static std::mutex out_mtx{};

void init(const Settings& settings) { settings_ = settings; }

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

static std::string_view level_tag(Level level) {
    switch (level) {
        case Level::kTrace:
            return "TRACE";
        case Level::kDebug:
            return "DEBUG";
        case Level::kInfo:
            return " INFO";
        case Level::kWarning:
            return " WARN";
        default:
            return "     ";
    }
}

Line::Line(Level level, std::string_view msg, const Args& args) : enabled_{test_verbosity(level)} {
    if (!enabled_) return;

    const std::string_view tag{level_tag(level)};
    if (settings_.log_trim) {
        out_ << "[" << absl::StripAsciiWhitespace(absl::string_view{tag.data(), tag.size()}).substr(0, 4) << "] ";
    } else {
        out_ << tag << " ";
    }
    out_ << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), absl::UTCTimeZone()) << " UTC] ";

    out_ << std::left << std::setw(24) << std::setfill(' ') << msg;
    for (size_t i{0}; i < args.size(); i += 2) {
        out_ << " " << args[i];
        if (i + 1 < args.size()) {
            out_ << "=" << args[i + 1];
        }
    }
}

Line::~Line() {
    if (!enabled_) return;
    std::scoped_lock out_lck{out_mtx};
    std::cerr << out_.str() << '\n';
}

}  // namespace l1fee::log
