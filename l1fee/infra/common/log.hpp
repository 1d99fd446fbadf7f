// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace l1fee::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,     // Lines printed regardless of verbosity
    kWarning,  // Unexpected oracle or config content
    kInfo,     // Regular operations
    kDebug,    // Values resolved for a block
    kTrace     // Per-call details
};

struct Settings {
    //! Lines at or below this level are printed
    Level log_verbosity{Level::kNone};
    //! Print the 4-char level tag in brackets instead of the padded one
    bool log_trim{false};
};

//! \brief Initializes logging facilities
//! \note Not thread safe: meant to be called once at start of process
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! \brief Checks if a line at the given level would be printed with the current settings
bool test_verbosity(Level level);

//! Alternating keys and values
using Args = std::vector<std::string>;

//! \brief A single log line, written to std::cerr when destroyed
class Line {
  public:
    Line(Level level, std::string_view msg, const Args& args = {});
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    //! Formatted content, empty when the level is filtered out
    std::string str() const { return out_.str(); }

  private:
    const bool enabled_;
    std::ostringstream out_;
};

}  // namespace l1fee::log

#define L1FEE_LOG_LINE(level_, ...)            \
    if (!l1fee::log::test_verbosity(level_)) { \
    } else                                     \
        l1fee::log::Line(level_, __VA_ARGS__)

#define L1FEE_TRACE_M(...) L1FEE_LOG_LINE(l1fee::log::Level::kTrace, __VA_ARGS__)
#define L1FEE_DEBUG_M(...) L1FEE_LOG_LINE(l1fee::log::Level::kDebug, __VA_ARGS__)
#define L1FEE_INFO_M(...) L1FEE_LOG_LINE(l1fee::log::Level::kInfo, __VA_ARGS__)
#define L1FEE_WARN_M(...) L1FEE_LOG_LINE(l1fee::log::Level::kWarning, __VA_ARGS__)
