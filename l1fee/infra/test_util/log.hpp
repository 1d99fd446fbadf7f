// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <l1fee/infra/common/log.hpp>

namespace l1fee::test_util {

//! Sets the log verbosity for the lifetime of the object, so tests can run in shuffled order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : saved_level_(log::get_verbosity()) {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(saved_level_); }

  private:
    log::Level saved_level_;
};

//! Redirects log output into a string while alive
class LogCapture {
  public:
    explicit LogCapture(log::Level level) : verbosity_{level}, saved_buf_{std::cerr.rdbuf(captured_.rdbuf())} {}
    ~LogCapture() { std::cerr.rdbuf(saved_buf_); }

    std::string str() const { return captured_.str(); }

  private:
    SetLogVerbosityGuard verbosity_;
    std::stringstream captured_;
    std::streambuf* saved_buf_;
};

}  // namespace l1fee::test_util
