// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "credential_prompt.hpp"

#include <termios.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>

namespace mpupload {
namespace cli {

namespace {

/**
 * Disables terminal echo on stdin for its lifetime. Does nothing when stdin
 * is not a terminal.
 */
class EchoDisabler {
public:
  EchoDisabler() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) != 0) {
      return;
    }
    termios silent = saved_;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
  }

  ~EchoDisabler() {
    if (active_) {
      tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
    }
  }

  EchoDisabler(const EchoDisabler&) = delete;
  EchoDisabler& operator=(const EchoDisabler&) = delete;

  bool active() const {
    return active_;
  }

private:
  termios saved_{};
  bool active_ = false;
};

void fill_from_env(const char* name, std::string& value) {
  if (!value.empty()) {
    return;
  }
  if (const char* env = std::getenv(name)) {
    value = env;
  }
}

}  // namespace

bool fill_keys_from_env(std::string& access_key, std::string& secret_key) {
  fill_from_env("AWS_ACCESS_KEY_ID", access_key);
  fill_from_env("AWS_SECRET_ACCESS_KEY", secret_key);
  return !access_key.empty() && !secret_key.empty();
}

bool prompt_credentials(std::istream& in, std::ostream& out, LoginCredentials& credentials) {
  out << "Username: " << std::flush;
  if (!std::getline(in, credentials.username) || credentials.username.empty()) {
    return false;
  }

  out << "Password: " << std::flush;
  bool read_ok = false;
  if (&in == &std::cin) {
    EchoDisabler no_echo;
    read_ok = static_cast<bool>(std::getline(in, credentials.password));
    if (no_echo.active()) {
      out << std::endl;
    }
  } else {
    read_ok = static_cast<bool>(std::getline(in, credentials.password));
  }
  return read_ok;
}

}  // namespace cli
}  // namespace mpupload
