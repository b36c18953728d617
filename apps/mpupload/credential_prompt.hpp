// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_CREDENTIAL_PROMPT_HPP
#define MPUPLOAD_CREDENTIAL_PROMPT_HPP

#include <istream>
#include <ostream>
#include <string>

namespace mpupload {
namespace cli {

struct LoginCredentials {
  std::string username;
  std::string password;
};

/**
 * Fill whichever of the two keys is empty from AWS_ACCESS_KEY_ID and
 * AWS_SECRET_ACCESS_KEY. Keys given on the command line or in the config
 * file are left alone.
 *
 * @return true if both keys are non-empty afterwards
 */
bool fill_keys_from_env(std::string& access_key, std::string& secret_key);

/**
 * Ask for a username and password on the given streams.
 *
 * Terminal echo is switched off while the password is typed when `in` is
 * std::cin attached to a terminal.
 *
 * @return false if either line could not be read or the username is empty
 */
bool prompt_credentials(std::istream& in, std::ostream& out, LoginCredentials& credentials);

}  // namespace cli
}  // namespace mpupload

#endif  // MPUPLOAD_CREDENTIAL_PROMPT_HPP
