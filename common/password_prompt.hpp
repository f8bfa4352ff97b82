#pragma once

// ============================================================
// password_prompt.hpp -- Interactive password entry without echo
// ============================================================

#include "crypto.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace prompt {

constexpr int MAX_NEW_PASSWORD_ATTEMPTS = 3;

// Read one line from `in` with terminal echo disabled. Throws InputError on EOF.
crypto::Password read_password(const std::string& label,
                               std::istream& in, std::ostream& out);

// Ask twice; require >= 8 characters and a match. Throws InputError after
// max_attempts failed tries.
crypto::Password read_new_password(std::istream& in, std::ostream& out,
                                   int max_attempts = MAX_NEW_PASSWORD_ATTEMPTS);

// Ask a yes/no question; anything but y/yes is "no"
bool confirm(const std::string& question, std::istream& in, std::ostream& out);

} // namespace prompt
