// ============================================================
// password_prompt.cpp -- Interactive password entry without echo
// ============================================================

#include "password_prompt.hpp"
#include "errors.hpp"
#include "platform.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>

crypto::Password prompt::read_password(const std::string& label,
                                       std::istream& in, std::ostream& out) {
    out << label << std::flush;
    std::string line;
    bool got = false;
    {
        platform::EchoGuard guard;
        got = (bool)std::getline(in, line);
        if (guard.active()) out << "\n";
    }
    if (!got) {
        throw InputError("No password entered");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return crypto::Password(std::move(line));
}

crypto::Password prompt::read_new_password(std::istream& in, std::ostream& out, int max_attempts) {
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        crypto::Password first = read_password("Enter password: ", in, out);
        try {
            crypto::validate_new_password(first);
        } catch (const InputError& e) {
            out << e.what() << "\n";
            continue;
        }
        crypto::Password second = read_password("Confirm password: ", in, out);
        if (first.str() != second.str()) {
            out << "Passwords do not match\n";
            continue;
        }
        return first;
    }
    throw InputError("No valid password after " + std::to_string(max_attempts) + " attempts");
}

bool prompt::confirm(const std::string& question, std::istream& in, std::ostream& out) {
    out << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) return false;
    answer = utils::trim(answer);
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return answer == "y" || answer == "yes";
}
