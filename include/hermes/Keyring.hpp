/**
 * Keyring.hpp - Credential storage in the desktop secret service (libsecret)
 */

#pragma once

#include <string>

namespace hermes {

// Returns "" when the entry is missing or the secret service is unavailable.
std::string getFromKeyring(const std::string& type);

bool storeInKeyring(const std::string& type, const std::string& value,
                    const std::string& label, std::string& error);

} // namespace hermes
