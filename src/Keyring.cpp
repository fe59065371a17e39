/**
 * Keyring.cpp - Credential storage in the desktop secret service (libsecret)
 */

#include "hermes/Keyring.hpp"

#include <libsecret/secret.h>

namespace hermes {

namespace {

const SecretSchema HERMES_SCHEMA = {
    "io.hermes.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"type", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

} // anonymous namespace

std::string getFromKeyring(const std::string& type) {
    GError* error = nullptr;
    gchar* value = secret_password_lookup_sync(
        &HERMES_SCHEMA,
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        g_error_free(error);
        return "";
    }

    if (value == nullptr) {
        return "";
    }

    std::string result(value);
    secret_password_free(value);
    return result;
}

bool storeInKeyring(const std::string& type, const std::string& value,
                    const std::string& label, std::string& error_message) {
    GError* error = nullptr;
    gboolean success = secret_password_store_sync(
        &HERMES_SCHEMA,
        SECRET_COLLECTION_DEFAULT,
        label.c_str(),
        value.c_str(),
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        error_message = error->message;
        g_error_free(error);
        return false;
    }

    return success == TRUE;
}

} // namespace hermes
