#pragma once

#include <string>

#include "config.hpp"

/**
 * Syntax checks for extension identifiers. Pure, no I/O.
 *
 * Chrome: 32 characters from [a-z0-9].
 * Firefox: a lowercase braced GUID ({8-4-4-4-12 hex}) or a slug that starts
 * and ends alphanumeric with [A-Za-z0-9_.@-] in between.
 */
class ExtensionIdValidator
{
public:
    static bool validate(const std::string &id, Platform platform);

    /**
     * Hint appended to "invalid identifier" messages.
     */
    static std::string describeFormat(Platform platform);

    /**
     * Throws InvalidIdentifierError with the full user-facing message
     * if the identifier doesn't validate.
     */
    static void require(const std::string &id, Platform platform);
};
