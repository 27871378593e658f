#include "extension_id.hpp"
#include "errors.hpp"

#include <regex>

#include <fmt/core.h>

namespace
{
const std::regex &chromePattern()
{
    static const std::regex pattern("^[a-z0-9]{32}$");
    return pattern;
}

const std::regex &guidPattern()
{
    static const std::regex pattern(
        "^\\{[a-f0-9]{8}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{12}\\}$");
    return pattern;
}

const std::regex &slugPattern()
{
    static const std::regex pattern("^[a-zA-Z0-9][a-zA-Z0-9_.@-]*[a-zA-Z0-9]$|^[a-zA-Z0-9]$");
    return pattern;
}
} // namespace

bool ExtensionIdValidator::validate(const std::string &id, Platform platform)
{
    switch (platform)
    {
    case Platform::Chrome:
        return std::regex_match(id, chromePattern());
    case Platform::Firefox:
        return std::regex_match(id, guidPattern()) || std::regex_match(id, slugPattern());
    }
    return false;
}

std::string ExtensionIdValidator::describeFormat(Platform platform)
{
    if (platform == Platform::Chrome)
    {
        return "Must be 32 alphanumeric characters.";
    }
    return "Must be a GUID (e.g., {uuid}) or slug (alphanumeric with hyphens/underscores).";
}

void ExtensionIdValidator::require(const std::string &id, Platform platform)
{
    if (!validate(id, platform))
    {
        throw InvalidIdentifierError(fmt::format("Invalid {} extension ID format for {}. {}",
                                                 platformName(platform), id, describeFormat(platform)));
    }
}
