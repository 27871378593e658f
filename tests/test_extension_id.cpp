#include "test_helpers.hpp"

#include <random>

#include "errors.hpp"
#include "extension_id.hpp"

using namespace testing_support;

int main()
{
    quietLogs();

    // Test 1: Known Chrome ids
    check(ExtensionIdValidator::validate("cjpalhdlnbpafiamejdnhcphjbkeiagm", Platform::Chrome),
          "real chrome id accepted");
    check(ExtensionIdValidator::validate("0123456789abcdefghijklmnopqrstuv", Platform::Chrome),
          "digits and letters accepted");
    check(!ExtensionIdValidator::validate("cjpalhdlnbpafiamejdnhcphjbkeiag", Platform::Chrome),
          "31 characters rejected");
    check(!ExtensionIdValidator::validate("cjpalhdlnbpafiamejdnhcphjbkeiagmm", Platform::Chrome),
          "33 characters rejected");
    check(!ExtensionIdValidator::validate("CJPALHDLNBPAFIAMEJDNHCPHJBKEIAGM", Platform::Chrome),
          "uppercase rejected");
    check(!ExtensionIdValidator::validate("", Platform::Chrome), "empty chrome id rejected");

    // Test 2: Generated ids: every 32-char [a-z0-9] string passes, every mutation fails
    {
        const std::string alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
        const std::string outsiders = "ABCXYZ-_.@ {}!";
        std::mt19937 gen(20240607);
        std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
        std::uniform_int_distribution<size_t> position(0, 31);
        std::uniform_int_distribution<size_t> pickOutsider(0, outsiders.size() - 1);

        bool allAccepted = true;
        bool allMutantsRejected = true;
        for (int i = 0; i < 500; ++i)
        {
            std::string id;
            for (int c = 0; c < 32; ++c)
            {
                id += alphabet[pick(gen)];
            }
            allAccepted = allAccepted && ExtensionIdValidator::validate(id, Platform::Chrome);

            std::string shorter = id.substr(0, 31);
            std::string longer = id + alphabet[pick(gen)];
            std::string wrongChar = id;
            wrongChar[position(gen)] = outsiders[pickOutsider(gen)];

            allMutantsRejected = allMutantsRejected &&
                                 !ExtensionIdValidator::validate(shorter, Platform::Chrome) &&
                                 !ExtensionIdValidator::validate(longer, Platform::Chrome) &&
                                 !ExtensionIdValidator::validate(wrongChar, Platform::Chrome);
        }
        check(allAccepted, "500 generated chrome ids accepted");
        check(allMutantsRejected, "length and character mutations rejected");
    }

    // Test 3: Firefox GUIDs
    check(ExtensionIdValidator::validate("{ec8030f7-c20a-464f-9b0e-13a3a9e97384}", Platform::Firefox),
          "lowercase braced GUID accepted");
    check(!ExtensionIdValidator::validate("{EC8030F7-C20A-464F-9B0E-13A3A9E97384}", Platform::Firefox),
          "uppercase GUID rejected");
    check(!ExtensionIdValidator::validate("{ec8030f7-c20a-464f-9b0e-13a3a9e9738}", Platform::Firefox),
          "short GUID group rejected");

    // Test 4: Firefox slugs
    check(ExtensionIdValidator::validate("ublock-origin", Platform::Firefox), "slug with hyphen accepted");
    check(ExtensionIdValidator::validate("uBlock0@raymondhill.net", Platform::Firefox), "addon email id accepted");
    check(ExtensionIdValidator::validate("a", Platform::Firefox), "single character slug accepted");
    check(ExtensionIdValidator::validate("my_addon.v2", Platform::Firefox), "underscore and dot accepted");
    check(!ExtensionIdValidator::validate("-leading", Platform::Firefox), "leading hyphen rejected");
    check(!ExtensionIdValidator::validate("trailing.", Platform::Firefox), "trailing dot rejected");
    check(!ExtensionIdValidator::validate("has space", Platform::Firefox), "space rejected");
    check(!ExtensionIdValidator::validate("", Platform::Firefox), "empty firefox id rejected");
    check(!ExtensionIdValidator::validate("ublock-origin", Platform::Chrome), "slug is not a chrome id");

    // Test 5: require() carries the user-facing message
    checkThrows<InvalidIdentifierError>(
        []() { ExtensionIdValidator::require("not-valid", Platform::Chrome); },
        "require throws for bad chrome id",
        [](const InvalidIdentifierError &e) {
            return contains(e.what(), "Invalid chrome extension ID format for not-valid.") &&
                   contains(e.what(), "Must be 32 alphanumeric characters.");
        });
    checkThrows<InvalidIdentifierError>(
        []() { ExtensionIdValidator::require("bad id", Platform::Firefox); },
        "require throws for bad firefox id",
        [](const InvalidIdentifierError &e) { return contains(e.what(), "GUID"); });

    return finish();
}
