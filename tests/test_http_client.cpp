#include "test_helpers.hpp"

#include "http_client.hpp"

using namespace testing_support;

int main()
{
    // Test 1: Which curl failures are worth retrying
    check(HttpClient::isPermanentError(CURLE_PEER_FAILED_VERIFICATION), "rejected server certificate is permanent");
    check(HttpClient::isPermanentError(CURLE_SSL_CERTPROBLEM), "client certificate problem is permanent");
    check(HttpClient::isPermanentError(CURLE_URL_MALFORMAT), "malformed URL is permanent");
    check(HttpClient::isPermanentError(CURLE_TOO_MANY_REDIRECTS), "redirect loop is permanent");
    check(!HttpClient::isPermanentError(CURLE_OPERATION_TIMEDOUT), "timeout is retried");
    check(!HttpClient::isPermanentError(CURLE_COULDNT_CONNECT), "refused connection is retried");
    check(!HttpClient::isPermanentError(CURLE_SSL_CONNECT_ERROR), "unclassified codes are retried");

    // Test 2: URL escaping
    check(HttpClient::escape("ublock-origin") == "ublock-origin", "unreserved characters kept");
    check(HttpClient::escape("{a b}&") == "%7Ba%20b%7D%26", "reserved characters encoded");

    // Test 3: Status text
    check(HttpClient::statusText(404) == "Not Found", "404 text");
    check(HttpClient::statusText(429) == "Too Many Requests", "429 text");
    check(HttpClient::statusText(599) == "Unknown Status", "unlisted status");

    return finish();
}
