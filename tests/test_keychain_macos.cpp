#include <gtest/gtest.h>
#include <platform/keychain_store_macos.hpp>
#include <platform/local_auth_macos.hpp>
#include <Security/Security.h>

TEST(KeychainReadQuery, CarriesAuthenticationContext) {
    StorageAddress address{"credguard-biometric-token", "api-token"};
    UiPrompt prompt{"Access your API credentials", "Not now"};

    CFMutableDictionaryRef query = keychain_read_query(address, prompt);
    ASSERT_NE(query, nullptr);

    const void* context = CFDictionaryGetValue(query, kSecUseAuthenticationContext);
    EXPECT_NE(context, nullptr);
    EXPECT_FALSE(CFDictionaryContainsKey(query, kSecUseOperationPrompt));
    EXPECT_EQ(CFDictionaryGetValue(query, kSecReturnData), kCFBooleanTrue);

    CFRelease(query);
}

TEST(KeychainReadQuery, AuthContextCreated) {
    UiPrompt prompt{"Access your API credentials", "Not now"};
    CFTypeRef context = create_auth_context(prompt);
    ASSERT_NE(context, nullptr);
    CFRelease(context);
}
