#include "api/CredentialProvider.hpp"
#include "api/Errors.hpp"

namespace QobuzDL {

ConfigCredentialProvider::ConfigCredentialProvider(AppCredentials credentials)
    : credentials(std::move(credentials)) {
}

AppCredentials ConfigCredentialProvider::getCredentials() {
    if (credentials.appId.empty()) {
        throw InvalidAppIdError("No app id configured. Provision the app credentials first.");
    }
    if (credentials.secrets.empty()) {
        throw InvalidAppSecretError("No app secrets configured. Provision the app credentials first.");
    }
    return credentials;
}

} // namespace QobuzDL
