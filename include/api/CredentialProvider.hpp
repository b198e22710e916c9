#pragma once

#include "models/Config.hpp"

namespace QobuzDL {

/**
 * Source of the (appId, secrets) pair
 * The real provider scrapes the web player bundle; the engine only consumes the result.
 * Secrets are opaque and tried in the order given.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    virtual AppCredentials getCredentials() = 0;
};

/**
 * Serves the credentials stored in the configuration
 */
class ConfigCredentialProvider : public CredentialProvider {
public:
    explicit ConfigCredentialProvider(AppCredentials credentials);
    AppCredentials getCredentials() override;
    
private:
    AppCredentials credentials;
};

} // namespace QobuzDL
