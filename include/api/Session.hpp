#pragma once

#include "models/Config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <mutex>

namespace QobuzDL {

/**
 * Authentication state for one run
 * Created once before the first API call and closed explicitly at the end
 */
class Session {
public:
    explicit Session(AppCredentials credentials);
    ~Session();
    
    // Prevent copying
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    
    const std::string& getAppId() const { return credentials.appId; }
    const std::vector<std::string>& getSecrets() const { return credentials.secrets; }
    
    std::optional<std::string> getValidatedSecret() const;
    void setValidatedSecret(const std::string& secret);
    
    std::optional<std::string> getUserAuthToken() const;
    void setUserAuthToken(const std::string& token);
    bool isAuthenticated() const;
    
    // Forget tokens; further API calls fail
    void close();
    bool isClosed() const;
    
private:
    const AppCredentials credentials;
    std::optional<std::string> validatedSecret;
    std::optional<std::string> userAuthToken;
    bool closed;
    mutable std::mutex mutex;
};

} // namespace QobuzDL
