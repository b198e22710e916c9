#include "api/Session.hpp"

namespace QobuzDL {

Session::Session(AppCredentials credentials)
    : credentials(std::move(credentials))
    , closed(false) {
}

Session::~Session() {
    close();
}

std::optional<std::string> Session::getValidatedSecret() const {
    std::lock_guard<std::mutex> lock(mutex);
    return validatedSecret;
}

void Session::setValidatedSecret(const std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex);
    // At most one secret per session
    if (!validatedSecret) {
        validatedSecret = secret;
    }
}

std::optional<std::string> Session::getUserAuthToken() const {
    std::lock_guard<std::mutex> lock(mutex);
    return userAuthToken;
}

void Session::setUserAuthToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex);
    userAuthToken = token;
}

bool Session::isAuthenticated() const {
    std::lock_guard<std::mutex> lock(mutex);
    return userAuthToken.has_value() && !userAuthToken->empty();
}

void Session::close() {
    std::lock_guard<std::mutex> lock(mutex);
    userAuthToken.reset();
    closed = true;
}

bool Session::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

} // namespace QobuzDL
