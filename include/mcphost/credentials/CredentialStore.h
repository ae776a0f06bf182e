//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialStore.h
// Purpose: Per-instance secret storage with owner-only file permissions
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

//==========================================================================================================
// OAuthTokenRecord
// Purpose: Delegated-authorization token pair persisted for one instance.
// Notes:
//   expiresAt is unix seconds; a record without it never expires.
//==========================================================================================================
struct OAuthTokenRecord {
    std::string accessToken;
    std::string tokenType{"Bearer"};
    std::optional<std::string> refreshToken;
    std::optional<int64_t> expiresAt;
    std::optional<std::string> scope;
    std::optional<std::string> identity;

    bool IsExpired(std::chrono::system_clock::time_point now,
                   std::chrono::seconds skew = std::chrono::seconds(0)) const;
};

//==========================================================================================================
// CredentialStore
// Purpose: Sole writer of secret material. Layout under the root directory:
//            <root>/<instanceId>/env_<NAME>.secret   one file per secret variable
//            <root>/<instanceId>/oauth_token.json    OAuth token record
//          Directories are created 0700, files 0600, written to a temp file and renamed into place.
// Notes:
//   All failures throw CredentialError. Messages name the instance and variable, never the value.
//==========================================================================================================
class CredentialStore {
public:
    explicit CredentialStore(std::string rootDir);

    // $MCPHOST_SECRETS_DIR, else $XDG_CONFIG_HOME/mcphost/secrets, else ~/.config/mcphost/secrets
    static std::string DefaultRoot();

    const std::string& Root() const { return root_; }

    void Store(const std::string& instanceId, const std::string& name, const std::string& secret);
    std::string Load(const std::string& instanceId, const std::string& name) const;
    void Delete(const std::string& instanceId, const std::string& name);
    bool Exists(const std::string& instanceId, const std::string& name) const;
    std::vector<std::string> ListNames(const std::string& instanceId) const;

    // Removes every secret and the OAuth token of an instance.
    void PurgeInstance(const std::string& instanceId);

    void StoreOAuthToken(const std::string& instanceId, const OAuthTokenRecord& record);
    std::optional<OAuthTokenRecord> LoadOAuthToken(const std::string& instanceId) const;
    void DeleteOAuthToken(const std::string& instanceId);

    //======================================================================================================
    // ReadKeyFile
    // Purpose: Reads a user-supplied key file and trims surrounding whitespace.
    // Throws:
    //   CredentialError NotFound / PermissionDenied / Io mapped from errno.
    //======================================================================================================
    static std::string ReadKeyFile(const std::string& path);

    // Trims and strips internal CR/LF characters.
    static std::string Sanitize(const std::string& secret);

    // [A-Za-z0-9._-]+ and not "." or ".."
    static bool IsValidComponent(const std::string& s);

private:
    std::string instanceDir(const std::string& instanceId) const;
    std::string secretPath(const std::string& instanceId, const std::string& name) const;
    void writeFileAtomic(const std::string& dir, const std::string& path, const std::string& content);

    std::string root_;
    mutable std::mutex mutex_;
};

} // namespace mcphost
