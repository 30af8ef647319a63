/**
 * @file UserStore.h
 * @brief Credential lookup for control sessions
 */

#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace Wharf {

/**
 * @brief One FTP account
 */
struct UserAccount {
    std::string name;
    std::string salt;                 ///< Hex salt prepended to the password
    std::string passwordSha256Hex;    ///< hex(SHA-256(salt || password))
    std::string homeDirectory;        ///< Host directory mapped to "/"
    bool canWrite{true};              ///< STOR/APPE/DELE/MKD/RMD/RNFR allowed
};

/**
 * @class CredentialStore
 * @brief Interface Session uses to check USER/PASS
 */
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    /**
     * @brief Verify a user name and password
     * @param account Receives the account on success
     * @return true if the credentials are valid
     */
    virtual bool authenticate(const std::string& user,
                              const std::string& password,
                              UserAccount& account) const = 0;
};

/**
 * @class UserStore
 * @brief In-memory account table loaded from the "users" config array
 *
 * JSON form of one entry:
 * @code
 * { "name": "alice", "home": "/srv/ftp/alice", "write": true,
 *   "salt": "9f...", "password_sha256": "3a..." }
 * @endcode
 * A plain "password" key may be given instead of salt/password_sha256;
 * it is hashed with a fresh random salt on load.
 */
class UserStore : public CredentialStore {
public:
    UserStore() = default;

    /**
     * @brief Add or replace an account whose hash is already computed
     */
    void addAccount(const UserAccount& account);

    /**
     * @brief Add or replace an account from a plain password
     * @return false if the salt could not be generated
     */
    bool addUser(const std::string& name,
                 const std::string& password,
                 const std::string& homeDirectory,
                 bool canWrite,
                 std::string& errorMsg);

    bool hasUser(const std::string& name) const;
    size_t size() const { return m_accounts.size(); }

    bool authenticate(const std::string& user,
                      const std::string& password,
                      UserAccount& account) const override;

    nlohmann::json toJson() const;

    /**
     * @brief Parse the "users" array
     * @param j JSON array of account objects
     * @param store Receives the accounts
     * @param errorMsg Output error message for the first invalid entry
     * @return false if j is not an array or an entry is invalid
     */
    static bool fromJson(const nlohmann::json& j, UserStore& store, std::string& errorMsg);

private:
    std::map<std::string, UserAccount> m_accounts;
};

}  // namespace Wharf
