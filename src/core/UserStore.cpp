/**
 * @file UserStore.cpp
 * @brief Credential lookup for control sessions
 */

#include "wharf/UserStore.h"
#include "wharf/HashUtils.h"

#include <utility>

namespace Wharf {

namespace {

constexpr size_t SALT_BYTES = 16;

}  // namespace

void UserStore::addAccount(const UserAccount& account) {
    m_accounts[account.name] = account;
}

bool UserStore::addUser(const std::string& name,
                        const std::string& password,
                        const std::string& homeDirectory,
                        bool canWrite,
                        std::string& errorMsg)
{
    UserAccount account;
    account.name = name;
    account.homeDirectory = homeDirectory;
    account.canWrite = canWrite;

    if (!HashUtils::generateSalt(SALT_BYTES, account.salt, errorMsg)) {
        return false;
    }
    account.passwordSha256Hex = HashUtils::hashPassword(account.salt, password);

    m_accounts[name] = std::move(account);
    return true;
}

bool UserStore::hasUser(const std::string& name) const {
    return m_accounts.find(name) != m_accounts.end();
}

bool UserStore::authenticate(const std::string& user,
                             const std::string& password,
                             UserAccount& account) const
{
    auto it = m_accounts.find(user);
    if (it == m_accounts.end()) {
        // Hash anyway so unknown users cost the same as a wrong password.
        HashUtils::hashPassword(std::string(), password);
        return false;
    }

    if (!HashUtils::verifyPassword(it->second.salt, password, it->second.passwordSha256Hex)) {
        return false;
    }

    account = it->second;
    return true;
}

nlohmann::json UserStore::toJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& pair : m_accounts) {
        const auto& account = pair.second;

        nlohmann::json entry;
        entry["name"] = account.name;
        entry["salt"] = account.salt;
        entry["password_sha256"] = account.passwordSha256Hex;
        entry["home"] = account.homeDirectory;
        entry["write"] = account.canWrite;
        out.push_back(std::move(entry));
    }
    return out;
}

bool UserStore::fromJson(const nlohmann::json& j, UserStore& store, std::string& errorMsg) {
    if (!j.is_array()) {
        errorMsg = "\"users\" must be an array";
        return false;
    }

    for (const auto& obj : j) {
        if (!obj.is_object()) {
            errorMsg = "user entry must be an object";
            return false;
        }
        if (!obj.contains("name") || !obj["name"].is_string() || obj["name"].get<std::string>().empty()) {
            errorMsg = "user entry is missing \"name\"";
            return false;
        }
        const std::string name = obj["name"].get<std::string>();

        if (!obj.contains("home") || !obj["home"].is_string()) {
            errorMsg = "user \"" + name + "\" is missing \"home\"";
            return false;
        }
        const std::string home = obj["home"].get<std::string>();

        bool canWrite = true;
        if (obj.contains("write") && obj["write"].is_boolean()) {
            canWrite = obj["write"].get<bool>();
        }

        if (obj.contains("password_sha256") && obj["password_sha256"].is_string()) {
            UserAccount account;
            account.name = name;
            account.homeDirectory = home;
            account.canWrite = canWrite;
            account.passwordSha256Hex = obj["password_sha256"].get<std::string>();
            if (obj.contains("salt") && obj["salt"].is_string()) {
                account.salt = obj["salt"].get<std::string>();
            }

            unsigned char check[HASH_SIZE];
            if (!HashUtils::stringToHash(account.passwordSha256Hex, check)) {
                errorMsg = "user \"" + name + "\" has an invalid password_sha256";
                return false;
            }
            store.addAccount(account);
        } else if (obj.contains("password") && obj["password"].is_string()) {
            if (!store.addUser(name, obj["password"].get<std::string>(), home, canWrite, errorMsg)) {
                return false;
            }
        } else {
            errorMsg = "user \"" + name + "\" has no password";
            return false;
        }
    }

    return true;
}

}  // namespace Wharf
