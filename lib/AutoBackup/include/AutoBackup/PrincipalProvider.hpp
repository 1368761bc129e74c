#pragma once

#include <optional>
#include <string>

/**
 * @brief Reports the identity the current process runs as.
 */
class PrincipalProvider
{
  public:
    virtual ~PrincipalProvider() = default;

    /**
     * @brief Effective user id of the current process.
     */
    virtual unsigned int CurrentUserId() const;
};

/**
 * @brief Resolve a user given as numeric uid or as account name.
 *
 * @param[in] user Numeric uid or user name
 * @return Resolved uid, std::nullopt if the account does not exist or the number is not a valid uid
 */
std::optional<unsigned int> ResolveUserId(const std::string& user);
