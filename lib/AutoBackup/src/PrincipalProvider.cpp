#include "AutoBackup/PrincipalProvider.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace
{
constexpr std::size_t PasswordBufferSize = 16384;
}

unsigned int PrincipalProvider::CurrentUserId() const
{
    return static_cast<unsigned int>(geteuid());
}

std::optional<unsigned int> ResolveUserId(const std::string& user)
{
    if (true == user.empty())
    {
        return std::nullopt;
    }

    bool numeric = true;
    for (const char character : user)
    {
        if (0 == std::isdigit(static_cast<unsigned char>(character)))
        {
            numeric = false;
            break;
        }
    }
    if (true == numeric)
    {
        unsigned long long userId = 0;
        try
        {
            userId = std::stoull(user);
        }
        catch (const std::out_of_range&)
        {
            return std::nullopt;
        }
        // (uid_t)-1 is reserved as "no user" by chown and setreuid.
        if (static_cast<unsigned long long>(std::numeric_limits<uid_t>::max()) <= userId)
        {
            return std::nullopt;
        }
        return static_cast<unsigned int>(userId);
    }

    passwd entry{};
    passwd* found = nullptr;
    std::vector<char> buffer(PasswordBufferSize);
    if ((0 != getpwnam_r(user.c_str(), &entry, buffer.data(), buffer.size(), &found)) || (nullptr == found))
    {
        return std::nullopt;
    }
    return static_cast<unsigned int>(found->pw_uid);
}
