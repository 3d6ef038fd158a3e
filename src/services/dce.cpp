#include "services/dce.hpp"

#if defined(IDENT_PLATFORM_UNIX)
#include <sys/types.h>
#include <unistd.h>
#endif

#include "identifier/errors.hpp"
#include "utils/logger.hpp"

namespace ident {
SystemDceService::SystemDceService(std::optional<uint32_t> orgId)
    : orgId_(orgId)
{
}

uint32_t SystemDceService::userId()
{
#if defined(IDENT_PLATFORM_UNIX)
    return static_cast<uint32_t>(::getuid());
#else
    LOG_DEBUG << "UID недоступен на текущей платформе";
    throw DceIdentifierNotFound("Не удалось получить идентификатор пользователя");
#endif
}

uint32_t SystemDceService::groupId()
{
#if defined(IDENT_PLATFORM_UNIX)
    return static_cast<uint32_t>(::getgid());
#else
    LOG_DEBUG << "GID недоступен на текущей платформе";
    throw DceIdentifierNotFound("Не удалось получить идентификатор группы");
#endif
}

uint32_t SystemDceService::orgId()
{
    if (!orgId_.has_value()) {
        throw DceIdentifierNotFound("Идентификатор организации не задан");
    }
    return *orgId_;
}

StaticDceService::StaticDceService(uint32_t userId, uint32_t groupId, uint32_t orgId)
    : userId_(userId)
    , groupId_(groupId)
    , orgId_(orgId)
{
}

uint32_t StaticDceService::userId()
{
    return userId_;
}

uint32_t StaticDceService::groupId()
{
    return groupId_;
}

uint32_t StaticDceService::orgId()
{
    return orgId_;
}
} // namespace ident
