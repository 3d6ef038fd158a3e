#pragma once

#include <cstdint>
#include <optional>

namespace ident {
/**
 * @class DceService
 * @brief Источник локальных идентификаторов для UUID версии 2 (DCE Security)
 */
class DceService {
public:
    virtual ~DceService() = default;

    /**
     * @throw DceIdentifierNotFound, если идентификатор недоступен
     */
    virtual uint32_t userId() = 0;
    virtual uint32_t groupId() = 0;
    virtual uint32_t orgId() = 0;
};

/**
 * @class SystemDceService
 * @brief UID и GID текущего процесса, идентификатор организации задаётся явно
 *
 * На платформах без POSIX-идентификаторов userId() и groupId() бросают
 * DceIdentifierNotFound.
 */
class SystemDceService : public DceService {
public:
    explicit SystemDceService(std::optional<uint32_t> orgId = std::nullopt);

    uint32_t userId() override;
    uint32_t groupId() override;

    /**
     * @throw DceIdentifierNotFound, если идентификатор организации не задан
     */
    uint32_t orgId() override;

private:
    const std::optional<uint32_t> orgId_;
};

/**
 * @class StaticDceService
 * @brief Заранее заданные локальные идентификаторы
 */
class StaticDceService : public DceService {
public:
    StaticDceService(uint32_t userId, uint32_t groupId, uint32_t orgId);

    uint32_t userId() override;
    uint32_t groupId() override;
    uint32_t orgId() override;

private:
    const uint32_t userId_;
    const uint32_t groupId_;
    const uint32_t orgId_;
};
} // namespace ident
