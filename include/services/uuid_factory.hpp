#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "identifier/uuid.hpp"
#include "services/clock.hpp"
#include "services/clock_sequence.hpp"
#include "services/dce.hpp"
#include "services/node.hpp"
#include "services/random_generator.hpp"

namespace ident {
/**
 * @struct FactoryServices
 * @brief Внешние источники данных, которые использует фабрика
 *
 * Пустые указатели заменяются реализациями по умолчанию: системные часы,
 * MersenneRandomGenerator, случайная последовательность часов, MAC-адрес
 * системы со случайным узлом в качестве запасного варианта и системные UID/GID.
 */
struct FactoryServices {
    std::shared_ptr<ClockService> clock;
    std::shared_ptr<RandomGenerator> randomGenerator;
    std::shared_ptr<ClockSequenceService> clockSequence;
    std::shared_ptr<NodeService> node;
    std::shared_ptr<DceService> dce;
};

/**
 * @class UuidFactory
 * @brief Генерирует новые UUID и создаёт значения из готовых представлений
 *
 * Фабрика может использоваться из нескольких потоков одновременно, если это
 * допускают переданные ей сервисы (все реализации по умолчанию допускают).
 */
class UuidFactory {
public:
    UuidFactory();
    explicit UuidFactory(FactoryServices services);

    /**
     * @brief UUID версии 1 (григорианское время)
     * @param node 48-битный идентификатор узла, по умолчанию - из NodeService
     * @param dateTime Момент времени, по умолчанию - из ClockService
     * @param clockSequence 14-битная последовательность часов, по умолчанию - из ClockSequenceService
     * @throw InvalidArgument, если значение вне допустимого диапазона
     * @throw NodeNotFound, RandomSourceNotFound при отказе сервисов
     */
    Uuid createV1(std::optional<uint64_t> node = std::nullopt,
                  std::optional<DateTime> dateTime = std::nullopt,
                  std::optional<uint32_t> clockSequence = std::nullopt);

    /**
     * @brief UUID версии 2 (DCE Security)
     *
     * Если локальный идентификатор не указан, он запрашивается у DceService для
     * указанного домена. От последовательности часов сохраняются младшие 6 бит.
     *
     * @throw DceIdentifierNotFound, если локальный идентификатор недоступен
     */
    Uuid createV2(DceDomain localDomain = DceDomain::PERSON,
                  std::optional<uint32_t> localIdentifier = std::nullopt,
                  std::optional<uint64_t> node = std::nullopt,
                  std::optional<uint32_t> clockSequence = std::nullopt,
                  std::optional<DateTime> dateTime = std::nullopt);

    // UUID версии 4 из 122 случайных бит
    Uuid createV4();

    /**
     * @brief UUID версии 6 (упорядоченное григорианское время)
     *
     * Параметры имеют тот же смысл, что и у createV1().
     */
    Uuid createV6(std::optional<uint64_t> node = std::nullopt,
                  std::optional<DateTime> dateTime = std::nullopt,
                  std::optional<uint32_t> clockSequence = std::nullopt);

    /**
     * @brief UUID версии 7 (время Unix в миллисекундах и случайные биты)
     * @throw InvalidArgument, если дата раньше 1970-01-01 или не помещается в 48 бит
     */
    Uuid createV7(std::optional<DateTime> dateTime = std::nullopt);

    /**
     * @brief UUID версии 8 из произвольных байт
     *
     * Биты версии и варианта перезаписываются, остальные сохраняются.
     */
    Uuid createV8(const Bytes &bytes);

    // Случайный Microsoft GUID варианта Microsoft
    Uuid createMicrosoftGuid();

    /**
     * @brief Microsoft GUID из UUID варианта RFC
     *
     * Биты варианта заменяются на вариант Microsoft, поэтому результат не равен
     * исходному значению.
     * @throw InvalidArgument, если исходное значение не является версионным UUID
     */
    Uuid microsoftGuidFromRfc4122(const Uuid &uuid);

    Uuid fromString(std::string_view input, Kind kind) const;
    Uuid fromHexadecimal(std::string_view input, Kind kind) const;
    Uuid fromBytes(std::string_view input, Kind kind) const;
    Uuid fromInteger(std::string_view decimal, Kind kind) const;

private:
    // Общая раскладка версий 1 и 6 собирается из одних и тех же входных данных
    struct TimeInputs {
        uint64_t ticks;
        uint16_t clockSequence;
        uint64_t node;
    };

    TimeInputs resolveTimeInputs(std::optional<uint64_t> node, std::optional<DateTime> dateTime,
                                 std::optional<uint32_t> clockSequence);

    FactoryServices services_;
};
} // namespace ident
