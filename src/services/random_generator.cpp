#include "services/random_generator.hpp"

#include <algorithm>
#include <exception>
#include <limits>

#include "identifier/errors.hpp"
#include "utils/logger.hpp"

namespace {
uint64_t seedFromRandomDevice()
{
    try {
        std::random_device device;
        return (static_cast<uint64_t>(device()) << 32) | device();
    }
    catch (const std::exception &e) {
        LOG_ERROR << "std::random_device недоступен: " << e.what();
        throw ident::RandomSourceNotFound("Не найден подходящий источник случайности");
    }
}
} // namespace

namespace ident {
Bytes RandomGenerator::randomBytes()
{
    const auto random = bytes(BYTES_LENGTH);
    if (random.size() != BYTES_LENGTH) {
        throw RandomSourceNotFound("Источник случайности вернул " + std::to_string(random.size())
                                   + " байт вместо 16");
    }

    Bytes result{};
    std::copy(random.begin(), random.end(), result.begin());
    return result;
}

uint64_t RandomGenerator::uniform(uint64_t max)
{
    const auto draw = [this]() {
        const auto random = bytes(sizeof(uint64_t));
        uint64_t value = 0;
        for (const auto byte : random) {
            value = (value << 8) | byte;
        }
        return value;
    };

    if (max == std::numeric_limits<uint64_t>::max()) {
        return draw();
    }

    // Отбрасываем значения из неполного последнего интервала, чтобы не было смещения
    const auto range = max + 1;
    const auto threshold = (0 - range) % range;
    auto value = draw();
    while (value < threshold) {
        value = draw();
    }
    return value % range;
}

MersenneRandomGenerator::MersenneRandomGenerator()
    : rng_(seedFromRandomDevice())
{
}

MersenneRandomGenerator::MersenneRandomGenerator(uint64_t seed)
    : rng_(seed)
{
}

std::vector<uint8_t> MersenneRandomGenerator::bytes(size_t count)
{
    std::vector<uint8_t> result;
    result.reserve(count);

    std::lock_guard<std::mutex> lock(mutex_);
    while (result.size() < count) {
        auto random = rng_();
        for (size_t i = 0; i < sizeof(random) && result.size() < count; i++) {
            result.push_back(static_cast<uint8_t>(random & 0xFF));
            random >>= 8;
        }
    }
    return result;
}
} // namespace ident
