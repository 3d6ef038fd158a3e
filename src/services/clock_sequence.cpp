#include "services/clock_sequence.hpp"

#include "identifier/errors.hpp"
#include "utils/logger.hpp"

namespace {
uint16_t checkedClockSequence(uint32_t value)
{
    if (value > ident::MAX_CLOCK_SEQUENCE) {
        LOG_DEBUG << "Последовательность часов вне диапазона: " << value;
        throw ident::InvalidArgument("Последовательность часов должна быть в диапазоне [0, 16383]: "
                                     + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}
} // namespace

namespace ident {
RandomClockSequenceService::RandomClockSequenceService(
    std::shared_ptr<RandomGenerator> randomGenerator)
    : randomGenerator_(std::move(randomGenerator))
{
    if (!randomGenerator_) {
        throw InvalidArgument("Не задан генератор случайных чисел");
    }
}

uint16_t RandomClockSequenceService::next()
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto sequence = static_cast<uint16_t>(randomGenerator_->uniform(MAX_CLOCK_SEQUENCE));
    while (last_.has_value() && sequence == *last_) {
        sequence = static_cast<uint16_t>(randomGenerator_->uniform(MAX_CLOCK_SEQUENCE));
    }

    last_ = sequence;
    LOG_TRACE << "Выдана последовательность часов " << sequence;
    return sequence;
}

StaticClockSequenceService::StaticClockSequenceService(uint32_t clockSequence)
    : clockSequence_(checkedClockSequence(clockSequence))
{
}

uint16_t StaticClockSequenceService::next()
{
    return clockSequence_;
}
} // namespace ident
