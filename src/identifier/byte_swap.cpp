#include "identifier/byte_swap.hpp"

#include <algorithm>
#include <utility>

namespace {
/**
 * Поля GUID, хранящиеся little-endian: Data1 (uint32), Data2 (uint16), Data3 (uint16).
 * Data4 (8 байт) хранится как есть.
 */
constexpr std::array<std::pair<size_t, size_t>, 3> LITTLE_ENDIAN_FIELDS = { {
    { 0, 4 },
    { 4, 6 },
    { 6, 8 },
} };

ident::Bytes swapLeadingFields(const ident::Bytes &input)
{
    auto output = input;
    for (const auto &[begin, end] : LITTLE_ENDIAN_FIELDS) {
        std::reverse(output.begin() + begin, output.begin() + end);
    }
    return output;
}
} // namespace

namespace ident {
Bytes toVendorLayout(const Bytes &rfcBytes)
{
    return swapLeadingFields(rfcBytes);
}

Bytes toRfcLayout(const Bytes &vendorBytes)
{
    return swapLeadingFields(vendorBytes);
}
} // namespace ident
