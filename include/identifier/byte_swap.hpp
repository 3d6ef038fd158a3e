#pragma once

#include "identifier/layout.hpp"

namespace ident {
/**
 * @brief Перевод канонических (RFC) байт в раскладку Microsoft GUID
 *
 * Первые три поля (4, 2 и 2 байта) записываются в обратном порядке байт,
 * последние 8 байт не изменяются. Преобразование является инволюцией:
 * toRfcLayout(toVendorLayout(b)) == b для любых 16 байт.
 *
 * @param rfcBytes Байты в порядке RFC
 * @return Байты в смешанном порядке Microsoft
 */
Bytes toVendorLayout(const Bytes &rfcBytes);

/**
 * @brief Обратное преобразование из раскладки Microsoft GUID в порядок RFC
 * @param vendorBytes Байты в смешанном порядке Microsoft
 * @return Канонические байты
 */
Bytes toRfcLayout(const Bytes &vendorBytes);
} // namespace ident
