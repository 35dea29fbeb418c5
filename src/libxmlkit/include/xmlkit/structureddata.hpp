/**
 * @file structureddata.hpp
 * @brief Представление вложенных данных, которые кодируются в XML и обратно.
 *
 * @details
 * Используется nlohmann::ordered_json, сохраняющий порядок ключей:
 * - строка, число, true: скалярное значение узла;
 * - объект: набор дочерних узлов; ключи "@attributes" и "@value"
 *   зарезервированы для атрибутов и текста самого узла;
 * - массив: повторяющиеся одноимённые узлы одного уровня.
 *
 * Значения null, false, пустой массив и пустой объект означают, что узел
 * не создаётся.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace xmlkit {

using Data = nlohmann::ordered_json;

/// Ключ с атрибутами узла.
inline constexpr const char* kAttributesKey = "@attributes";
/// Ключ с текстовым содержимым узла, у которого есть атрибуты.
inline constexpr const char* kValueKey = "@value";

/**
 * @brief Проверяет, должен ли узел (или атрибут) с таким значением быть
 * пропущен при генерации XML.
 */
bool isSkipValue(const Data& value);

/// true для строк, чисел и логических значений.
bool isScalarValue(const Data& value);

/**
 * @brief Строковое представление скалярного значения.
 *
 * @details
 * Строки возвращаются как есть, числа в формате JSON, true даёт пустую
 * строку (пустой узел).
 */
std::string scalarToString(const Data& value);

}  // namespace xmlkit
