/**
 * @file configloader.hpp
 * @brief Загрузчик конфигурации из JSON-файлов.
 *
 * @details
 * Читает файл целиком и разбирает его с помощью nlohmann/json, сохраняя
 * порядок ключей (он важен для таблицы замен сообщений валидатора).
 * Ошибки ввода-вывода и синтаксиса JSON сообщаются через
 * std::runtime_error.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace xmlkit {

/**
 * @class ConfigLoader
 * @brief Загрузчик конфигурации из JSON-файла.
 *
 * @note Класс не является потокобезопасным.
 *
 * @code
 ConfigLoader loader;
 auto config = loader.loadFromFile("xmlkit.json");
 std::string encoding = config["document"]["encoding"];
 @endcode
 */
class ConfigLoader {
 public:
  ConfigLoader() = default;
  ~ConfigLoader() = default;

  /**
   * @brief Загружает конфигурацию из файла.
   *
   * @param[in] filename Путь к JSON-файлу (относительный или абсолютный)
   * @return Разобранная конфигурация
   *
   * @throw std::invalid_argument если filename пустой
   * @throw std::runtime_error при ошибке открытия файла или синтаксиса JSON
   */
  nlohmann::ordered_json loadFromFile(const std::string &filename);

  /// Путь к последнему загруженному файлу или пустая строка.
  std::string getLastLoadedFile() const;

  bool hasLoadedFile() const;

 private:
  nlohmann::ordered_json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile;
};

}  // namespace xmlkit
