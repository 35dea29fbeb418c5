/**
 * @file encodingtranscoder.hpp
 * @brief Перекодирование между UTF-8 и рабочей кодировкой документа.
 *
 * @details
 * libxml2 хранит дерево в UTF-8, а канонизация (C14N) всегда выдаёт UTF-8.
 * Документы же передаются в однобайтовой кодировке (по умолчанию
 * ISO-8859-1). Преобразование выполняется обработчиками кодировок libxml2
 * (xmlFindCharEncodingHandler); для кодировок, которые libxml2 поддерживает
 * через iconv, используется дескриптор iconv самого обработчика.
 *
 * Непредставимые символы заменяются на '?', о чём пишется предупреждение
 * в журнал.
 */

#pragma once

#include <string>

namespace xmlkit {

class EncodingTranscoder {
 public:
  /// Символ, которым заменяются непредставимые в целевой кодировке символы.
  static constexpr char kSubstitute = '?';

  /**
   * @brief Перекодирует строку из кодировки @p from в кодировку @p to.
   * @throw XmlException если одна из кодировок неизвестна libxml2
   */
  static std::string convert(const std::string& input, const std::string& from,
                             const std::string& to);

  /// UTF-8 -> @p encoding.
  static std::string fromUtf8(const std::string& input,
                              const std::string& encoding);

  /// @p encoding -> UTF-8.
  static std::string toUtf8(const std::string& input,
                            const std::string& encoding);

  /// Имя кодировки в верхнем регистре ("utf8" и "UTF8" дают "UTF-8").
  static std::string normalizeName(const std::string& encoding);

  static bool isUtf8(const std::string& encoding);

  /**
   * @brief Готовит текст XML к разбору в документе с рабочей кодировкой
   * @p workingEncoding.
   *
   * @details
   * - если объявление XML указывает UTF-8, а рабочая кодировка другая, текст
   *   перекодируется и объявление переписывается на рабочую кодировку;
   * - если текст не начинается с "<?xml", добавляется объявление
   *   `<?xml version="1.0" encoding="..."?>` с обнаруженной кодировкой
   *   (или рабочей, если объявления не было) и перевод строки.
   */
  static std::string prepareForLoad(const std::string& source,
                                    const std::string& workingEncoding);
};

}  // namespace xmlkit
