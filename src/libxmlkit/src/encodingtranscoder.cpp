#include "xmlkit/encodingtranscoder.hpp"

#include <libxml/encoding.h>
#include <libxml/xmlversion.h>

#ifdef LIBXML_ICONV_ENABLED
#include <iconv.h>

#include <cerrno>
#endif

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>

#include "xmlkit/compositelogger.hpp"
#include "xmlkit/xmlexception.hpp"

namespace xmlkit {

namespace {

enum class Direction { FromUtf8, ToUtf8 };

struct HandlerCloser {
  void operator()(xmlCharEncodingHandlerPtr handler) const {
    if (handler) xmlCharEncCloseFunc(handler);
  }
};

using HandlerPtr = std::unique_ptr<xmlCharEncodingHandler, HandlerCloser>;

HandlerPtr openHandler(const std::string& encoding) {
  HandlerPtr handler(xmlFindCharEncodingHandler(encoding.c_str()));
  if (!handler) {
    throw XmlException("Unsupported character encoding: " + encoding);
  }
  return handler;
}

/**
 * Один шаг преобразования с семантикой функций xmlCharEncodingInputFunc и
 * xmlCharEncodingOutputFunc: на выходе inlen и outlen содержат количество
 * прочитанных и записанных байт. Возвращает -2 на непредставимом или
 * некорректном символе, -1 при прочих ошибках, иначе неотрицательное число.
 */
int step(xmlCharEncodingHandlerPtr handler, Direction direction,
         unsigned char* out, int* outlen, const unsigned char* in,
         int* inlen) {
  xmlCharEncodingInputFunc func =
      direction == Direction::FromUtf8 ? handler->output : handler->input;
  if (func) {
    return func(out, outlen, in, inlen);
  }

#ifdef LIBXML_ICONV_ENABLED
  iconv_t cd =
      direction == Direction::FromUtf8 ? handler->iconv_out : handler->iconv_in;
  if (cd != nullptr && cd != reinterpret_cast<iconv_t>(-1)) {
    std::size_t inLeft = static_cast<std::size_t>(*inlen);
    std::size_t outLeft = static_cast<std::size_t>(*outlen);
    char* inPtr = reinterpret_cast<char*>(const_cast<unsigned char*>(in));
    char* outPtr = reinterpret_cast<char*>(out);
    const std::size_t rc = iconv(cd, &inPtr, &inLeft, &outPtr, &outLeft);
    *inlen -= static_cast<int>(inLeft);
    *outlen -= static_cast<int>(outLeft);
    if (rc == static_cast<std::size_t>(-1)) {
      if (errno == EILSEQ) return -2;
      if (errno == E2BIG || errno == EINVAL) return 0;
      return -1;
    }
    return 0;
  }
#endif

  *inlen = 0;
  *outlen = 0;
  return -1;
}

/// Длина символа UTF-8 по ведущему байту.
std::size_t utf8Length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

std::string transcode(const std::string& input, const std::string& encoding,
                      Direction direction) {
  HandlerPtr handler = openHandler(encoding);
  if (!handler->input && !handler->output
#ifdef LIBXML_ICONV_ENABLED
      && !handler->iconv_in && !handler->iconv_out
#endif
  ) {
    throw XmlException("Unsupported character encoding: " + encoding);
  }

  std::string result;
  result.reserve(input.size() + input.size() / 2);

  const auto* data = reinterpret_cast<const unsigned char*>(input.data());
  const std::size_t total = input.size();
  std::size_t pos = 0;
  std::size_t substituted = 0;
  unsigned char buffer[4096];

  while (pos < total) {
    int inlen = static_cast<int>(std::min<std::size_t>(total - pos, 1 << 20));
    int outlen = static_cast<int>(sizeof(buffer));
    const int rc = step(handler.get(), direction, buffer, &outlen, data + pos,
                        &inlen);

    if (outlen > 0) {
      result.append(reinterpret_cast<const char*>(buffer),
                    static_cast<std::size_t>(outlen));
    }
    if (inlen > 0) {
      pos += static_cast<std::size_t>(inlen);
    }

    // Нет продвижения или символ не представим: заменяем и пропускаем его.
    if (rc == -2 || rc == -3 || (inlen <= 0 && outlen <= 0)) {
      if (pos >= total) break;
      const std::size_t skip = direction == Direction::FromUtf8
                                   ? utf8Length(data[pos])
                                   : std::size_t{1};
      pos = std::min(total, pos + skip);
      result += EncodingTranscoder::kSubstitute;
      ++substituted;
    }
  }

  if (substituted > 0) {
    CompositeLogger::instance().warning(
        "EncodingTranscoder: " + std::to_string(substituted) +
        " character(s) could not be converted " +
        (direction == Direction::FromUtf8 ? "to " : "from ") + encoding +
        " and were replaced with '" + EncodingTranscoder::kSubstitute + "'");
  }
  return result;
}

}  // namespace

std::string EncodingTranscoder::normalizeName(const std::string& encoding) {
  std::string upper = encoding;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "UTF8") return "UTF-8";
  return upper;
}

bool EncodingTranscoder::isUtf8(const std::string& encoding) {
  return normalizeName(encoding) == "UTF-8";
}

std::string EncodingTranscoder::fromUtf8(const std::string& input,
                                         const std::string& encoding) {
  if (input.empty() || isUtf8(encoding)) return input;
  return transcode(input, encoding, Direction::FromUtf8);
}

std::string EncodingTranscoder::toUtf8(const std::string& input,
                                       const std::string& encoding) {
  if (input.empty() || isUtf8(encoding)) return input;
  return transcode(input, encoding, Direction::ToUtf8);
}

std::string EncodingTranscoder::convert(const std::string& input,
                                        const std::string& from,
                                        const std::string& to) {
  const std::string source = normalizeName(from);
  const std::string target = normalizeName(to);
  if (source == target) return input;
  if (source == "UTF-8") return fromUtf8(input, target);
  if (target == "UTF-8") return toUtf8(input, source);
  return fromUtf8(toUtf8(input, source), target);
}

std::string EncodingTranscoder::prepareForLoad(
    const std::string& source, const std::string& workingEncoding) {
  static const std::regex declarationRegex(
      R"re(<\?xml\s+version="([^"]+)"\s+encoding="([^"]+)"\?>)re");

  const std::string working = normalizeName(workingEncoding);
  std::string prepared = source;
  std::string encoding = working;

  std::smatch match;
  if (std::regex_search(source, match, declarationRegex)) {
    encoding = normalizeName(match[2].str());

    if (encoding == "UTF-8" && working != "UTF-8") {
      CompositeLogger::instance().debug(
          "EncodingTranscoder: converting source from UTF-8 to " + working);
      const std::string declaration = "<?xml version=\"" + match[1].str() +
                                      "\" encoding=\"" + working + "\"?>";
      prepared = match.prefix().str() + declaration + match.suffix().str();
      prepared = fromUtf8(prepared, working);
      encoding = working;
    }
  }

  if (prepared.compare(0, 5, "<?xml") != 0) {
    prepared =
        "<?xml version=\"1.0\" encoding=\"" + encoding + "\"?>\n" + prepared;
  }

  return prepared;
}

}  // namespace xmlkit
