#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Shift-JIS text as stored by the game. Only the ranges the game can produce in
// name tags, display names and connect codes are mapped: ASCII, halfwidth
// katakana, ideographic space, fullwidth alphanumerics and '#', hiragana and
// katakana. Anything else decodes to U+FFFD and encodes to '?'.
namespace slp::util {

namespace sjis_detail {

inline void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

inline uint32_t double_byte_to_codepoint(uint16_t code) {
  if (code == 0x8140) {
    return 0x3000;
  }
  if (code == 0x8194) {
    return 0xFF03;
  }
  if (code >= 0x824F && code <= 0x8258) {
    return 0xFF10 + (code - 0x824F);
  }
  if (code >= 0x8260 && code <= 0x8279) {
    return 0xFF21 + (code - 0x8260);
  }
  if (code >= 0x8281 && code <= 0x829A) {
    return 0xFF41 + (code - 0x8281);
  }
  if (code >= 0x829F && code <= 0x82F1) {
    return 0x3041 + (code - 0x829F);
  }
  if (code >= 0x8340 && code <= 0x837E) {
    return 0x30A1 + (code - 0x8340);
  }
  if (code >= 0x8380 && code <= 0x8396) {
    return 0x30E0 + (code - 0x8380);
  }
  return 0xFFFD;
}

inline uint16_t codepoint_to_double_byte(uint32_t cp) {
  if (cp == 0x3000) {
    return 0x8140;
  }
  if (cp == 0xFF03) {
    return 0x8194;
  }
  if (cp >= 0xFF10 && cp <= 0xFF19) {
    return static_cast<uint16_t>(0x824F + (cp - 0xFF10));
  }
  if (cp >= 0xFF21 && cp <= 0xFF3A) {
    return static_cast<uint16_t>(0x8260 + (cp - 0xFF21));
  }
  if (cp >= 0xFF41 && cp <= 0xFF5A) {
    return static_cast<uint16_t>(0x8281 + (cp - 0xFF41));
  }
  if (cp >= 0x3041 && cp <= 0x3093) {
    return static_cast<uint16_t>(0x829F + (cp - 0x3041));
  }
  if (cp >= 0x30A1 && cp <= 0x30DF) {
    return static_cast<uint16_t>(0x8340 + (cp - 0x30A1));
  }
  if (cp >= 0x30E0 && cp <= 0x30F6) {
    return static_cast<uint16_t>(0x8380 + (cp - 0x30E0));
  }
  return 0;
}

inline uint32_t fold_fullwidth(uint32_t cp) {
  if (cp >= 0xFF01 && cp <= 0xFF5E) {
    return cp - 0xFF01 + 0x21;
  }
  if (cp == 0x3000) {
    return 0x20;
  }
  return cp;
}

// decodes one code point; returns bytes consumed (0 on malformed input)
inline size_t next_utf8(std::string_view text, size_t pos, uint32_t& cp) {
  auto byte = [&](size_t i) { return static_cast<uint8_t>(text[i]); };
  uint8_t lead = byte(pos);
  size_t length = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 0;
  if (length == 0 || pos + length > text.size()) {
    return 0;
  }
  if (length == 1) {
    cp = lead;
    return 1;
  }
  cp = lead & (0xFF >> (length + 1));
  for (size_t i = 1; i < length; ++i) {
    if ((byte(pos + i) & 0xC0) != 0x80) {
      return 0;
    }
    cp = (cp << 6) | (byte(pos + i) & 0x3F);
  }
  return length;
}

} // namespace sjis_detail

// decodes up to the first NUL; fold maps fullwidth ASCII to plain ASCII
inline std::string decode_shift_jis(std::span<const uint8_t> bytes, bool fold = false) {
  std::string out;
  for (size_t i = 0; i < bytes.size(); ++i) {
    uint8_t b = bytes[i];
    if (b == 0) {
      break;
    }
    uint32_t cp = 0xFFFD;
    if (b < 0x80) {
      cp = b;
    } else if (b >= 0xA1 && b <= 0xDF) {
      cp = 0xFF61 + (b - 0xA1);
    } else if (((b >= 0x81 && b <= 0x9F) || (b >= 0xE0 && b <= 0xEF)) && i + 1 < bytes.size()) {
      cp = sjis_detail::double_byte_to_codepoint(static_cast<uint16_t>((b << 8) | bytes[i + 1]));
      ++i;
    }
    sjis_detail::append_utf8(out, fold ? sjis_detail::fold_fullwidth(cp) : cp);
  }
  return out;
}

// encodes into a fixed-width NUL-padded field, truncating whole characters
inline std::vector<uint8_t> encode_shift_jis(std::string_view text, size_t width) {
  std::vector<uint8_t> out;
  out.reserve(width);
  size_t pos = 0;
  while (pos < text.size()) {
    uint32_t cp = 0;
    size_t used = sjis_detail::next_utf8(text, pos, cp);
    if (used == 0) {
      cp = '?';
      used = 1;
    }
    pos += used;

    if (cp < 0x80) {
      if (out.size() + 1 > width) {
        break;
      }
      out.push_back(static_cast<uint8_t>(cp));
    } else if (cp >= 0xFF61 && cp <= 0xFF9F) {
      if (out.size() + 1 > width) {
        break;
      }
      out.push_back(static_cast<uint8_t>(0xA1 + (cp - 0xFF61)));
    } else {
      uint16_t code = sjis_detail::codepoint_to_double_byte(cp);
      if (code == 0) {
        if (out.size() + 1 > width) {
          break;
        }
        out.push_back('?');
        continue;
      }
      if (out.size() + 2 > width) {
        break;
      }
      out.push_back(static_cast<uint8_t>(code >> 8));
      out.push_back(static_cast<uint8_t>(code & 0xFF));
    }
  }
  out.resize(width, 0);
  return out;
}

} // namespace slp::util
