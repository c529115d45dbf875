#include "Utf8Decoder.hpp"

namespace specter {
namespace {
const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// Expected sequence length for a lead byte, 0 if it can never start one.
int sequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

bool isValidContinuation(unsigned char lead, int position, unsigned char c) {
  if (position == 1) {
    // Reject overlongs, surrogates and code points above U+10FFFF.
    switch (lead) {
      case 0xE0:
        return c >= 0xA0 && c <= 0xBF;
      case 0xED:
        return c >= 0x80 && c <= 0x9F;
      case 0xF0:
        return c >= 0x90 && c <= 0xBF;
      case 0xF4:
        return c >= 0x80 && c <= 0x8F;
      default:
        break;
    }
  }
  return c >= 0x80 && c <= 0xBF;
}
}  // namespace

string Utf8Decoder::decode(const char* buf, size_t count) {
  string in;
  in.reserve(carry.size() + count);
  in.append(carry);
  in.append(buf, count);
  carry.clear();

  string out;
  out.reserve(in.size());
  size_t i = 0;
  const size_t n = in.size();
  while (i < n) {
    unsigned char lead = static_cast<unsigned char>(in[i]);
    int len = sequenceLength(lead);
    if (len == 1) {
      out.push_back(in[i]);
      i++;
      continue;
    }
    if (len == 0) {
      out.append(REPLACEMENT_CHARACTER);
      i++;
      continue;
    }

    int valid = 1;
    bool truncated = false;
    while (valid < len) {
      if (i + valid >= n) {
        truncated = true;
        break;
      }
      if (!isValidContinuation(lead, valid,
                               static_cast<unsigned char>(in[i + valid]))) {
        break;
      }
      valid++;
    }

    if (valid == len) {
      out.append(in, i, len);
      i += len;
    } else if (truncated) {
      carry = in.substr(i);
      break;
    } else {
      // The maximal valid prefix collapses into a single replacement.
      out.append(REPLACEMENT_CHARACTER);
      i += valid;
    }
  }
  return out;
}

string Utf8Decoder::finish() {
  if (carry.empty()) {
    return string();
  }
  carry.clear();
  return string(REPLACEMENT_CHARACTER);
}

string Utf8Decoder::decodeLossy(const string& s) {
  Utf8Decoder decoder;
  string out = decoder.decode(s);
  out.append(decoder.finish());
  return out;
}

bool Utf8Decoder::isValid(const string& s) { return decodeLossy(s) == s; }
}  // namespace specter
