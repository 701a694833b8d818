#include "pnp/component_key.h"

namespace pnpc {

using namespace std;

string resolve_key(const string& ref, PosFormat fmt,
                   const string& package, const string& value,
                   const BomMap* bom) noexcept {
  if (bom) {
    auto fitr = bom->find(ref);
    if (fitr != bom->end())
      return fitr->second;
  }

  if (fmt != PosFormat::KicadPos)
    return ref;

  return str::sTrim(str::concat(package, " ", value));
}

static void erase_all(string& s, CStr what) noexcept {
  size_t len = ::strlen(what);
  size_t pos = s.find(what);
  while (pos != string::npos) {
    s.erase(pos, len);
    pos = s.find(what, pos);
  }
}

string sanitize_explanation(const string& text) noexcept {
  string s = text;
  erase_all(s, "\xEF\xBC\x82");  // U+FF02 fullwidth quotation mark
  erase_all(s, "\xEF\xBC\x88");  // U+FF08 fullwidth left parenthesis
  erase_all(s, "\xEF\xBC\x89");  // U+FF09 fullwidth right parenthesis
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](char c) { return c == '"' || c == '(' || c == ')'; }),
          s.end());
  return str::sTrim(s);
}

}  // NS pnpc
