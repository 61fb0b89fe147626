#include "qr_code.hpp"

#ifdef LAPORT_HAVE_QRENCODE
#include <qrencode.h>

#include <memory>
#endif

std::optional<std::string> render_qr_code(const std::string& text) {
#ifdef LAPORT_HAVE_QRENCODE
  // case-insensitive input is upper-cased by the encoder, which keeps a URL in
  // the denser alphanumeric mode; service paths match case-insensitively
  std::unique_ptr<QRcode, decltype(&QRcode_free)> code(
    QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_L, QR_MODE_8, 0), &QRcode_free);
  if(!code) return std::nullopt;

  const int width = code->width;
  const int size = width + 2;
  auto dark = [&](int x, int y) {
    x -= 1;
    y -= 1;
    if(x < 0 || y < 0 || x >= width || y >= width) return false;
    return (code->data[y * width + x] & 1) != 0;
  };

  std::string out;
  for(int y = 0; y < size; y += 2) {
    for(int x = 0; x < size; ++x) {
      bool top = !dark(x, y);
      bool bottom = y + 1 < size && !dark(x, y + 1);
      if(top && bottom) out += "█";
      else if(top) out += "▀";
      else if(bottom) out += "▄";
      else out += ' ';
    }
    out += '\n';
  }
  return out;
#else
  (void)text;
  return std::nullopt;
#endif
}
