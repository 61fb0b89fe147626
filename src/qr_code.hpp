#pragma once

#include <optional>
#include <string>

// Terminal rendering of `text` as a QR code, two module rows per line with a
// one-module quiet zone. Light modules are drawn, so it reads on dark
// terminals. nullopt when encoding fails or laport was built without
// libqrencode.
std::optional<std::string> render_qr_code(const std::string& text);
