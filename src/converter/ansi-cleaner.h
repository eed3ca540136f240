#pragma once

#include <string>

// Removes ANSI CSI and OSC sequences (introduced by ESC or the C1 CSI
// character) from text. Unrelated to marker codes. Malformed escapes are
// left in place.
std::string clean_ansi(std::string text);
