#pragma once
#include <cstddef>
#include <string>

namespace FindProcess {

// Decodifica un nome a larghezza fissa (UTF-16, terminato da 0) in UTF-8.
// Si ferma al primo 0 entro "capacity"; quello che segue nel buffer è ignorato.
// Surrogati spaiati -> U+FFFD.
std::string DecodeExeName(const char16_t* buf, size_t capacity);

// Lowercase per code point su stringa UTF-8: "Notepad.EXE" -> "notepad.exe", "Ärger.EXE" -> "ärger.exe".
// Byte UTF-8 non validi restano invariati.
std::string ToLowerName(const std::string& s);

} // namespace FindProcess
