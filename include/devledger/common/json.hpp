#pragma once

#include <sstream>
#include <string>

namespace devledger {

    /// Quote and escape a string for JSON output
    inline std::string jsonString(const std::string &value) {
        std::ostringstream oss;
        oss << '"';
        for (char c : value) {
            switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char *hex = "0123456789abcdef";
                    oss << "\\u00" << hex[(c >> 4) & 0x0F] << hex[c & 0x0F];
                } else {
                    oss << c;
                }
            }
        }
        oss << '"';
        return oss.str();
    }

} // namespace devledger
