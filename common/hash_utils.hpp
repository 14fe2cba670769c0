#pragma once
#include <cctype>
#include <cstdint>
#include <string>

class HashUtils {
public:

    static std::string toHex(const unsigned char* digest, size_t len) {
        static const char* hex = "0123456789abcdef";
        std::string result;
        result.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            result += hex[(digest[i] >> 4) & 0xF];
            result += hex[digest[i] & 0xF];
        }
        return result;
    }

    // big-endian rendering, so crc32 0x3610a686 prints as "3610a686"
    static std::string toHex(uint32_t value) {
        unsigned char bytes[4] = {
            static_cast<unsigned char>(value >> 24),
            static_cast<unsigned char>(value >> 16),
            static_cast<unsigned char>(value >> 8),
            static_cast<unsigned char>(value)
        };
        return toHex(bytes, sizeof(bytes));
    }

    static std::string toLower(std::string s) {
        for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

};
