#include "storage/key_schema.h"

#include <cstdio>

namespace multiquery {

namespace {

constexpr std::string_view kObjectTag = "obj";
constexpr std::string_view kIndexTag = "2i";
constexpr std::string_view kIndexMetaTag = "2imeta";

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string KeySchema::encodeComponent(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c == SEPARATOR || c == '%' || c == 0) {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string KeySchema::decodeComponent(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int hi = hexDigit(encoded[i + 1]);
            int lo = hexDigit(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(encoded[i]);
    }
    return out;
}

std::string KeySchema::makeObjectPrefix(std::string_view bucket) {
    std::string key(kObjectTag);
    key += SEPARATOR;
    key += encodeComponent(bucket);
    key += SEPARATOR;
    return key;
}

std::string KeySchema::makeObjectKey(std::string_view bucket, std::string_view key) {
    return makeObjectPrefix(bucket) + encodeComponent(key);
}

std::string KeySchema::makeIndexMetaKey(std::string_view bucket, std::string_view key) {
    std::string out(kIndexMetaTag);
    out += SEPARATOR;
    out += encodeComponent(bucket);
    out += SEPARATOR;
    out += encodeComponent(key);
    return out;
}

std::string KeySchema::makeIndexPrefix(std::string_view bucket, std::string_view index) {
    std::string out(kIndexTag);
    out += SEPARATOR;
    out += encodeComponent(bucket);
    out += SEPARATOR;
    out += encodeComponent(index);
    out += SEPARATOR;
    return out;
}

std::string KeySchema::makeIndexValuePrefix(std::string_view bucket, std::string_view index,
                                            std::string_view encodedValue) {
    std::string out = makeIndexPrefix(bucket, index);
    out += encodedValue;
    out += VALUE_TERMINATOR;
    return out;
}

std::string KeySchema::makeIndexValueUpperBound(std::string_view bucket, std::string_view index,
                                                std::string_view encodedValue) {
    std::string out = makeIndexPrefix(bucket, index);
    out += encodedValue;
    out += static_cast<char>(VALUE_TERMINATOR + 1);
    return out;
}

std::string KeySchema::makeIndexEntryKey(std::string_view bucket, std::string_view index,
                                         std::string_view encodedValue, std::string_view key) {
    return makeIndexValuePrefix(bucket, index, encodedValue) + encodeComponent(key);
}

std::string KeySchema::encodeIntValue(int64_t value) {
    uint64_t bits = static_cast<uint64_t>(value) ^ (uint64_t(1) << 63);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llX", static_cast<unsigned long long>(bits));
    return std::string(buf, 16);
}

std::string KeySchema::encodeBinValue(std::string_view value) {
    // Order-preserving escape: 0x00 -> 01 01, 0x01 -> 01 02, everything else verbatim.
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (c <= 0x01) {
            out.push_back('\x01');
            out.push_back(static_cast<char>(c + 1));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

KeySchema::KeyType KeySchema::parseKeyType(std::string_view key) {
    // 2imeta: vor 2i: prüfen (gemeinsamer Präfix)
    if (startsWith(key, std::string(kIndexMetaTag) + SEPARATOR)) return KeyType::INDEX_META;
    if (startsWith(key, std::string(kIndexTag) + SEPARATOR)) return KeyType::INDEX_ENTRY;
    if (startsWith(key, std::string(kObjectTag) + SEPARATOR)) return KeyType::OBJECT;
    return KeyType::UNKNOWN;
}

std::optional<std::string> KeySchema::extractObjectKey(std::string_view key) {
    switch (parseKeyType(key)) {
        case KeyType::OBJECT: {
            size_t pos = key.rfind(SEPARATOR);
            if (pos == std::string_view::npos) return std::nullopt;
            return decodeComponent(key.substr(pos + 1));
        }
        case KeyType::INDEX_ENTRY: {
            size_t pos = key.rfind(VALUE_TERMINATOR);
            if (pos == std::string_view::npos) return std::nullopt;
            return decodeComponent(key.substr(pos + 1));
        }
        default:
            return std::nullopt;
    }
}

} // namespace multiquery
