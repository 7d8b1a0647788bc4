#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace multiquery {

/// Key schema for the embedded store.
///
///   obj:<bucket>:<key>                      -> JSON document
///   2i:<bucket>:<index>:<value>\0<key>      -> (empty)
///   2imeta:<bucket>:<key>                   -> JSON list of index entries of the object
///
/// Bucket, index name and key are percent-encoded (':', '%', '\0'), so the
/// separators never occur inside a component. Index values are terminated by
/// '\0', which sorts below every byte of an encoded value; a scan over the
/// value part is ordered exactly like the raw values.
class KeySchema {
public:
    enum class KeyType : uint8_t {
        OBJECT,
        INDEX_ENTRY,
        INDEX_META,
        UNKNOWN
    };

    static std::string makeObjectKey(std::string_view bucket, std::string_view key);
    static std::string makeObjectPrefix(std::string_view bucket);

    static std::string makeIndexMetaKey(std::string_view bucket, std::string_view key);

    /// Full index entry key for one (value, object key) pair
    static std::string makeIndexEntryKey(std::string_view bucket, std::string_view index,
                                         std::string_view encodedValue, std::string_view key);
    /// Prefix covering all entries of one index
    static std::string makeIndexPrefix(std::string_view bucket, std::string_view index);
    /// Prefix covering all entries with exactly this value
    static std::string makeIndexValuePrefix(std::string_view bucket, std::string_view index,
                                            std::string_view encodedValue);
    /// Exclusive upper bound directly above all entries with this value
    static std::string makeIndexValueUpperBound(std::string_view bucket, std::string_view index,
                                                std::string_view encodedValue);

    /// Order-preserving encoding of a signed integer (sign bit flipped, 16 hex digits)
    static std::string encodeIntValue(int64_t value);
    static std::string encodeBinValue(std::string_view value);

    static KeyType parseKeyType(std::string_view key);

    /// Object key of an obj: or 2i: key (decoded); nullopt for anything else
    static std::optional<std::string> extractObjectKey(std::string_view key);

    static std::string encodeComponent(std::string_view raw);
    static std::string decodeComponent(std::string_view encoded);

private:
    static constexpr char SEPARATOR = ':';
    static constexpr char VALUE_TERMINATOR = '\0';
};

} // namespace multiquery
