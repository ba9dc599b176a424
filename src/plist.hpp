#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct PlistEntry;

// A decoded property list value, from an XML or a binary ("bplist00") document. Dates are
// kept as their text (ISO 8601 for binary documents); data holds the decoded bytes.
class PlistValue {
public:
    enum class Type {
        STRING,
        INTEGER,
        REAL,
        BOOLEAN,
        DATE,
        DATA,
        ARRAY,
        DICT
    };

    // Parses a complete XML or binary property list and returns its root value.
    // Throws PlistError if the document is not a well-formed property list.
    static PlistValue parse(std::string_view xml);

    PlistValue() = default;

    Type type() const { return type_; }
    bool is_dict() const { return type_ == Type::DICT; }
    bool is_array() const { return type_ == Type::ARRAY; }

    // Typed accessors throw PlistError on a type mismatch.
    const std::string& as_string() const;
    std::int64_t as_integer() const;
    double as_real() const;
    bool as_bool() const;
    const std::vector<PlistValue>& as_array() const;
    const std::vector<PlistEntry>& entries() const;

    // Dictionary lookup. Returns nullptr when the key is absent.
    const PlistValue* find(std::string_view key) const;

    // Convenience getters for dictionaries: absent keys yield the fallback.
    std::string string_at(std::string_view key, const std::string& fallback = "") const;
    std::int64_t integer_at(std::string_view key, std::int64_t fallback = 0) const;
    bool bool_at(std::string_view key, bool fallback = false) const;
    std::vector<std::string> string_list_at(std::string_view key) const;

private:
    friend class PlistParser;
    friend class BinaryPlistParser;

    Type type_ = Type::STRING;
    std::string text_;
    std::int64_t integer_ = 0;
    double real_ = 0.0;
    bool boolean_ = false;
    std::vector<PlistValue> array_;
    std::vector<PlistEntry> dict_;
};

struct PlistEntry {
    std::string key;
    PlistValue value;
};
