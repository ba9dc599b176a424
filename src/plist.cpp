#include "plist.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/evp.h>
#include <pugixml.hpp>

#include <algorithm>
#include <bit>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <format>

namespace {

constexpr std::string_view BPLIST_MAGIC = "bplist00";

} // anonymous namespace

class PlistParser {
public:
    static PlistValue parse_node(const pugi::xml_node& node) {
        PlistValue value;
        const std::string_view name = node.name();

        if (name == "dict") {
            value.type_ = PlistValue::Type::DICT;
            for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
                if (child.type() != pugi::node_element) continue;
                if (std::string_view(child.name()) != "key") {
                    throw PlistError(string_format("error.plist_expected_key", child.name()));
                }
                pugi::xml_node item = child.next_sibling();
                while (item && item.type() != pugi::node_element) item = item.next_sibling();
                if (!item) {
                    throw PlistError(string_format("error.plist_missing_value", child.child_value()));
                }
                value.dict_.push_back(PlistEntry{child.child_value(), parse_node(item)});
                child = item;
            }
        } else if (name == "array") {
            value.type_ = PlistValue::Type::ARRAY;
            for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
                if (child.type() != pugi::node_element) continue;
                value.array_.push_back(parse_node(child));
            }
        } else if (name == "string") {
            value.type_ = PlistValue::Type::STRING;
            value.text_ = node.child_value();
        } else if (name == "integer") {
            value.type_ = PlistValue::Type::INTEGER;
            value.integer_ = parse_integer(node.child_value());
        } else if (name == "real") {
            value.type_ = PlistValue::Type::REAL;
            const char* text = node.child_value();
            char* end = nullptr;
            value.real_ = std::strtod(text, &end);
            if (end == text) {
                throw PlistError(string_format("error.plist_bad_number", text));
            }
        } else if (name == "true" || name == "false") {
            value.type_ = PlistValue::Type::BOOLEAN;
            value.boolean_ = (name == "true");
        } else if (name == "date") {
            value.type_ = PlistValue::Type::DATE;
            value.text_ = node.child_value();
        } else if (name == "data") {
            value.type_ = PlistValue::Type::DATA;
            value.text_ = decode_base64(node.child_value());
        } else {
            throw PlistError(string_format("error.plist_unknown_element", std::string(name)));
        }
        return value;
    }

private:
    static std::int64_t parse_integer(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

        std::int64_t result = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
        if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
            throw PlistError(string_format("error.plist_bad_number", std::string(text)));
        }
        return result;
    }

    static std::string decode_base64(std::string_view text) {
        std::string compact;
        compact.reserve(text.size());
        for (char c : text) {
            if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
        }
        if (compact.empty()) return {};
        if (compact.size() % 4 != 0) {
            throw PlistError(get_string("error.plist_bad_data"));
        }

        std::string out(compact.size() / 4 * 3, '\0');
        int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(compact.data()),
                                static_cast<int>(compact.size()));
        if (n < 0) {
            throw PlistError(get_string("error.plist_bad_data"));
        }
        // EVP_DecodeBlock counts padding as zero bytes.
        size_t padding = 0;
        if (compact.back() == '=') ++padding;
        if (compact.size() > 1 && compact[compact.size() - 2] == '=') ++padding;
        out.resize(static_cast<size_t>(n) - padding);
        return out;
    }
};

// Reader for the binary property list format: objects addressed through an offset table,
// located by the 32-byte trailer at the end of the document.
class BinaryPlistParser {
public:
    explicit BinaryPlistParser(std::string_view data) : data_(data) {}

    PlistValue parse() {
        if (data_.size() < BPLIST_MAGIC.size() + TRAILER_SIZE) {
            throw PlistError(get_string("error.bplist_bad_trailer"));
        }
        const std::size_t trailer = data_.size() - TRAILER_SIZE;
        offset_size_ = static_cast<std::size_t>(byte_at(trailer + 6));
        ref_size_ = static_cast<std::size_t>(byte_at(trailer + 7));
        num_objects_ = read_uint(trailer + 8, 8);
        const std::uint64_t top_object = read_uint(trailer + 16, 8);
        offset_table_ = read_uint(trailer + 24, 8);

        if (offset_size_ == 0 || offset_size_ > 8 || ref_size_ == 0 || ref_size_ > 8 ||
            num_objects_ == 0 || top_object >= num_objects_ ||
            offset_table_ < BPLIST_MAGIC.size() || offset_table_ > trailer ||
            num_objects_ > (trailer - offset_table_) / offset_size_) {
            throw PlistError(get_string("error.bplist_bad_trailer"));
        }
        return parse_object(top_object, 0);
    }

private:
    static constexpr std::size_t TRAILER_SIZE = 32;
    static constexpr int MAX_DEPTH = 256;
    // Seconds between the Unix epoch and 2001-01-01T00:00:00Z, the binary date epoch.
    static constexpr std::int64_t DATE_EPOCH = 978307200;

    std::uint8_t byte_at(std::uint64_t pos) const {
        if (pos >= data_.size()) {
            throw PlistError(string_format("error.bplist_bad_offset", pos));
        }
        return static_cast<std::uint8_t>(data_[pos]);
    }

    // Big-endian unsigned integer of n bytes.
    std::uint64_t read_uint(std::uint64_t pos, std::size_t n) const {
        if (n > data_.size() || pos > data_.size() - n) {
            throw PlistError(string_format("error.bplist_bad_offset", pos));
        }
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < n; ++i) {
            value = (value << 8) | static_cast<std::uint8_t>(data_[pos + i]);
        }
        return value;
    }

    std::string_view bytes(std::uint64_t pos, std::uint64_t len) const {
        if (pos > data_.size() || len > data_.size() - pos) {
            throw PlistError(string_format("error.bplist_bad_offset", pos));
        }
        return data_.substr(pos, len);
    }

    // Object lengths below 15 live in the marker; larger ones follow as an integer object.
    std::uint64_t read_length(std::uint8_t info, std::uint64_t& pos) const {
        if (info != 0x0F) return info;
        const std::uint8_t marker = byte_at(pos);
        const std::size_t n = std::size_t{1} << (marker & 0x0F);
        if ((marker >> 4) != 0x1 || n > 8) {
            throw PlistError(string_format("error.bplist_bad_marker", static_cast<unsigned>(marker), pos));
        }
        const std::uint64_t len = read_uint(pos + 1, n);
        pos += 1 + n;
        return len;
    }

    std::uint64_t object_offset(std::uint64_t ref) const {
        if (ref >= num_objects_) {
            throw PlistError(string_format("error.bplist_bad_offset", ref));
        }
        const std::uint64_t offset = read_uint(offset_table_ + ref * offset_size_, offset_size_);
        if (offset < BPLIST_MAGIC.size() || offset >= offset_table_) {
            throw PlistError(string_format("error.bplist_bad_offset", offset));
        }
        return offset;
    }

    std::vector<std::uint64_t> read_refs(std::uint64_t pos, std::uint64_t count) const {
        if (count > (data_.size() - std::min<std::uint64_t>(pos, data_.size())) / ref_size_) {
            throw PlistError(string_format("error.bplist_bad_offset", pos));
        }
        std::vector<std::uint64_t> refs;
        refs.reserve(count);
        for (std::uint64_t i = 0; i < count; ++i) {
            refs.push_back(read_uint(pos + i * ref_size_, ref_size_));
        }
        return refs;
    }

    static double read_real(std::uint64_t bits, std::size_t n) {
        if (n == 4) {
            return std::bit_cast<float>(static_cast<std::uint32_t>(bits));
        }
        return std::bit_cast<double>(bits);
    }

    static std::string format_date(double seconds) {
        if (!std::isfinite(seconds)) {
            throw PlistError(string_format("error.plist_bad_number", std::to_string(seconds)));
        }
        const auto unix_seconds = static_cast<std::int64_t>(std::floor(seconds)) + DATE_EPOCH;
        const std::chrono::sys_seconds tp{std::chrono::seconds(unix_seconds)};
        return std::format("{:%Y-%m-%dT%H:%M:%SZ}", tp);
    }

    static void append_utf8(std::string& out, char32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    static std::string utf16be_to_utf8(std::string_view raw) {
        auto unit = [&raw](std::size_t i) {
            return static_cast<char32_t>((static_cast<std::uint8_t>(raw[i]) << 8) | static_cast<std::uint8_t>(raw[i + 1]));
        };
        std::string out;
        for (std::size_t i = 0; i + 1 < raw.size(); i += 2) {
            char32_t cp = unit(i);
            if (cp >= 0xD800 && cp <= 0xDBFF && i + 3 < raw.size()) {
                const char32_t low = unit(i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i += 2;
                }
            }
            append_utf8(out, cp);
        }
        return out;
    }

    PlistValue parse_object(std::uint64_t ref, int depth) {
        if (depth > MAX_DEPTH) {
            throw PlistError(get_string("error.bplist_too_deep"));
        }

        std::uint64_t pos = object_offset(ref);
        const std::uint8_t marker = byte_at(pos++);
        const std::uint8_t info = marker & 0x0F;

        PlistValue value;
        switch (marker >> 4) {
            case 0x0:
                if (info != 0x8 && info != 0x9) break;
                value.type_ = PlistValue::Type::BOOLEAN;
                value.boolean_ = (info == 0x9);
                return value;
            case 0x1: {
                if (info > 4) break;
                const std::size_t n = std::size_t{1} << info;
                // 16-byte integers only carry 64 significant bits.
                value.type_ = PlistValue::Type::INTEGER;
                value.integer_ = static_cast<std::int64_t>(n == 16 ? read_uint(pos + 8, 8) : read_uint(pos, n));
                return value;
            }
            case 0x2: {
                if (info != 2 && info != 3) break;
                const std::size_t n = std::size_t{1} << info;
                value.type_ = PlistValue::Type::REAL;
                value.real_ = read_real(read_uint(pos, n), n);
                return value;
            }
            case 0x3:
                if (info != 3) break;
                value.type_ = PlistValue::Type::DATE;
                value.text_ = format_date(read_real(read_uint(pos, 8), 8));
                return value;
            case 0x4: {
                const std::uint64_t len = read_length(info, pos);
                value.type_ = PlistValue::Type::DATA;
                value.text_ = std::string(bytes(pos, len));
                return value;
            }
            case 0x5: {
                const std::uint64_t len = read_length(info, pos);
                value.type_ = PlistValue::Type::STRING;
                value.text_ = std::string(bytes(pos, len));
                return value;
            }
            case 0x6: {
                const std::uint64_t len = read_length(info, pos);
                if (len > data_.size() / 2) {
                    throw PlistError(string_format("error.bplist_bad_offset", pos));
                }
                value.type_ = PlistValue::Type::STRING;
                value.text_ = utf16be_to_utf8(bytes(pos, len * 2));
                return value;
            }
            case 0xA: {
                const std::uint64_t len = read_length(info, pos);
                value.type_ = PlistValue::Type::ARRAY;
                for (std::uint64_t child : read_refs(pos, len)) {
                    value.array_.push_back(parse_object(child, depth + 1));
                }
                return value;
            }
            case 0xD: {
                const std::uint64_t len = read_length(info, pos);
                const auto keys = read_refs(pos, len);
                const auto values = read_refs(pos + len * ref_size_, len);
                value.type_ = PlistValue::Type::DICT;
                for (std::uint64_t i = 0; i < len; ++i) {
                    PlistValue key = parse_object(keys[i], depth + 1);
                    if (key.type_ != PlistValue::Type::STRING) {
                        throw PlistError(get_string("error.bplist_bad_key"));
                    }
                    value.dict_.push_back(PlistEntry{std::move(key.text_), parse_object(values[i], depth + 1)});
                }
                return value;
            }
            default:
                break;
        }
        throw PlistError(string_format("error.bplist_bad_marker", static_cast<unsigned>(marker), pos - 1));
    }

    std::string_view data_;
    std::size_t offset_size_ = 0;
    std::size_t ref_size_ = 0;
    std::uint64_t num_objects_ = 0;
    std::uint64_t offset_table_ = 0;
};

PlistValue PlistValue::parse(std::string_view xml) {
    if (xml.starts_with(BPLIST_MAGIC)) {
        return BinaryPlistParser(xml).parse();
    }

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw PlistError(string_format("error.plist_parse_failed", result.description(),
                                       static_cast<long long>(result.offset)));
    }

    pugi::xml_node plist = doc.child("plist");
    if (!plist) {
        throw PlistError(get_string("error.plist_no_root"));
    }

    for (pugi::xml_node child = plist.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_element) {
            return PlistParser::parse_node(child);
        }
    }
    throw PlistError(get_string("error.plist_no_root"));
}

namespace {

[[noreturn]] void type_mismatch(const char* wanted) {
    throw PlistError(string_format("error.plist_type_mismatch", wanted));
}

} // anonymous namespace

const std::string& PlistValue::as_string() const {
    if (type_ != Type::STRING && type_ != Type::DATE && type_ != Type::DATA) type_mismatch("string");
    return text_;
}

std::int64_t PlistValue::as_integer() const {
    if (type_ != Type::INTEGER) type_mismatch("integer");
    return integer_;
}

double PlistValue::as_real() const {
    if (type_ == Type::INTEGER) return static_cast<double>(integer_);
    if (type_ != Type::REAL) type_mismatch("real");
    return real_;
}

bool PlistValue::as_bool() const {
    if (type_ != Type::BOOLEAN) type_mismatch("bool");
    return boolean_;
}

const std::vector<PlistValue>& PlistValue::as_array() const {
    if (type_ != Type::ARRAY) type_mismatch("array");
    return array_;
}

const std::vector<PlistEntry>& PlistValue::entries() const {
    if (type_ != Type::DICT) type_mismatch("dict");
    return dict_;
}

const PlistValue* PlistValue::find(std::string_view key) const {
    for (const auto& entry : entries()) {
        if (entry.key == key) return &entry.value;
    }
    return nullptr;
}

std::string PlistValue::string_at(std::string_view key, const std::string& fallback) const {
    const PlistValue* v = find(key);
    return v ? v->as_string() : fallback;
}

std::int64_t PlistValue::integer_at(std::string_view key, std::int64_t fallback) const {
    const PlistValue* v = find(key);
    return v ? v->as_integer() : fallback;
}

bool PlistValue::bool_at(std::string_view key, bool fallback) const {
    const PlistValue* v = find(key);
    return v ? v->as_bool() : fallback;
}

std::vector<std::string> PlistValue::string_list_at(std::string_view key) const {
    std::vector<std::string> out;
    const PlistValue* v = find(key);
    if (!v) return out;
    for (const auto& item : v->as_array()) {
        out.push_back(item.as_string());
    }
    return out;
}
