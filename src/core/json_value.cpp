/**
 * @file json_value.cpp
 * @brief Minimal JSON document model with canonical serialization
 */

#include "kcenon/media_uploader/core/json_value.h"

#include <cmath>
#include <cstdio>

namespace kcenon::media_uploader {

auto escape_json(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto json_value::operator[](const std::string& key) -> json_value& {
    if (type_ != json_type::object) {
        *this = make_object();
    }
    return object_[key];
}

void json_value::push_back(json_value value) {
    if (type_ != json_type::array) {
        *this = make_array();
    }
    array_.push_back(std::move(value));
}

auto json_value::contains(const std::string& key) const -> bool {
    return type_ == json_type::object && object_.find(key) != object_.end();
}

auto json_value::size() const noexcept -> std::size_t {
    switch (type_) {
        case json_type::array: return array_.size();
        case json_type::object: return object_.size();
        case json_type::null: return 0;
        default: return 1;
    }
}

auto json_value::merged(const json_value& other) const -> json_value {
    json_value out = is_object() ? *this : make_object();
    if (other.is_object()) {
        for (const auto& [key, value] : other.object_) {
            out.object_[key] = value;
        }
    }
    return out;
}

auto json_value::dump() const -> std::string {
    std::string out;
    dump_to(out);
    return out;
}

void json_value::dump_to(std::string& out) const {
    switch (type_) {
        case json_type::null:
            out += "null";
            break;
        case json_type::boolean:
            out += bool_ ? "true" : "false";
            break;
        case json_type::integer:
            out += std::to_string(int_);
            break;
        case json_type::number: {
            if (!std::isfinite(number_)) {
                out += "null";
                break;
            }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", number_);
            out += buf;
            break;
        }
        case json_type::string:
            out += '"';
            out += escape_json(string_);
            out += '"';
            break;
        case json_type::array: {
            out += '[';
            bool first = true;
            for (const auto& item : array_) {
                if (!first) out += ',';
                item.dump_to(out);
                first = false;
            }
            out += ']';
            break;
        }
        case json_type::object: {
            out += '{';
            bool first = true;
            for (const auto& [key, value] : object_) {
                if (!first) out += ',';
                out += '"';
                out += escape_json(key);
                out += "\":";
                value.dump_to(out);
                first = false;
            }
            out += '}';
            break;
        }
    }
}

auto json_value::operator==(const json_value& other) const -> bool {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case json_type::null: return true;
        case json_type::boolean: return bool_ == other.bool_;
        case json_type::integer: return int_ == other.int_;
        case json_type::number: return number_ == other.number_;
        case json_type::string: return string_ == other.string_;
        case json_type::array: return array_ == other.array_;
        case json_type::object: return object_ == other.object_;
    }
    return false;
}

}  // namespace kcenon::media_uploader
