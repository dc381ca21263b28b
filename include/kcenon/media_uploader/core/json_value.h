/**
 * @file json_value.h
 * @brief Minimal JSON document model with canonical serialization
 *
 * Request parameters are built as json_value trees and serialized with
 * sorted object keys and no insignificant whitespace, so that identical
 * parameter trees always produce identical bytes for signing.
 */

#ifndef KCENON_MEDIA_UPLOADER_CORE_JSON_VALUE_H
#define KCENON_MEDIA_UPLOADER_CORE_JSON_VALUE_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kcenon::media_uploader {

/**
 * @brief JSON value type
 */
enum class json_type {
    null,
    boolean,
    integer,
    number,
    string,
    array,
    object
};

/**
 * @brief A JSON value (null, boolean, integer, number, string, array, object)
 *
 * @code
 * json_value params = json_value::make_object();
 * params["template_id"] = "abc";
 * params["steps"]["resize"]["width"] = 320;
 * auto text = params.dump();  // {"steps":{"resize":{"width":320}},"template_id":"abc"}
 * @endcode
 */
class json_value {
public:
    using array_type = std::vector<json_value>;
    using object_type = std::map<std::string, json_value>;

    json_value() = default;
    json_value(std::nullptr_t) {}
    json_value(bool value) : type_(json_type::boolean), bool_(value) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    json_value(T value) : type_(json_type::integer), int_(static_cast<int64_t>(value)) {}

    json_value(double value) : type_(json_type::number), number_(value) {}
    json_value(const char* value) : type_(json_type::string), string_(value) {}
    json_value(std::string value) : type_(json_type::string), string_(std::move(value)) {}
    json_value(array_type value) : type_(json_type::array), array_(std::move(value)) {}
    json_value(object_type value) : type_(json_type::object), object_(std::move(value)) {}

    [[nodiscard]] static auto make_object() -> json_value { return json_value(object_type{}); }
    [[nodiscard]] static auto make_array() -> json_value { return json_value(array_type{}); }

    [[nodiscard]] auto type() const noexcept -> json_type { return type_; }
    [[nodiscard]] auto is_null() const noexcept -> bool { return type_ == json_type::null; }
    [[nodiscard]] auto is_object() const noexcept -> bool { return type_ == json_type::object; }
    [[nodiscard]] auto is_array() const noexcept -> bool { return type_ == json_type::array; }
    [[nodiscard]] auto is_string() const noexcept -> bool { return type_ == json_type::string; }

    [[nodiscard]] auto as_bool() const noexcept -> bool { return bool_; }
    [[nodiscard]] auto as_integer() const noexcept -> int64_t { return int_; }
    [[nodiscard]] auto as_number() const noexcept -> double {
        return type_ == json_type::integer ? static_cast<double>(int_) : number_;
    }
    [[nodiscard]] auto as_string() const noexcept -> const std::string& { return string_; }
    [[nodiscard]] auto as_array() const noexcept -> const array_type& { return array_; }
    [[nodiscard]] auto as_object() const noexcept -> const object_type& { return object_; }

    /**
     * @brief Access an object member, creating it if missing
     *
     * A null value is promoted to an empty object first.
     */
    auto operator[](const std::string& key) -> json_value&;

    /**
     * @brief Append to an array, promoting null to an empty array
     */
    void push_back(json_value value);

    [[nodiscard]] auto contains(const std::string& key) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    /**
     * @brief Object union; members of @p other replace members of this value
     */
    [[nodiscard]] auto merged(const json_value& other) const -> json_value;

    /**
     * @brief Canonical serialization (sorted keys, compact)
     */
    [[nodiscard]] auto dump() const -> std::string;

    [[nodiscard]] auto operator==(const json_value& other) const -> bool;

private:
    void dump_to(std::string& out) const;

    json_type type_ = json_type::null;
    bool bool_ = false;
    int64_t int_ = 0;
    double number_ = 0.0;
    std::string string_;
    array_type array_;
    object_type object_;
};

/**
 * @brief Escape a string for inclusion in a JSON document (without quotes)
 */
[[nodiscard]] auto escape_json(const std::string& input) -> std::string;

}  // namespace kcenon::media_uploader

#endif  // KCENON_MEDIA_UPLOADER_CORE_JSON_VALUE_H
