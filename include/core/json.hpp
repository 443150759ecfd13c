#pragma once

#include <glaze/glaze.hpp>

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace dlpscan {

/**
 * @brief Read-only view of a parsed JSON document (glz::json_t by value)
 *
 * Member lookups on non-objects and missing members yield a null value
 * rather than throwing, so request fields can be probed freely.
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    explicit JsonValue(glz::json_t doc) : doc_(std::move(doc)) {}

    [[nodiscard]] static JsonValue parse(const std::string& text) {
        glz::json_t doc;
        if (const auto ec = glz::read_json(doc, text)) {
            throw parse_error(std::format("JSON parse error: {}", glz::format_error(ec, text)));
        }
        return JsonValue(std::move(doc));
    }

    [[nodiscard]] bool is_null() const { return doc_.is_null(); }
    [[nodiscard]] bool is_object() const { return doc_.is_object(); }
    [[nodiscard]] bool is_string() const { return doc_.is_string(); }

    [[nodiscard]] bool contains(std::string_view key) const { return member(key) != nullptr; }

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        const glz::json_t* found = member(key);
        return found ? JsonValue(*found) : JsonValue();
    }

    /**
     * @brief Unchecked extraction; the caller knows the type
     */
    template <typename T>
    [[nodiscard]] T get() const {
        static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, bool> ||
                      std::is_same_v<T, double>,
                      "JsonValue::get<T>() supports std::string, bool and double");
        return doc_.get<T>();
    }

    // Missing, null or non-string members read as nullopt
    [[nodiscard]] std::optional<std::string> string_field(std::string_view key) const {
        const glz::json_t* found = member(key);
        if (!found || !found->is_string()) return std::nullopt;
        return found->get<std::string>();
    }

    [[nodiscard]] std::string string_or(std::string_view key, std::string fallback) const {
        return string_field(key).value_or(std::move(fallback));
    }

    [[nodiscard]] const glz::json_t& raw() const { return doc_; }

private:
    const glz::json_t* member(std::string_view key) const {
        if (!doc_.is_object()) return nullptr;
        const auto& members = doc_.get_object();
        const auto it = members.find(std::string(key));
        return it == members.end() ? nullptr : &it->second;
    }

    glz::json_t doc_{};
};

} // namespace dlpscan
