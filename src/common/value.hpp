#pragma once

// ---------------------------------------------------------------------------
// value.hpp
//
// 툴 인자/툴 결과를 표현하는 동적 값 타입 (JSON 호환 tagged variant).
//
// [설계 원칙]
// - 닫힌 타입 집합: null / bool / integer / double / string / array / object.
//   ConstraintMatcher 는 kind() 로 분기하며 모든 kind 를 명시적으로 처리한다.
// - Object 는 std::map (키 정렬) 이므로 직렬화 결과와 키 순회 순서가
//   입력 순서와 무관하게 결정적이다.
// - 비교(operator==)는 엄격 비교: 타입이 다르면 항상 false.
//   (1 != 1.0 != true != "1")
// ---------------------------------------------------------------------------

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// ValueKind
// ---------------------------------------------------------------------------
enum class ValueKind : std::uint8_t {
    kNull    = 0,
    kBool    = 1,
    kInteger = 2,
    kDouble  = 3,
    kString  = 4,
    kArray   = 5,
    kObject  = 6,
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------
class Value {
public:
    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    // bool 을 제외한 모든 정수형은 int64 로 저장한다.
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) : data_(static_cast<std::int64_t>(v)) {}

    [[nodiscard]] ValueKind kind() const noexcept {
        return static_cast<ValueKind>(data_.index());
    }

    [[nodiscard]] bool is_null()    const noexcept { return kind() == ValueKind::kNull; }
    [[nodiscard]] bool is_bool()    const noexcept { return kind() == ValueKind::kBool; }
    [[nodiscard]] bool is_integer() const noexcept { return kind() == ValueKind::kInteger; }
    [[nodiscard]] bool is_double()  const noexcept { return kind() == ValueKind::kDouble; }
    [[nodiscard]] bool is_number()  const noexcept { return is_integer() || is_double(); }
    [[nodiscard]] bool is_string()  const noexcept { return kind() == ValueKind::kString; }
    [[nodiscard]] bool is_array()   const noexcept { return kind() == ValueKind::kArray; }
    [[nodiscard]] bool is_object()  const noexcept { return kind() == ValueKind::kObject; }

    // 타입이 맞지 않으면 std::bad_variant_access 를 던진다.
    [[nodiscard]] bool               as_bool()    const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t       as_integer() const { return std::get<std::int64_t>(data_); }
    [[nodiscard]] double             as_double()  const { return std::get<double>(data_); }
    [[nodiscard]] const std::string& as_string()  const { return std::get<std::string>(data_); }
    [[nodiscard]] const Array&       as_array()   const { return std::get<Array>(data_); }
    [[nodiscard]] const Object&      as_object()  const { return std::get<Object>(data_); }

    // as_number
    //   integer/double 을 double 로 반환. 숫자가 아니면 std::bad_variant_access.
    [[nodiscard]] double as_number() const;

    // find
    //   object 이고 key 가 있으면 해당 값의 포인터, 아니면 nullptr.
    [[nodiscard]] const Value* find(std::string_view key) const;

    // to_json
    //   compact JSON 직렬화 (공백 없음, 키 정렬, UTF-8 그대로 출력).
    [[nodiscard]] std::string to_json() const;

    // to_display_string
    //   스캐너/로그용 문자열 표현. string 은 따옴표 없이 원문을 반환하고
    //   나머지는 to_json() 과 같다.
    [[nodiscard]] std::string to_display_string() const;

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object> data_{};
};

using ValueMap = Value::Object;

// kind_to_string: 로그/오류 메시지용
[[nodiscard]] std::string_view kind_to_string(ValueKind kind) noexcept;

// escape_json_string: JSON 문자열 리터럴 내부 이스케이프 (따옴표 미포함)
[[nodiscard]] std::string escape_json_string(std::string_view str);
