#pragma once

// ---------------------------------------------------------------------------
// validator.hpp
//
// 인자 구조/크기 검사. 정책 규칙 평가(authorize) 이전에 실행된다.
//
// [검사 순서]
// 0. tool_name 이 비어 있으면 차단
// 1. max_arg_bytes  : compact JSON 직렬화 바이트 수 > max_arg_bytes 이면 차단
// 2. reject_unknown_args : 어떤 인자 키도 tool 이 일치하는 allow 규칙의
//    constraints 에 선언되지 않았으면 차단 (역할은 보지 않는다)
//
// 큰 payload 는 키 검사나 공격 탐지 스캐너에 도달하지 않는다.
// ---------------------------------------------------------------------------

#include <set>
#include <string>

#include "common/types.hpp"
#include "policy/rule.hpp"

class Validator {
public:
    Validator() = delete;

    // validate
    //   통과 시 allowed=true, 실패 시 첫 번째 위반 사유로 allowed=false.
    //   layer 는 항상 kValidate.
    [[nodiscard]] static Decision validate(const ToolCall& call, const Policy& policy);

    // known_arguments
    //   tool_name 과 일치하는 모든 allow 규칙의 constraint 키 합집합.
    [[nodiscard]] static std::set<std::string> known_arguments(const Policy&      policy,
                                                               const std::string& tool_name);

    // serialized_size: arguments 의 compact JSON UTF-8 바이트 수
    [[nodiscard]] static std::size_t serialized_size(const ValueMap& arguments);
};
