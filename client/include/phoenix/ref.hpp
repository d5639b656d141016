/*
 * 설명: 요청/응답 상관관계에 쓰이는 ref 토큰과 생성기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/ref_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace phoenix {

// 하트비트처럼 내부에서 만든 push를 구분하는 접두사.
constexpr std::string_view kHeartbeatRefPrefix = "hb-";

std::string GenerateUuid();

class Ref {
 public:
  Ref() = default;
  explicit Ref(std::string value, std::string prefix = {});

  static Ref Generate(const std::string& prefix = {});

  const std::string& Prefix() const { return prefix_; }
  const std::string& Value() const { return value_; }
  std::string ToString() const { return prefix_ + value_; }
  bool Empty() const { return prefix_.empty() && value_.empty(); }
  bool HasPrefix(std::string_view prefix) const;

  friend bool operator==(const Ref& lhs, const Ref& rhs) { return lhs.ToString() == rhs.ToString(); }
  friend bool operator!=(const Ref& lhs, const Ref& rhs) { return !(lhs == rhs); }

 private:
  std::string prefix_;
  std::string value_;
};

}  // namespace phoenix
