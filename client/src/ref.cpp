/*
 * 설명: UUID 형식의 무작위 ref 토큰을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/ref_test.cpp
 */
#include "phoenix/ref.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace phoenix {
namespace {
std::string BytesToUuid(const std::array<unsigned char, 16>& data) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::mt19937_64& Generator() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}
}  // namespace

std::string GenerateUuid() {
  std::array<unsigned char, 16> buffer{};
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto& b : buffer) {
    b = static_cast<unsigned char>(dist(Generator()));
  }
  // RFC 4122 version 4, variant 1
  buffer[6] = static_cast<unsigned char>((buffer[6] & 0x0F) | 0x40);
  buffer[8] = static_cast<unsigned char>((buffer[8] & 0x3F) | 0x80);
  return BytesToUuid(buffer);
}

Ref::Ref(std::string value, std::string prefix) : prefix_(std::move(prefix)), value_(std::move(value)) {}

Ref Ref::Generate(const std::string& prefix) { return Ref(GenerateUuid(), prefix); }

bool Ref::HasPrefix(std::string_view prefix) const {
  auto full = ToString();
  return full.size() >= prefix.size() && full.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace phoenix
