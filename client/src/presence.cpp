/*
 * 설명: presence 전체 동기화와 증분(diff) 동기화, 조회 헬퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/presence_test.cpp
 */
#include "phoenix/presence.hpp"

#include <utility>

#include "phoenix/message_codec.hpp"

namespace phoenix {
namespace {
constexpr const char* kMetasKey = "metas";
constexpr const char* kJoinsKey = "joins";
constexpr const char* kLeavesKey = "leaves";

const nlohmann::json& ObjectOrEmpty(const nlohmann::json& payload, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_object()) {
    return kEmpty;
  }
  return *it;
}
}  // namespace

Presence::Presence(State state) : state_(std::move(state)) {}

void Presence::Sync(const Response& response) {
  if (response.Event() == event::kPresenceState) {
    SyncState(response.GetPayload());
  } else if (response.Event() == event::kPresenceDiff) {
    SyncDiff(response.GetPayload());
  } else {
    return;
  }
  if (on_state_change_) {
    on_state_change_(state_);
  }
}

void Presence::ClearCallbacks() {
  on_join_ = nullptr;
  on_leave_ = nullptr;
  on_state_change_ = nullptr;
}

std::optional<std::vector<Presence::Meta>> Presence::MergeMetas(const nlohmann::json& entry) {
  if (!entry.is_object()) {
    return std::nullopt;
  }
  auto metas_it = entry.find(kMetasKey);
  if (metas_it == entry.end() || !metas_it->is_array()) {
    return std::nullopt;
  }
  // 서버는 id 공통 필드를 metas 바깥에 둔다. 각 meta가 자기완결적이 되도록 안으로 옮긴다.
  std::vector<Meta> merged;
  merged.reserve(metas_it->size());
  for (const auto& meta : *metas_it) {
    if (!meta.is_object()) {
      continue;
    }
    Meta record = meta;
    for (const auto& [key, value] : entry.items()) {
      if (key == kMetasKey || record.contains(key)) {
        continue;
      }
      record[key] = value;
    }
    merged.push_back(std::move(record));
  }
  return merged;
}

void Presence::SyncState(const Payload& payload) {
  if (!payload.is_object()) {
    return;
  }
  for (const auto& [id, entry] : payload.items()) {
    auto metas = MergeMetas(entry);
    if (!metas) {
      continue;
    }
    state_[id] = std::move(*metas);
  }
}

void Presence::SyncDiff(const Payload& payload) {
  if (!payload.is_object()) {
    return;
  }
  for (const auto& [id, entry] : ObjectOrEmpty(payload, kLeavesKey).items()) {
    state_.erase(id);
    auto metas = MergeMetas(entry);
    if (!metas || !on_leave_) {
      continue;
    }
    for (const auto& meta : *metas) {
      on_leave_(id, meta);
    }
  }
  // 같은 id가 leaves와 joins에 모두 있으면 joins가 이긴다.
  for (const auto& [id, entry] : ObjectOrEmpty(payload, kJoinsKey).items()) {
    auto metas = MergeMetas(entry);
    if (!metas) {
      continue;
    }
    state_[id] = *metas;
    if (!on_join_) {
      continue;
    }
    for (const auto& meta : *metas) {
      on_join_(id, meta);
    }
  }
}

std::optional<std::vector<Presence::Meta>> Presence::Metas(const std::string& id) const {
  auto it = state_.find(id);
  if (it == state_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Presence::Meta> Presence::FirstMeta(const std::string& id) const {
  auto it = state_.find(id);
  if (it == state_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.front();
}

std::map<std::string, Presence::Meta> Presence::FirstMetas() const {
  std::map<std::string, Meta> result;
  for (const auto& [id, metas] : state_) {
    if (!metas.empty()) {
      result[id] = metas.front();
    }
  }
  return result;
}

}  // namespace phoenix
