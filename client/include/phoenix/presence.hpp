/*
 * 설명: 토픽별 presence 복제 상태와 presence_state/presence_diff 동기화 알고리즘을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/presence_test.cpp
 */
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "phoenix/response.hpp"

namespace phoenix {

class Presence {
 public:
  using Meta = nlohmann::json;
  using State = std::map<std::string, std::vector<Meta>>;
  using JoinHandler = std::function<void(const std::string& id, const Meta& meta)>;
  using LeaveHandler = std::function<void(const std::string& id, const Meta& meta)>;
  using StateChangeHandler = std::function<void(const State& state)>;

  Presence() = default;
  explicit Presence(State state);

  // presence_state는 id별 전체 교체, presence_diff는 leaves 후 joins 순으로 적용한다.
  void Sync(const Response& response);

  void SetOnJoin(JoinHandler handler) { on_join_ = std::move(handler); }
  void SetOnLeave(LeaveHandler handler) { on_leave_ = std::move(handler); }
  void SetOnStateChange(StateChangeHandler handler) { on_state_change_ = std::move(handler); }
  void ClearCallbacks();

  const State& GetState() const { return state_; }
  std::optional<std::vector<Meta>> Metas(const std::string& id) const;
  std::optional<Meta> FirstMeta(const std::string& id) const;
  std::map<std::string, Meta> FirstMetas() const;

  template <typename T>
  std::optional<T> FirstMetaValue(const std::string& id, const std::string& key) const {
    auto it = state_.find(id);
    if (it == state_.end() || it->second.empty()) {
      return std::nullopt;
    }
    return ExtractValue<T>(it->second.front(), key);
  }

  template <typename T>
  std::vector<T> FirstMetaValues(const std::string& key) const {
    std::vector<T> values;
    for (const auto& [id, metas] : state_) {
      if (metas.empty()) {
        continue;
      }
      if (auto value = ExtractValue<T>(metas.front(), key)) {
        values.push_back(std::move(*value));
      }
    }
    return values;
  }

 private:
  template <typename T>
  static std::optional<T> ExtractValue(const Meta& meta, const std::string& key) {
    auto it = meta.find(key);
    if (it == meta.end()) {
      return std::nullopt;
    }
    try {
      return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
      return std::nullopt;
    }
  }

  static std::optional<std::vector<Meta>> MergeMetas(const nlohmann::json& entry);
  void SyncState(const Payload& payload);
  void SyncDiff(const Payload& payload);

  State state_;
  JoinHandler on_join_;
  LeaveHandler on_leave_;
  StateChangeHandler on_state_change_;
};

}  // namespace phoenix
