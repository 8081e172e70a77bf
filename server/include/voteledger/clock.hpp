/*
 * 설명: 시각 조회와 ISO-8601 변환을 담당한다. 테스트에서는 시계를 교체해 결정적으로 동작시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ledger_codec_test.cpp, server/tests/unit/atomic_writer_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace voteledger {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::int64_t NowMillis() const;
};

// 2024-01-01T00:00:00.000Z 형태로 변환한다.
std::string ToIsoString(std::int64_t epoch_millis);

// Z 또는 +hh:mm 오프셋을 포함한 ISO-8601 문자열을 epoch 밀리초로 변환한다.
std::optional<std::int64_t> ParseIsoTimestamp(const std::string& text);

}  // namespace voteledger
