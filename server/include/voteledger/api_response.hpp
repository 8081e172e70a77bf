/*
 * 설명: 레저 결과를 HTTP 계층/CLI가 그대로 내보낼 수 있는 JSON 응답 엔벨로프로 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "voteledger/reconciler.hpp"
#include "voteledger/vote_store.hpp"

namespace voteledger {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

nlohmann::json ToJson(const ContestMetrics& metrics);
nlohmann::json ToJson(const RecalculationResult& result);
nlohmann::json ToJson(const Matchup& matchup);

}  // namespace voteledger
