/*
 * 설명: 레저 계층 전반에서 사용하는 예외 타입과 오류 코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/vote_store_it_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace voteledger {

namespace error_code {
inline constexpr const char* kValidationFailed = "validation_failed";
inline constexpr const char* kUnknownEntity = "unknown_entity";
inline constexpr const char* kContestNotFound = "contest_not_found";
inline constexpr const char* kIoFailed = "io_failed";
inline constexpr const char* kLedgerCorrupted = "ledger_corrupted";
inline constexpr const char* kInvalidArgument = "invalid_argument";
}  // namespace error_code

class LedgerException : public std::runtime_error {
 public:
  LedgerException(const std::string& message, std::string code)
      : std::runtime_error(message), code(std::move(code)) {}
  std::string code;
};

}  // namespace voteledger
