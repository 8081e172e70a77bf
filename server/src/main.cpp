/*
 * 설명: voteledger-admin 진입점. 환경설정을 로드해 레저 연산 하나를 실행하고 JSON 엔벨로프를 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ledger_flow_test.cpp
 */
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "voteledger/api_response.hpp"
#include "voteledger/app.hpp"
#include "voteledger/ledger_codec.hpp"
#include "voteledger/ledger_error.hpp"

namespace {
void PrintUsage(const char* prog) {
  std::cerr << "사용법: " << prog << " <command> [options]\n"
            << "명령:\n"
            << "  ledger       콘테스트 레저 조회\n"
            << "  metrics      리더보드와 지표 조회\n"
            << "  vote         --winner <id> --loser <id> [--voter <alias>]\n"
            << "  reset        [--initiator <name>] 투표 초기화\n"
            << "  recalculate  [--apply] 감사 로그 재생으로 재계산 (기본 dry-run)\n"
            << "  matchup      [--previous <a,b>] 다음 대결 쌍\n"
            << "공통 옵션:\n"
            << "  --contest <id>  대상 콘테스트 (기본값: 활성 콘테스트)\n";
}
}  // namespace

int main(int argc, char** argv) {
  using namespace voteledger;
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  const std::string command = argv[1];
  std::map<std::string, std::string> values;
  bool apply = false;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--apply") {
      apply = true;
    } else if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
      values[arg.substr(2)] = argv[++i];
    } else {
      std::cerr << "알 수 없는 인자: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }
  const std::string contest = values.count("contest") ? values["contest"] : "";

  try {
    LedgerConfig config = LoadConfigFromEnv();
    auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));
    observability->SetSink(&std::cerr);
    LedgerApp app(config, std::make_shared<Clock>(), observability);
    app.Start();

    nlohmann::json data;
    if (command == "ledger") {
      data = app.GetLedgerAsync(contest).get();
    } else if (command == "metrics") {
      data = ToJson(app.GetMetricsAsync(contest).get());
    } else if (command == "vote") {
      const std::string voter = values.count("voter") ? values["voter"] : "";
      data = app.RecordVoteForAlias(values["winner"], values["loser"], voter, contest).get();
    } else if (command == "reset") {
      std::optional<std::string> initiator;
      if (values.count("initiator")) {
        initiator = values["initiator"];
      }
      data = app.ResetContestVotesAsync(contest, initiator).get();
    } else if (command == "recalculate") {
      data = ToJson(app.RecalculateAsync(contest, !apply).get());
    } else if (command == "matchup") {
      std::optional<Matchup> previous;
      if (values.count("previous")) {
        const std::string& pair = values["previous"];
        const auto comma = pair.find(',');
        if (comma == std::string::npos) {
          throw LedgerException("--previous는 a,b 형식이어야 합니다", error_code::kInvalidArgument);
        }
        previous = Matchup{pair.substr(0, comma), pair.substr(comma + 1)};
      }
      auto matchup = app.NextMatchupAsync(contest, previous).get();
      data = matchup ? ToJson(*matchup) : nlohmann::json(nullptr);
    } else {
      std::cerr << "알 수 없는 명령: " << command << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
    app.Stop();
    std::cout << MakeSuccessEnvelope(data).dump(2) << "\n";
    return 0;
  } catch (const LedgerException& ex) {
    std::cout << MakeErrorEnvelope(ex.code, ex.what()).dump(2) << "\n";
  } catch (const std::exception& ex) {
    std::cout << MakeErrorEnvelope("internal_error", ex.what()).dump(2) << "\n";
  }
  return 1;
}
